#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nanoflow::utils {

// Ensure directory exists. False if the path exists but is not a directory.
bool ensure_directory(const std::filesystem::path& dir);

// Check if path is a directory
bool is_directory(const std::filesystem::path& path);

// True for a directory with at least one entry
bool is_nonempty_directory(const std::filesystem::path& path);

// Size of a regular file, nullopt if it cannot be read
std::optional<std::uintmax_t> file_size(const std::filesystem::path& path);

// Remove a file or directory tree. Returns the number of entries removed.
// Throws std::filesystem::filesystem_error on failure.
std::uintmax_t remove_path(const std::filesystem::path& path);

// Up to max_lines lines from the start of a text file, without line endings
std::vector<std::string> read_head_lines(const std::filesystem::path& path, size_t max_lines);

// Whole file as a string; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::filesystem::path& path);

} // namespace nanoflow::utils
