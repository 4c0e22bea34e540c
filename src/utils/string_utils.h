#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace nanoflow::utils {

// Trim whitespace from both ends
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Split "key=value"; nullopt if there is no '=' or the key is empty
std::optional<std::pair<std::string, std::string>> split_key_value(const std::string& s);

// Replace all occurrences of 'from' with 'to'
std::string replace_all(const std::string& s, const std::string& from, const std::string& to);

// Last max_bytes bytes of s
std::string tail(const std::string& s, size_t max_bytes);

// Drop lines containing any of the patterns
std::string filter_lines(const std::string& text, const std::vector<std::string>& patterns);

// Quote an argument for display in a shell-like command line
std::string shell_quote(const std::string& arg);

} // namespace nanoflow::utils
