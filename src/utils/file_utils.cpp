#include "file_utils.h"
#include <fstream>
#include <sstream>

namespace nanoflow::utils {

bool ensure_directory(const std::filesystem::path& dir) {
    if (dir.empty()) return true;
    if (std::filesystem::exists(dir)) {
        return std::filesystem::is_directory(dir);
    }
    std::filesystem::create_directories(dir);
    return true;
}

bool is_directory(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

bool is_nonempty_directory(const std::filesystem::path& path) {
    if (!nanoflow::utils::is_directory(path)) {
        return false;
    }
    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    return !ec && it != std::filesystem::directory_iterator();
}

std::optional<std::uintmax_t> file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

std::uintmax_t remove_path(const std::filesystem::path& path) {
    if (!std::filesystem::exists(std::filesystem::symlink_status(path))) {
        return 0;
    }
    return std::filesystem::remove_all(path);
}

std::vector<std::string> read_head_lines(const std::filesystem::path& path, size_t max_lines) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    if (!file) {
        return lines;
    }

    std::string line;
    while (lines.size() < max_lines && std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace nanoflow::utils
