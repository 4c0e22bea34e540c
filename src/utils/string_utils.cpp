#include "string_utils.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace nanoflow::utils {

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(),
                                   [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream stream(s);
    std::string part;
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";

    std::ostringstream result;
    result << parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        result << delimiter << parts[i];
    }
    return result.str();
}

std::optional<std::pair<std::string, std::string>> split_key_value(const std::string& s) {
    auto pos = s.find('=');
    if (pos == std::string::npos || pos == 0) {
        return std::nullopt;
    }
    return std::make_pair(trim(s.substr(0, pos)), trim(s.substr(pos + 1)));
}

std::string replace_all(const std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;

    std::string result = s;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }
    return result;
}

std::string tail(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    return s.substr(s.size() - max_bytes);
}

std::string filter_lines(const std::string& text, const std::vector<std::string>& patterns) {
    if (patterns.empty()) return text;

    std::string result;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        size_t next = (end == std::string::npos) ? text.size() : end + 1;
        std::string line = text.substr(pos, next - pos);

        bool noisy = std::any_of(patterns.begin(), patterns.end(),
                                 [&line](const std::string& p) {
                                     return !p.empty() && line.find(p) != std::string::npos;
                                 });
        if (!noisy) {
            result += line;
        }
        pos = next;
    }
    return result;
}

std::string shell_quote(const std::string& arg) {
    if (arg.empty()) return "''";

    bool plain = std::all_of(arg.begin(), arg.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '/' ||
               c == ':' || c == '=' || c == ',' || c == '@' || c == '+';
    });
    if (plain) return arg;

    return "'" + replace_all(arg, "'", "'\\''") + "'";
}

} // namespace nanoflow::utils
