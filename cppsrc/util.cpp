#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace ncwire {

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    const uint64_t threshold = 1024;

    if (bytes < threshold) {
        return std::to_string(bytes) + " B";
    }

    double size = static_cast<double>(bytes);
    size_t unit_index = 0;

    while (size >= threshold && unit_index < 4) {
        size /= threshold;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    return oss.str();
}

static bool is_shell_safe(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '/' || c == '.' || c == '_' || c == '-' || c == ':' ||
           c == '@' || c == '=' || c == ',' || c == '+';
}

std::string shell_quote(const std::string& word) {
    if (!word.empty() && std::all_of(word.begin(), word.end(), is_shell_safe)) {
        return word;
    }

    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string strip_trailing_slash(const std::string& path) {
    if (path.size() > 1 && path.back() == '/') {
        return path.substr(0, path.size() - 1);
    }
    return path;
}

} // namespace ncwire
