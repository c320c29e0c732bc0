#pragma once

#include <string>
#include <cstdint>

namespace ncwire {

// Format bytes in human-readable format
std::string format_bytes(uint64_t bytes);

// Single-quote a word for a POSIX shell unless it is made only of safe characters
std::string shell_quote(const std::string& word);

std::string trim(const std::string& text);
std::string to_lower(std::string text);

// Drop one trailing '/', keeping a bare "/" intact
std::string strip_trailing_slash(const std::string& path);

} // namespace ncwire
