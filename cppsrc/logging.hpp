#pragma once

#include <iostream>

namespace ncwire {

// Verbosity levels
constexpr int LOG_LEVEL_NONE = 0;
constexpr int LOG_LEVEL_INFO = 1;
constexpr int LOG_LEVEL_DEBUG = 2;

// Set global verbosity level
void set_verbosity(int level);

// Get current verbosity level
int get_verbosity();

} // namespace ncwire

// Debug logging macro, takes a stream expression
#define DEBUG_LOG(level, expr) do { \
    if (::ncwire::get_verbosity() >= (level)) { \
        std::cerr << "nc_wire: " << expr << std::endl; \
    } \
} while (0)

// Convenience macros
#define LOG_INFO(expr) DEBUG_LOG(::ncwire::LOG_LEVEL_INFO, expr)
#define LOG_DEBUG(expr) DEBUG_LOG(::ncwire::LOG_LEVEL_DEBUG, expr)
#define LOG_WARN(expr) DEBUG_LOG(::ncwire::LOG_LEVEL_INFO, "Warning: " << expr)

// Error output (always shown)
#define LOG_ERROR(expr) do { \
    std::cerr << "Error: " << expr << std::endl; \
} while (0)
