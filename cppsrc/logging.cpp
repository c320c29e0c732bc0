#include "logging.hpp"

#include <atomic>

namespace ncwire {

static std::atomic<int> g_verbosity{LOG_LEVEL_NONE};

void set_verbosity(int level) {
    if (level < LOG_LEVEL_NONE) level = LOG_LEVEL_NONE;
    if (level > LOG_LEVEL_DEBUG) level = LOG_LEVEL_DEBUG;
    g_verbosity = level;
}

int get_verbosity() {
    return g_verbosity;
}

} // namespace ncwire
