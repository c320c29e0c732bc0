#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace ncwire {

static void read_string(const char* name, std::string& value) {
    const char* v = std::getenv(name);
    if (v && *v) {
        value = v;
    }
}

static void read_millis(const char* name, std::chrono::milliseconds& value,
                        std::vector<std::string>& warnings) {
    const char* v = std::getenv(name);
    if (!v || !*v) {
        return;
    }
    try {
        long long ms = std::stoll(v);
        if (ms < 0) {
            warnings.push_back(std::string("ignoring negative ") + name + "=" + v);
            return;
        }
        value = std::chrono::milliseconds(ms);
    } catch (const std::logic_error&) {
        warnings.push_back(std::string("ignoring unparsable ") + name + "=" + v);
    }
}

TransferConfig load_config_from_env(std::vector<std::string>& warnings) {
    TransferConfig config;

    read_string("NCWIRE_NC", config.tools.nc);
    read_string("NCWIRE_SSH", config.tools.ssh);
    read_string("NCWIRE_PV", config.tools.pv);
    read_string("NCWIRE_HASH", config.tools.hash);
    read_string("NCWIRE_REMOTE_NC", config.tools.remote_nc);
    read_string("NCWIRE_REMOTE_HASH", config.tools.remote_hash);

    read_millis("NCWIRE_GRACE_MS", config.grace_period, warnings);
    read_millis("NCWIRE_READY_TIMEOUT_MS", config.ready_timeout, warnings);
    read_millis("NCWIRE_RECEIVER_TIMEOUT_MS", config.receiver_timeout, warnings);

    return config;
}

} // namespace ncwire
