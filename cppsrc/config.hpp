#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace ncwire {

struct ToolSet {
    std::string nc = "nc";
    std::string ssh = "ssh";
    std::string pv = "pv";
    std::string hash = "sha256sum";

    // Names run through ssh on the destination; never checked locally
    std::string remote_nc = "nc";
    std::string remote_hash = "sha256sum";

    // Local tools, in the order they are checked at startup
    std::vector<std::string> all() const { return {pv, nc, ssh, hash}; }
};

struct TransferConfig {
    ToolSet tools;

    // Minimum time between launching the receiver and starting the sender
    std::chrono::milliseconds grace_period{3000};

    // Bound on waiting for the receiver's readiness line
    std::chrono::milliseconds ready_timeout{15000};

    // Bound on waiting for the receiver to exit once the sender is done
    std::chrono::milliseconds receiver_timeout{30000};
};

// Defaults overridden by NCWIRE_* environment variables. Rejected values are
// reported through `warnings` so they can be logged once verbosity is known.
TransferConfig load_config_from_env(std::vector<std::string>& warnings);

} // namespace ncwire
