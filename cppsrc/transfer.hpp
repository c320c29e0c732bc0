#pragma once

#include "config.hpp"
#include "process.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ncwire {

struct TransferRequest {
    std::string source;        // as given on the command line
    std::string dest_ip;       // address nc connects to
    uint16_t dest_port = 0;
    std::string ssh_target;    // user@host or an ssh config alias
    std::string dest_folder;
    bool verify = false;
    int verbosity = 0;
};

struct TransferOutcome {
    bool success = false;
    std::string remote_path;
    uint64_t bytes = 0;
    std::optional<std::string> source_digest;
    std::optional<std::string> destination_digest;

    int exit_code() const { return success ? 0 : 1; }
};

// <folder>/<basename of source>, one trailing slash of the folder dropped
std::string remote_destination(const TransferRequest& request);

// Run the whole sequence: local source check, remote preflight, dialect
// probes, optional pre-digest, rendezvous and optional post-digest.
// Every failure is thrown as TransferError.
TransferOutcome execute_transfer(const TransferRequest& request, const TransferConfig& config,
                                 CommandRunner& runner);

} // namespace ncwire
