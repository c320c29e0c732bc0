#pragma once

#include "config.hpp"
#include "dialect.hpp"
#include "process.hpp"
#include "remote.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ncwire {

// Printed by the remote receiver, followed by its pid, right before exec'ing nc
constexpr const char* READY_SENTINEL = "ncwire-ready";

// Remote shell command: announce readiness, then exec nc with output to the file
std::string build_receiver_command(const std::string& nc_binary, NcDialect dialect,
                                   uint16_t port, const std::string& remote_path);

// pv <source> | nc <flags> <host> <port>
std::vector<Argv> build_sender_pipeline(const ToolSet& tools, NcDialect dialect,
                                        const std::filesystem::path& source,
                                        const std::string& host, uint16_t port);

// Remote pid from a readiness line, nullopt for any other line
std::optional<long> parse_ready_line(const std::string& line);

// Owns the background ssh session running the remote receiver. If the
// session is dropped before the receiver exited on its own, the local ssh is
// terminated and the remote nc is killed by pid.
class ReceiverSession {
private:
    RemoteShell& remote_;
    std::unique_ptr<ProcessHandle> handle_;
    std::optional<long> remote_pid_;
    bool finished_ = false;

public:
    ReceiverSession(RemoteShell& remote, std::unique_ptr<ProcessHandle> handle);
    ~ReceiverSession();

    ReceiverSession(const ReceiverSession&) = delete;
    ReceiverSession& operator=(const ReceiverSession&) = delete;

    std::optional<long> remote_pid() const { return remote_pid_; }

    // Blocks until the readiness line arrives; throws TransferFailure if the
    // receiver exits first or the timeout expires
    void wait_ready(std::chrono::milliseconds timeout);

    // Exit status if the receiver already exited
    std::optional<int> exited();

    // Exit status of the receiver; throws TransferFailure on timeout
    int wait_exit(std::chrono::milliseconds timeout);

    void abort();
};

class Rendezvous {
private:
    CommandRunner& runner_;
    RemoteShell& remote_;
    const TransferConfig& config_;

public:
    Rendezvous(CommandRunner& runner, RemoteShell& remote, const TransferConfig& config);

    // Start the remote listener, wait until it is ready and the grace period
    // has passed, then stream the source through the local sender.
    void run(const std::filesystem::path& source, const std::string& host, uint16_t port,
             const std::string& remote_path, NcDialect local_dialect, NcDialect remote_dialect);
};

} // namespace ncwire
