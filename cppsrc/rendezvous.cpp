#include "rendezvous.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "signals.hpp"
#include "util.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace ncwire {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

constexpr auto EXIT_POLL = milliseconds(200);
constexpr auto SLEEP_SLICE = milliseconds(50);

static milliseconds until(Clock::time_point deadline) {
    auto now = Clock::now();
    if (now >= deadline) {
        return milliseconds(0);
    }
    return std::chrono::duration_cast<milliseconds>(deadline - now);
}

static void sleep_until(Clock::time_point deadline) {
    while (Clock::now() < deadline) {
        throw_if_cancelled();
        std::this_thread::sleep_for(std::min(until(deadline), SLEEP_SLICE));
    }
}

std::string build_receiver_command(const std::string& nc_binary, NcDialect dialect,
                                   uint16_t port, const std::string& remote_path) {
    std::string command = std::string("echo ") + READY_SENTINEL + " $$; exec " + shell_quote(nc_binary);
    for (const auto& option : receiver_options(dialect)) {
        command += " " + option;
    }
    command += " " + std::to_string(port) + " > " + shell_quote(remote_path);
    return command;
}

std::vector<Argv> build_sender_pipeline(const ToolSet& tools, NcDialect dialect,
                                        const fs::path& source,
                                        const std::string& host, uint16_t port) {
    Argv sender{tools.nc};
    for (const auto& option : sender_options(dialect)) {
        sender.push_back(option);
    }
    sender.push_back(host);
    sender.push_back(std::to_string(port));

    return {
        {tools.pv, source.string()},
        sender
    };
}

std::optional<long> parse_ready_line(const std::string& line) {
    std::string text = trim(line);
    std::string prefix = std::string(READY_SENTINEL) + " ";
    if (text.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        std::string pid_text = text.substr(prefix.size());
        long pid = std::stol(pid_text, &consumed);
        if (consumed != pid_text.size() || pid <= 0) {
            return std::nullopt;
        }
        return pid;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

ReceiverSession::ReceiverSession(RemoteShell& remote, std::unique_ptr<ProcessHandle> handle)
    : remote_(remote), handle_(std::move(handle)) {}

ReceiverSession::~ReceiverSession() {
    try {
        abort();
    } catch (const std::exception& e) {
        LOG_ERROR("Receiver cleanup on " << remote_.target() << " failed: " << e.what());
    }
}

void ReceiverSession::wait_ready(milliseconds timeout) {
    auto deadline = Clock::now() + timeout;

    while (true) {
        throw_if_cancelled();
        if (Clock::now() >= deadline) {
            throw TransferError(ErrorKind::TransferFailure,
                                "Receiver on " + remote_.target() + " did not report ready within " +
                                std::to_string(timeout.count()) + " ms");
        }

        auto line = handle_->read_line(until(deadline));
        if (line) {
            if (auto pid = parse_ready_line(*line)) {
                remote_pid_ = pid;
                LOG_DEBUG("receiver ready, remote pid " << *pid);
                return;
            }
            LOG_DEBUG("receiver: " << *line);
            continue;
        }

        if (auto status = handle_->wait_for(std::min(until(deadline), EXIT_POLL))) {
            finished_ = true;
            throw TransferError(ErrorKind::TransferFailure,
                                "Receiver on " + remote_.target() +
                                " exited with status " + std::to_string(*status) +
                                " before becoming ready");
        }
    }
}

std::optional<int> ReceiverSession::exited() {
    auto status = handle_->try_wait();
    if (status) {
        finished_ = true;
    }
    return status;
}

int ReceiverSession::wait_exit(milliseconds timeout) {
    auto status = handle_->wait_for(timeout);
    if (!status) {
        throw TransferError(ErrorKind::TransferFailure,
                            "Receiver on " + remote_.target() + " did not exit within " +
                            std::to_string(timeout.count()) + " ms after the sender finished");
    }
    finished_ = true;
    return *status;
}

void ReceiverSession::abort() {
    if (finished_) {
        return;
    }
    finished_ = true;

    // Exited on its own: the pid on the remote side may already be reused
    if (auto status = handle_->try_wait()) {
        LOG_DEBUG("receiver already exited with status " << *status);
        return;
    }

    handle_->terminate();

    if (remote_pid_) {
        LOG_INFO("Stopping receiver (pid " << *remote_pid_ << ") on " << remote_.target());
        CommandResult result = remote_.run("kill " + std::to_string(*remote_pid_) + " 2>/dev/null");
        if (result.exit_code != 0) {
            LOG_DEBUG("remote receiver already gone");
        }
    }
}

Rendezvous::Rendezvous(CommandRunner& runner, RemoteShell& remote, const TransferConfig& config)
    : runner_(runner), remote_(remote), config_(config) {}

void Rendezvous::run(const fs::path& source, const std::string& host, uint16_t port,
                     const std::string& remote_path, NcDialect local_dialect,
                     NcDialect remote_dialect) {
    std::string receiver = build_receiver_command(config_.tools.remote_nc, remote_dialect,
                                                  port, remote_path);

    LOG_INFO("Starting receiver on " << remote_.target() << " (sender starts after "
             << config_.grace_period.count() << " ms at the earliest)");
    auto launched_at = Clock::now();
    ReceiverSession session(remote_, remote_.launch(receiver));

    session.wait_ready(config_.ready_timeout);
    sleep_until(launched_at + config_.grace_period);

    if (auto status = session.exited()) {
        throw TransferError(ErrorKind::TransferFailure,
                            "Receiver on " + remote_.target() + " exited with status " +
                            std::to_string(*status) + " before the sender started");
    }

    LOG_INFO("Starting sender");
    int sender_status = runner_.run_pipeline(
        build_sender_pipeline(config_.tools, local_dialect, source, host, port));
    if (sender_status != 0) {
        throw TransferError(ErrorKind::TransferFailure,
                            "Sender to " + host + ":" + std::to_string(port) +
                            " failed with exit status " + std::to_string(sender_status));
    }

    int receiver_status = session.wait_exit(config_.receiver_timeout);
    if (receiver_status != 0) {
        throw TransferError(ErrorKind::TransferFailure,
                            "Receiver on " + remote_.target() + " exited with status " +
                            std::to_string(receiver_status));
    }
}

} // namespace ncwire
