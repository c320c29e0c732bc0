#include "signals.hpp"
#include "errors.hpp"

#include <atomic>
#include <csignal>
#include <cstring>

namespace ncwire {

static std::atomic<bool> g_cancelled{false};

static void signal_handler(int signum) {
    (void)signum;
    g_cancelled = true;
}

void install_signal_handlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: blocking reads return EINTR so waits notice cancellation
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

bool cancel_requested() {
    return g_cancelled;
}

void request_cancel() {
    g_cancelled = true;
}

void reset_cancel() {
    g_cancelled = false;
}

void throw_if_cancelled() {
    if (g_cancelled) {
        throw TransferError(ErrorKind::Cancelled, "Interrupted, transfer cancelled");
    }
}

} // namespace ncwire
