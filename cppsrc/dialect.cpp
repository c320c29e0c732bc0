#include "dialect.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace ncwire {

static const char* const MODERN_MARKER = "-N";
static const char* const LEGACY_MARKER = "-q";

const char* to_string(NcDialect dialect) {
    switch (dialect) {
        case NcDialect::ListenModern: return "listen-modern";
        case NcDialect::ListenLegacy: return "listen-legacy";
        case NcDialect::ConnectModern: return "connect-modern";
        case NcDialect::ConnectLegacy: return "connect-legacy";
        case NcDialect::Unknown: return "unknown";
    }
    return "unknown";
}

bool is_modern(NcDialect dialect) {
    return dialect == NcDialect::ListenModern || dialect == NcDialect::ConnectModern;
}

NcDialect classify_help(const std::string& help_text, Side side) {
    if (help_text.find(MODERN_MARKER) != std::string::npos) {
        return side == Side::Sender ? NcDialect::ConnectModern : NcDialect::ListenModern;
    }
    if (help_text.find(LEGACY_MARKER) != std::string::npos) {
        return side == Side::Sender ? NcDialect::ConnectLegacy : NcDialect::ListenLegacy;
    }
    return NcDialect::Unknown;
}

std::vector<std::string> sender_options(NcDialect dialect) {
    if (is_modern(dialect)) {
        return {"-N"};
    }
    return {"-q", "0"};
}

std::vector<std::string> receiver_options(NcDialect dialect) {
    if (is_modern(dialect)) {
        return {"-l"};
    }
    return {"-l", "-p"};
}

static std::string join_options(const std::vector<std::string>& options) {
    std::string joined;
    for (const auto& option : options) {
        if (!joined.empty()) joined += ' ';
        joined += option;
    }
    return joined;
}

static void report(const char* where, NcDialect dialect, const std::vector<std::string>& options) {
    switch (dialect) {
        case NcDialect::ListenModern:
        case NcDialect::ConnectModern:
            LOG_INFO("Auto-detected " << where << " nc supports -N (OpenBSD style)");
            break;
        case NcDialect::ListenLegacy:
        case NcDialect::ConnectLegacy:
            LOG_INFO("Auto-detected " << where << " nc supports -q (Traditional style)");
            break;
        case NcDialect::Unknown:
            LOG_WARN("Could not detect " << where << " nc options, using defaults that might fail to close");
            break;
    }
    LOG_INFO(where << " nc options: " << join_options(options));
}

NcDialect probe_local(CommandRunner& runner, const std::string& nc_binary) {
    LOG_INFO("Detecting local nc capabilities...");
    // Exit status is irrelevant, some builds return 1 after printing help
    CommandResult result = runner.run({nc_binary, "-h"}, Capture::Combined);
    NcDialect dialect = classify_help(result.output, Side::Sender);
    report("local", dialect, sender_options(dialect));
    return dialect;
}

NcDialect probe_remote(RemoteShell& remote, const std::string& nc_binary) {
    LOG_INFO("Probing remote nc capabilities...");
    CommandResult result = remote.run(shell_quote(nc_binary) + " -h 2>&1");
    NcDialect dialect = classify_help(result.output, Side::Receiver);
    report("remote", dialect, receiver_options(dialect));
    return dialect;
}

} // namespace ncwire
