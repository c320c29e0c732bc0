#include "preflight.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace ncwire {

void check_dependencies(CommandRunner& runner, const ToolSet& tools) {
    for (const auto& tool : tools.all()) {
        if (!runner.has_program(tool)) {
            throw TransferError(ErrorKind::MissingDependency,
                                tool + " is not installed. Please install it first.");
        }
    }
}

fs::path resolve_source(const std::string& file) {
    std::error_code ec;
    fs::path absolute = fs::absolute(file, ec);
    if (ec) {
        absolute = fs::path(file);
    }
    // weakly_canonical so a dangling path still reports the resolved location
    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        resolved = absolute;
    }

    if (!fs::is_regular_file(resolved, ec)) {
        throw TransferError(ErrorKind::SourceMissing,
                            "File " + resolved.string() + " does not exist.");
    }

    std::ifstream probe(resolved, std::ios::binary);
    if (!probe) {
        throw TransferError(ErrorKind::SourceMissing,
                            "File " + resolved.string() + " is not readable.");
    }
    return resolved;
}

void check_connection(RemoteShell& remote) {
    LOG_INFO("Checking SSH connection to " << remote.target() << "...");
    if (!remote.reachable()) {
        throw TransferError(ErrorKind::ConnectivityFailure,
                            "Cannot connect to " + remote.target());
    }
}

void check_destination(RemoteShell& remote, const std::string& folder) {
    LOG_INFO("Checking destination folder on remote...");
    std::string quoted = shell_quote(folder);
    CommandResult result = remote.run("test -d " + quoted + " && test -w " + quoted);
    if (result.exit_code != 0) {
        throw TransferError(ErrorKind::DestinationUnwritable,
                            "Destination folder \"" + folder +
                            "\" does not exist or is not writable on " + remote.target());
    }
}

} // namespace ncwire
