#include "transfer.hpp"
#include "dialect.hpp"
#include "integrity.hpp"
#include "logging.hpp"
#include "preflight.hpp"
#include "remote.hpp"
#include "rendezvous.hpp"
#include "util.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace ncwire {

std::string remote_destination(const TransferRequest& request) {
    std::string folder = strip_trailing_slash(request.dest_folder);
    std::string name = fs::path(request.source).filename().string();
    if (!folder.empty() && folder.back() == '/') {
        return folder + name;
    }
    return folder + "/" + name;
}

TransferOutcome execute_transfer(const TransferRequest& request, const TransferConfig& config,
                                 CommandRunner& runner) {
    TransferOutcome outcome;
    outcome.remote_path = remote_destination(request);

    fs::path source = resolve_source(request.source);
    outcome.bytes = fs::file_size(source);

    RemoteShell remote(runner, config.tools.ssh, request.ssh_target);
    check_connection(remote);
    check_destination(remote, request.dest_folder);

    NcDialect local_dialect = probe_local(runner, config.tools.nc);
    NcDialect remote_dialect = probe_remote(remote, config.tools.remote_nc);

    if (request.verify) {
        outcome.source_digest = local_digest(runner, config.tools.hash, source);
    }

    LOG_INFO("Transferring \"" << source.string() << "\" (" << format_bytes(outcome.bytes)
             << ") to " << remote.target() << ":\"" << outcome.remote_path << "\"");

    Rendezvous rendezvous(runner, remote, config);
    rendezvous.run(source, request.dest_ip, request.dest_port, outcome.remote_path,
                   local_dialect, remote_dialect);

    if (request.verify) {
        outcome.destination_digest = remote_digest(remote, config.tools.remote_hash, outcome.remote_path);
        verify_digests(*outcome.source_digest, *outcome.destination_digest);
    }

    outcome.success = true;
    return outcome;
}

} // namespace ncwire
