#include "integrity.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <sstream>

namespace ncwire {

std::string parse_digest(const std::string& hash_output) {
    std::istringstream stream(hash_output);
    std::string digest;
    if (!(stream >> digest)) {
        throw TransferError(ErrorKind::TransferFailure, "Checksum command produced no digest");
    }
    // Marker for an escaped file name, not part of the digest
    if (digest[0] == '\\') {
        digest.erase(0, 1);
    }
    return to_lower(digest);
}

std::string local_digest(CommandRunner& runner, const std::string& hash_binary,
                         const std::filesystem::path& file) {
    LOG_INFO("Computing " << hash_binary << " of \"" << file.string() << "\"");
    CommandResult result = runner.run({hash_binary, file.string()}, Capture::Stdout);
    if (result.exit_code != 0) {
        throw TransferError(ErrorKind::TransferFailure,
                            hash_binary + " failed on " + file.string() +
                            " (exit status " + std::to_string(result.exit_code) + ")");
    }
    std::string digest = parse_digest(result.output);
    LOG_INFO("SRC digest: \"" << digest << "\"");
    return digest;
}

std::string remote_digest(RemoteShell& remote, const std::string& hash_binary,
                          const std::string& remote_path) {
    LOG_INFO("Computing " << hash_binary << " of \"" << remote_path << "\" on " << remote.target());
    CommandResult result = remote.run(shell_quote(hash_binary) + " " + shell_quote(remote_path));
    if (result.exit_code != 0) {
        throw TransferError(ErrorKind::TransferFailure,
                            hash_binary + " failed on " + remote.target() + ":" + remote_path +
                            " (exit status " + std::to_string(result.exit_code) + ")");
    }
    std::string digest = parse_digest(result.output);
    LOG_INFO("DEST digest: \"" << digest << "\"");
    return digest;
}

void verify_digests(const std::string& source_digest, const std::string& destination_digest) {
    if (source_digest != destination_digest) {
        throw TransferError(ErrorKind::IntegrityMismatch,
                            "SHA256 mismatch: \"" + source_digest + "\" != \"" +
                            destination_digest + "\"");
    }
    LOG_INFO("SHA256 match: \"" << source_digest << "\"");
}

} // namespace ncwire
