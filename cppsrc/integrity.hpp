#pragma once

#include "process.hpp"
#include "remote.hpp"

#include <filesystem>
#include <string>

namespace ncwire {

// First whitespace-delimited token of `sha256sum` output, lowercased.
// Throws TransferFailure when the output carries no digest.
std::string parse_digest(const std::string& hash_output);

std::string local_digest(CommandRunner& runner, const std::string& hash_binary,
                         const std::filesystem::path& file);

std::string remote_digest(RemoteShell& remote, const std::string& hash_binary,
                          const std::string& remote_path);

// Throws IntegrityMismatch naming both digests when they differ
void verify_digests(const std::string& source_digest, const std::string& destination_digest);

} // namespace ncwire
