#pragma once

#include "config.hpp"
#include "process.hpp"
#include "remote.hpp"

#include <filesystem>
#include <string>

namespace ncwire {

// Throws MissingDependency for the first tool not found on PATH
void check_dependencies(CommandRunner& runner, const ToolSet& tools);

// Canonical absolute path of an existing regular file, else SourceMissing
std::filesystem::path resolve_source(const std::string& file);

// Throws ConnectivityFailure when the no-op remote command fails
void check_connection(RemoteShell& remote);

// Throws DestinationUnwritable unless the remote folder exists and is writable
void check_destination(RemoteShell& remote, const std::string& folder);

} // namespace ncwire
