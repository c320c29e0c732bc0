#pragma once

#include "process.hpp"
#include "remote.hpp"

#include <string>
#include <vector>

namespace ncwire {

// Command-line flavour of an nc build. Modern is OpenBSD netcat (-N closes
// the socket on EOF), legacy is traditional netcat (-q <secs> delays close).
enum class NcDialect {
    ListenModern,
    ListenLegacy,
    ConnectModern,
    ConnectLegacy,
    Unknown
};

enum class Side {
    Sender,
    Receiver
};

const char* to_string(NcDialect dialect);

bool is_modern(NcDialect dialect);

// Classify `nc -h` output. "-N" wins over "-q"; neither yields Unknown.
NcDialect classify_help(const std::string& help_text, Side side);

// Flags preceding host and port on the sending side
std::vector<std::string> sender_options(NcDialect dialect);

// Flags preceding the port on the receiving side
std::vector<std::string> receiver_options(NcDialect dialect);

NcDialect probe_local(CommandRunner& runner, const std::string& nc_binary);
NcDialect probe_remote(RemoteShell& remote, const std::string& nc_binary);

} // namespace ncwire
