#pragma once

#include "transfer.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace ncwire {

// getopts-style parsing of "-v -f <file> -i <ip> -p <port> -s <ssh> -d <folder> -a".
// Throws TransferError(InvalidInvocation) on a missing, malformed or unknown flag.
TransferRequest parse_args(const std::vector<std::string>& args);

void print_help(std::ostream& out, const std::string& program);

} // namespace ncwire
