#include "cli.hpp"
#include "errors.hpp"

#include <stdexcept>

namespace ncwire {

static TransferError usage_error(const std::string& reason) {
    return TransferError(ErrorKind::InvalidInvocation, reason);
}

static uint16_t parse_port(const std::string& text) {
    try {
        size_t consumed = 0;
        unsigned long port = std::stoul(text, &consumed);
        if (consumed == text.size() && port >= 1 && port <= 65535) {
            return static_cast<uint16_t>(port);
        }
    } catch (const std::logic_error&) {
    }
    throw usage_error("Invalid port: " + text);
}

void print_help(std::ostream& out, const std::string& program) {
    out << "Copies a file to a remote server using netcat (wire transfer) for speed. "
           "ssh is used for authentication and shell access to the destination.\n\n";
    out << "Usage: " << program << " [-v] -f <file> -i <ip> -p <port> -s <ssh> -d <folder> [-a]\n";
    out << "  -v : verbose mode (-vv also logs every external command)\n";
    out << "  -f <file> : input file\n";
    out << "  -i <ip> : destination ip (recommended to be on the same network as the sender)\n";
    out << "  -p <port> : destination port (firewall for the port must be open on the destination)\n";
    out << "  -s <ssh> : destination ssh (user@ip, short name for ssh config, ...)\n";
    out << "  -d <folder> : destination folder (must exist on the destination and be writable by the ssh user)\n";
    out << "  -a : perform sha256sum comparison (optional, default: false)\n\n";
    out << "Example: " << program
        << " -f /path/to/file -i 192.168.1.1 -p 2020 -s user@192.168.1.1 -d /path/to/destination/folder\n";
    out << "  will create /path/to/destination/folder/file on the destination\n";
}

TransferRequest parse_args(const std::vector<std::string>& args) {
    TransferRequest request;
    std::string port;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--") {
            break;
        }
        if (arg.size() < 2 || arg[0] != '-') {
            break;
        }

        for (size_t j = 1; j < arg.size(); ++j) {
            char opt = arg[j];
            switch (opt) {
                case 'v':
                    request.verbosity++;
                    break;
                case 'a':
                    request.verify = true;
                    break;
                case 'f':
                case 'i':
                case 'p':
                case 's':
                case 'd': {
                    std::string value;
                    if (j + 1 < arg.size()) {
                        value = arg.substr(j + 1);
                    } else if (i + 1 < args.size()) {
                        value = args[++i];
                    } else {
                        throw usage_error(std::string("Option -") + opt + " requires an argument");
                    }

                    if (opt == 'f') request.source = value;
                    else if (opt == 'i') request.dest_ip = value;
                    else if (opt == 'p') port = value;
                    else if (opt == 's') request.ssh_target = value;
                    else request.dest_folder = value;

                    // rest of this word was the value
                    j = arg.size();
                    break;
                }
                default:
                    throw usage_error(std::string("Unknown option: -") + opt);
            }
        }
    }

    if (request.source.empty() || request.dest_ip.empty() || port.empty() ||
        request.ssh_target.empty() || request.dest_folder.empty()) {
        throw usage_error("Missing required option");
    }
    request.dest_port = parse_port(port);

    return request;
}

} // namespace ncwire
