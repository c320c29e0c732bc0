#pragma once

#include "process.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// nc -h excerpts
inline const char* const OPENBSD_HELP =
    "OpenBSD netcat (Debian patchlevel 1.219-1)\n"
    "usage: nc [-46CDdFhklNnrStUuvZz] [-I length] [-i interval] [-M ttl]\n"
    "\t-l\t\tListen mode, for inbound connects\n"
    "\t-N\t\tShutdown the network socket after EOF on stdin\n"
    "\t-q secs\t\tquit after EOF on stdin and delay of secs\n";

inline const char* const TRADITIONAL_HELP =
    "[v1.10-47]\n"
    "connect to somewhere:\tnc [-options] hostname port[s] [ports] ...\n"
    "listen for inbound:\tnc -l -p port [-options] [hostname] [port]\n"
    "\t-p port\t\t\tlocal port number\n"
    "\t-q secs\t\t\tquit after EOF on stdin and delay of secs\n";

inline const char* const BARE_HELP =
    "usage: nc [options] host port\n"
    "\t-l\t\tlisten mode\n"
    "\t-w timeout\tconnect timeout\n";

inline std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
}

// Stand-in for sha256sum: FNV-1a 64 in hex
inline std::string fake_digest(const std::string& content) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : content) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << hash;
    return oss.str();
}

inline bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

inline std::string unquote(std::string word) {
    word = ncwire::trim(word);
    if (word.size() >= 2 && word.front() == '\'' && word.back() == '\'') {
        return word.substr(1, word.size() - 2);
    }
    return word;
}

// Scripted ssh/nc/pv/sha256sum. The "remote" host shares the local
// filesystem; the sender pipeline copies the source to the path the
// receiver command redirects into.
class FakeRunner : public ncwire::CommandRunner {
public:
    std::set<std::string> installed{"nc", "ssh", "pv", "sha256sum"};

    // Names the local side answers to; the remote side always uses the plain ones
    std::string local_nc = "nc";
    std::string local_hash = "sha256sum";

    bool reachable = true;
    bool dest_writable = true;
    std::string local_help = OPENBSD_HELP;
    std::string remote_help = OPENBSD_HELP;

    bool receiver_announces = true;
    // Without an announcement: keep running instead of exiting with status 1
    bool receiver_silent = false;
    // Keep running after the data arrived
    bool receiver_hangs = false;
    int receiver_exit = 0;
    int sender_exit = 0;
    bool corrupt_delivery = false;

    std::vector<ncwire::Argv> commands;
    std::vector<ncwire::Argv> launches;
    std::vector<std::vector<ncwire::Argv>> pipelines;
    std::vector<std::string> remote_kills;
    int local_probes = 0;
    int remote_probes = 0;
    int digests = 0;

    fs::path receiver_path;
    bool delivered = false;
    bool receiver_terminated = false;

    bool has_program(const std::string& name) override {
        return installed.count(name) > 0;
    }

    ncwire::CommandResult run(const ncwire::Argv& argv, ncwire::Capture capture) override {
        (void)capture;
        commands.push_back(argv);

        if (argv[0] == "ssh") {
            if (argv.size() == 4 && argv[1] == "-q" && argv[3] == "exit") {
                return {reachable ? 0 : 255, ""};
            }
            if (!reachable) {
                return {255, ""};
            }
            const std::string& command = argv[2];
            if (starts_with(command, "test -d ")) {
                return {dest_writable ? 0 : 1, ""};
            }
            if (starts_with(command, "nc -h")) {
                ++remote_probes;
                return {0, remote_help};
            }
            if (starts_with(command, "sha256sum ")) {
                return digest_of(unquote(command.substr(10)));
            }
            if (starts_with(command, "kill ")) {
                remote_kills.push_back(command);
                return {0, ""};
            }
            return {127, ""};
        }

        if (argv[0] == local_nc && argv.size() == 2 && argv[1] == "-h") {
            ++local_probes;
            return {1, local_help};
        }
        if (argv[0] == local_hash && argv.size() == 2) {
            return digest_of(argv[1]);
        }
        return {127, ""};
    }

    std::unique_ptr<ncwire::ProcessHandle> launch(const ncwire::Argv& argv) override {
        launches.push_back(argv);
        delivered = false;
        receiver_terminated = false;
        const std::string& command = argv.back();
        auto redirect = command.rfind("> ");
        receiver_path = unquote(command.substr(redirect + 2));
        return std::make_unique<Handle>(*this);
    }

    int run_pipeline(const std::vector<ncwire::Argv>& stages) override {
        pipelines.push_back(stages);
        if (sender_exit != 0) {
            return sender_exit;
        }

        std::string content = read_file(stages.front().back());
        if (corrupt_delivery) {
            if (content.empty()) {
                content.push_back('\x01');
            } else {
                content[content.size() / 2] ^= 0x5a;
            }
        }
        write_file(receiver_path, content);
        delivered = true;
        return 0;
    }

    const ncwire::Argv& sender() const { return pipelines.back().back(); }
    const std::string& receiver_command() const { return launches.back().back(); }

private:
    ncwire::CommandResult digest_of(const std::string& path) {
        ++digests;
        if (!fs::exists(path)) {
            return {1, ""};
        }
        return {0, fake_digest(read_file(path)) + "  " + path + "\n"};
    }

    class Handle : public ncwire::ProcessHandle {
    private:
        FakeRunner& runner_;
        std::deque<std::string> lines_;

    public:
        explicit Handle(FakeRunner& runner) : runner_(runner) {
            if (runner_.receiver_announces) {
                lines_.push_back("ncwire-ready 4242");
            }
        }

        std::optional<std::string> read_line(std::chrono::milliseconds) override {
            if (lines_.empty()) return std::nullopt;
            std::string line = lines_.front();
            lines_.pop_front();
            return line;
        }

        std::optional<int> try_wait() override {
            if (!runner_.receiver_announces) {
                if (runner_.receiver_silent) return std::nullopt;
                return 1;
            }
            if (runner_.delivered && !runner_.receiver_hangs) return runner_.receiver_exit;
            return std::nullopt;
        }

        std::optional<int> wait_for(std::chrono::milliseconds timeout) override {
            auto status = try_wait();
            if (!status) {
                std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(5)));
            }
            return status;
        }

        void terminate() override {
            runner_.receiver_terminated = true;
        }
    };
};
