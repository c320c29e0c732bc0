#pragma once

#include "process.hpp"

#include <memory>
#include <string>

namespace ncwire {

// Runs shell commands on a remote host through ssh.
class RemoteShell {
private:
    CommandRunner& runner_;
    std::string ssh_;
    std::string target_;

    Argv command_argv(const std::string& command) const;

public:
    RemoteShell(CommandRunner& runner, std::string ssh_binary, std::string target);

    const std::string& target() const { return target_; }

    // `ssh -q <target> exit`, proves reachability and authentication
    bool reachable();

    CommandResult run(const std::string& command);
    std::unique_ptr<ProcessHandle> launch(const std::string& command);
};

} // namespace ncwire
