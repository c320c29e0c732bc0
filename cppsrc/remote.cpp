#include "remote.hpp"

#include <utility>

namespace ncwire {

RemoteShell::RemoteShell(CommandRunner& runner, std::string ssh_binary, std::string target)
    : runner_(runner), ssh_(std::move(ssh_binary)), target_(std::move(target)) {}

Argv RemoteShell::command_argv(const std::string& command) const {
    return {ssh_, target_, command};
}

bool RemoteShell::reachable() {
    CommandResult result = runner_.run({ssh_, "-q", target_, "exit"}, Capture::Stdout);
    return result.exit_code == 0;
}

CommandResult RemoteShell::run(const std::string& command) {
    return runner_.run(command_argv(command), Capture::Stdout);
}

std::unique_ptr<ProcessHandle> RemoteShell::launch(const std::string& command) {
    return runner_.launch(command_argv(command));
}

} // namespace ncwire
