#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ncwire {

using Argv = std::vector<std::string>;

enum class Capture {
    Stdout,
    Combined
};

struct CommandResult {
    int exit_code;
    std::string output;
};

// A child started in the background. Destroying a handle whose child is
// still running terminates the child.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    // Next stdout line without the newline, nullopt on EOF or timeout
    virtual std::optional<std::string> read_line(std::chrono::milliseconds timeout) = 0;

    virtual std::optional<int> try_wait() = 0;
    virtual std::optional<int> wait_for(std::chrono::milliseconds timeout) = 0;

    // SIGTERM, then SIGKILL if the child lingers, then reap
    virtual void terminate() = 0;
};

// Every external program goes through this interface.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // PATH lookup, the equivalent of `command -v`
    virtual bool has_program(const std::string& name) = 0;

    // Run to completion and capture its output
    virtual CommandResult run(const Argv& argv, Capture capture) = 0;

    // Start in the background with stdin on /dev/null and stdout readable
    virtual std::unique_ptr<ProcessHandle> launch(const Argv& argv) = 0;

    // stage[i] stdout feeds stage[i+1] stdin; stderr and the final stdout
    // stay on the terminal. Returns the rightmost non-zero status, or 0.
    virtual int run_pipeline(const std::vector<Argv>& stages) = 0;
};

class PosixCommandRunner : public CommandRunner {
public:
    bool has_program(const std::string& name) override;
    CommandResult run(const Argv& argv, Capture capture) override;
    std::unique_ptr<ProcessHandle> launch(const Argv& argv) override;
    int run_pipeline(const std::vector<Argv>& stages) override;
};

// Printable command line, arguments quoted where the shell would need it
std::string format_command(const Argv& argv);

// waitpid status to shell-style exit code (128 + signal when killed)
int decode_wait_status(int status);

} // namespace ncwire
