#include "process.hpp"
#include "logging.hpp"
#include "signals.hpp"
#include "util.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ncwire {

using Clock = std::chrono::steady_clock;

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(50);
constexpr auto KILL_GRACE = std::chrono::milliseconds(2000);

static std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

static std::vector<char*> make_exec_args(const Argv& argv) {
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
    return args;
}

// Runs in the forked child; args are built before fork
[[noreturn]] static void exec_child(std::vector<char*>& args) {
    ::execvp(args[0], args.data());

    std::string msg = std::string("nc_wire: cannot execute ") + args[0] + ": " +
                      std::strerror(errno) + "\n";
    ssize_t written = ::write(STDERR_FILENO, msg.data(), msg.size());
    (void)written;
    ::_exit(127);
}

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

static void make_pipe(int fds[2]) {
    if (::pipe(fds) != 0) {
        throw std::runtime_error(errno_message("pipe failed"));
    }
}

static int reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return decode_wait_status(status);
}

static std::optional<int> try_reap(pid_t pid) {
    int status = 0;
    pid_t result = ::waitpid(pid, &status, WNOHANG);
    if (result == 0) {
        return std::nullopt;
    }
    if (result < 0) {
        if (errno == EINTR) {
            return std::nullopt;
        }
        return -1;
    }
    return decode_wait_status(status);
}

static int kill_and_reap(pid_t pid) {
    ::kill(pid, SIGTERM);

    auto deadline = Clock::now() + KILL_GRACE;
    while (Clock::now() < deadline) {
        if (auto status = try_reap(pid)) {
            return *status;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    ::kill(pid, SIGKILL);
    return reap(pid);
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string format_command(const Argv& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) line += ' ';
        line += shell_quote(arg);
    }
    return line;
}

class PosixProcessHandle : public ProcessHandle {
private:
    pid_t pid_;
    int out_fd_;
    std::string buffer_;
    std::optional<int> exit_status_;

public:
    PosixProcessHandle(pid_t pid, int out_fd) : pid_(pid), out_fd_(out_fd) {}

    ~PosixProcessHandle() override {
        terminate();
        close_fd(out_fd_);
    }

    std::optional<std::string> read_line(std::chrono::milliseconds timeout) override {
        auto deadline = Clock::now() + timeout;

        while (true) {
            auto newline = buffer_.find('\n');
            if (newline != std::string::npos) {
                std::string line = buffer_.substr(0, newline);
                buffer_.erase(0, newline + 1);
                return line;
            }
            if (out_fd_ < 0) {
                return std::nullopt;
            }

            throw_if_cancelled();

            auto now = Clock::now();
            if (now >= deadline) {
                return std::nullopt;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            int wait_ms = static_cast<int>(std::min(remaining, POLL_INTERVAL).count());

            pollfd pfd{};
            pfd.fd = out_fd_;
            pfd.events = POLLIN;
            int ready = ::poll(&pfd, 1, wait_ms);
            if (ready < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error(errno_message("poll failed"));
            }
            if (ready == 0) {
                continue;
            }

            char chunk[512];
            ssize_t n = ::read(out_fd_, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error(errno_message("read failed"));
            }
            if (n == 0) {
                close_fd(out_fd_);
                if (!buffer_.empty()) {
                    std::string line;
                    line.swap(buffer_);
                    return line;
                }
                return std::nullopt;
            }
            buffer_.append(chunk, static_cast<size_t>(n));
        }
    }

    std::optional<int> try_wait() override {
        if (!exit_status_) {
            exit_status_ = try_reap(pid_);
        }
        return exit_status_;
    }

    std::optional<int> wait_for(std::chrono::milliseconds timeout) override {
        auto deadline = Clock::now() + timeout;
        while (true) {
            if (auto status = try_wait()) {
                return status;
            }
            throw_if_cancelled();
            if (Clock::now() >= deadline) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(POLL_INTERVAL);
        }
    }

    void terminate() override {
        if (exit_status_) {
            return;
        }
        exit_status_ = kill_and_reap(pid_);
        LOG_DEBUG("terminated pid " << pid_ << " (status " << *exit_status_ << ")");
    }
};

bool PosixCommandRunner::has_program(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    std::stringstream path(path_env ? path_env : "/usr/bin:/bin");
    std::string dir;
    while (std::getline(path, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

CommandResult PosixCommandRunner::run(const Argv& argv, Capture capture) {
    if (argv.empty()) {
        throw std::invalid_argument("empty command");
    }
    LOG_DEBUG("exec: " << format_command(argv));

    auto args = make_exec_args(argv);
    int out[2];
    make_pipe(out);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(out[0]);
        ::close(out[1]);
        throw std::runtime_error(errno_message("fork failed"));
    }
    if (pid == 0) {
        ::dup2(out[1], STDOUT_FILENO);
        if (capture == Capture::Combined) {
            ::dup2(out[1], STDERR_FILENO);
        }
        ::close(out[0]);
        ::close(out[1]);
        exec_child(args);
    }

    ::close(out[1]);

    CommandResult result{0, ""};
    char chunk[4096];
    while (true) {
        ssize_t n = ::read(out[0], chunk, sizeof(chunk));
        if (n > 0) {
            result.output.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            break;
        }
        if (errno == EINTR) {
            if (cancel_requested()) {
                ::close(out[0]);
                kill_and_reap(pid);
                throw_if_cancelled();
            }
            continue;
        }
        std::string error = errno_message("read failed");
        ::close(out[0]);
        kill_and_reap(pid);
        throw std::runtime_error(error);
    }

    ::close(out[0]);
    result.exit_code = reap(pid);
    LOG_DEBUG("exit status " << result.exit_code << ": " << argv[0]);
    return result;
}

std::unique_ptr<ProcessHandle> PosixCommandRunner::launch(const Argv& argv) {
    if (argv.empty()) {
        throw std::invalid_argument("empty command");
    }
    LOG_DEBUG("launch: " << format_command(argv));

    auto args = make_exec_args(argv);
    int out[2];
    make_pipe(out);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(out[0]);
        ::close(out[1]);
        throw std::runtime_error(errno_message("fork failed"));
    }
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out[1], STDOUT_FILENO);
        ::close(out[0]);
        ::close(out[1]);
        exec_child(args);
    }

    ::close(out[1]);
    return std::make_unique<PosixProcessHandle>(pid, out[0]);
}

int PosixCommandRunner::run_pipeline(const std::vector<Argv>& stages) {
    if (stages.empty()) {
        throw std::invalid_argument("empty pipeline");
    }

    std::vector<std::vector<char*>> args;
    std::string line;
    for (const auto& stage : stages) {
        if (stage.empty()) {
            throw std::invalid_argument("empty pipeline stage");
        }
        args.push_back(make_exec_args(stage));
        if (!line.empty()) line += " | ";
        line += format_command(stage);
    }
    LOG_DEBUG("exec: " << line);

    std::vector<pid_t> pids;
    int prev_read = -1;

    auto abandon = [&pids, &prev_read]() {
        close_fd(prev_read);
        for (pid_t pid : pids) {
            kill_and_reap(pid);
        }
    };

    for (size_t i = 0; i < stages.size(); ++i) {
        bool last = (i + 1 == stages.size());
        int fds[2] = {-1, -1};
        if (!last) {
            try {
                make_pipe(fds);
            } catch (const std::runtime_error&) {
                abandon();
                throw;
            }
        }

        pid_t pid = ::fork();
        if (pid < 0) {
            std::string error = errno_message("fork failed");
            close_fd(fds[0]);
            close_fd(fds[1]);
            abandon();
            throw std::runtime_error(error);
        }
        if (pid == 0) {
            if (prev_read >= 0) {
                ::dup2(prev_read, STDIN_FILENO);
                ::close(prev_read);
            }
            if (!last) {
                ::dup2(fds[1], STDOUT_FILENO);
                ::close(fds[0]);
                ::close(fds[1]);
            }
            exec_child(args[i]);
        }

        pids.push_back(pid);
        close_fd(prev_read);
        if (!last) {
            ::close(fds[1]);
            prev_read = fds[0];
        }
    }

    std::vector<std::optional<int>> statuses(pids.size());
    size_t running = pids.size();
    while (running > 0) {
        if (cancel_requested()) {
            for (size_t i = 0; i < pids.size(); ++i) {
                if (!statuses[i]) {
                    statuses[i] = kill_and_reap(pids[i]);
                }
            }
            throw_if_cancelled();
        }

        for (size_t i = 0; i < pids.size(); ++i) {
            if (statuses[i]) continue;
            if (auto status = try_reap(pids[i])) {
                statuses[i] = status;
                --running;
                LOG_DEBUG("exit status " << *status << ": " << stages[i][0]);
            }
        }
        if (running > 0) {
            std::this_thread::sleep_for(POLL_INTERVAL);
        }
    }

    int exit_code = 0;
    for (const auto& status : statuses) {
        if (*status != 0) {
            exit_code = *status;
        }
    }
    return exit_code;
}

} // namespace ncwire
