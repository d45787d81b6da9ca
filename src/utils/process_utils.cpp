/**
 * @file process_utils.cpp
 * @brief Implementation of host-side process spawning
 *
 * Children are started with posix_spawnp() and an explicit argument vector,
 * so no argument is ever interpreted by a shell. All pipe ends are created
 * O_CLOEXEC; the spawn file actions dup2() the child ends onto 0/1/2.
 *
 * @date 2025
 */

#include "warden/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <system_error>

extern char** environ;

namespace warden {
namespace utils {

namespace {

// Writes to a pipe whose reader died must surface as EPIPE, not kill the host.
void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int& fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

struct PipePair {
    int fds[2]{-1, -1};

    ~PipePair() {
        CloseFd(fds[0]);
        CloseFd(fds[1]);
    }

    void Open(const char* what) {
        if (pipe2(fds, O_CLOEXEC) == -1) {
            throw std::system_error(errno, std::generic_category(),
                                    std::string("pipe2 for ") + what);
        }
    }

    int Release(int index) {
        int fd = fds[index];
        fds[index] = -1;
        return fd;
    }
};

class FileActions {
public:
    FileActions() { posix_spawn_file_actions_init(&actions_); }
    ~FileActions() { posix_spawn_file_actions_destroy(&actions_); }

    posix_spawn_file_actions_t* Get() { return &actions_; }

    void Dup2(int fd, int target) {
        Check(posix_spawn_file_actions_adddup2(&actions_, fd, target), "adddup2");
    }

    void Open(int target, const std::string& path) {
        Check(posix_spawn_file_actions_addopen(&actions_, target, path.c_str(), O_RDONLY, 0),
              "addopen");
    }

private:
    static void Check(int ret, const char* what) {
        if (ret != 0) {
            throw std::system_error(ret, std::generic_category(),
                                    std::string("posix_spawn_file_actions_") + what);
        }
    }

    posix_spawn_file_actions_t actions_;
};

// Children start with an empty signal mask and default SIGPIPE/SIGINT/SIGTERM
// whatever the calling thread blocks or ignores.
class SpawnAttributes {
public:
    SpawnAttributes() {
        posix_spawnattr_init(&attr_);
        sigset_t mask;
        sigemptyset(&mask);
        posix_spawnattr_setsigmask(&attr_, &mask);

        sigset_t defaults;
        sigemptyset(&defaults);
        sigaddset(&defaults, SIGPIPE);
        sigaddset(&defaults, SIGINT);
        sigaddset(&defaults, SIGTERM);
        posix_spawnattr_setsigdefault(&attr_, &defaults);

        posix_spawnattr_setflags(&attr_, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);
    }
    ~SpawnAttributes() { posix_spawnattr_destroy(&attr_); }

    const posix_spawnattr_t* Get() const { return &attr_; }

private:
    posix_spawnattr_t attr_;
};

} // anonymous namespace

// ============================================================================
// SPAWN
// ============================================================================

std::unique_ptr<Subprocess> Subprocess::Spawn(const std::vector<std::string>& argv,
                                              const SubprocessOptions& options) {
    IgnoreSigpipeOnce();

    if (argv.empty()) {
        throw std::invalid_argument("Cannot spawn an empty command");
    }

    PipePair in_pipe;
    PipePair out_pipe;
    PipePair err_pipe;
    FileActions actions;

    if (options.pipe_stdin) {
        in_pipe.Open("stdin");
        actions.Dup2(in_pipe.fds[0], STDIN_FILENO);
    } else if (options.stdin_file) {
        actions.Open(STDIN_FILENO, options.stdin_file->string());
    } else {
        actions.Open(STDIN_FILENO, "/dev/null");
    }

    if (options.capture_output) {
        out_pipe.Open("stdout");
        err_pipe.Open("stderr");
        actions.Dup2(out_pipe.fds[1], STDOUT_FILENO);
        actions.Dup2(err_pipe.fds[1], STDERR_FILENO);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = -1;
    SpawnAttributes attributes;
    int ret = posix_spawnp(&pid, args[0], actions.Get(), attributes.Get(), args.data(), environ);
    if (ret != 0) {
        throw std::system_error(ret, std::generic_category(), "posix_spawnp " + argv[0]);
    }

    spdlog::debug("Spawned pid {}: {}", pid, argv[0]);

    std::unique_ptr<Subprocess> proc(new Subprocess());
    proc->pid_ = pid;
    if (options.pipe_stdin) {
        proc->stdin_fd_ = in_pipe.Release(1);
    }
    if (options.capture_output) {
        proc->stdout_fd_ = out_pipe.Release(0);
        proc->stderr_fd_ = err_pipe.Release(0);
    }
    // Child ends close with the PipePair destructors.
    return proc;
}

Subprocess::~Subprocess() {
    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);

    if (pid_ > 0 && !exit_status_) {
        kill(pid_, SIGKILL);
        int status = 0;
        while (waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
        }
    }
}

void Subprocess::CloseStdin() {
    CloseFd(stdin_fd_);
}

// ============================================================================
// WAITING
// ============================================================================

std::optional<int> Subprocess::TryWait() {
    if (exit_status_) {
        return exit_status_;
    }

    int status = 0;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        exit_status_ = DecodeWaitStatus(status);
    } else if (ret == -1 && errno != EINTR) {
        spdlog::warn("waitpid({}) failed: {}", pid_, ErrnoMessage(errno));
        exit_status_ = -1;
    }
    return exit_status_;
}

std::optional<int> Subprocess::WaitUntil(std::chrono::steady_clock::time_point deadline,
                                         const CancellationToken& cancel) {
    constexpr auto kPollInterval = std::chrono::milliseconds(10);

    while (true) {
        if (auto status = TryWait()) {
            return status;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (cancel.WaitFor(std::min(remaining + std::chrono::milliseconds(1), kPollInterval))) {
            return TryWait();
        }
    }
}

int Subprocess::Wait() {
    if (exit_status_) {
        return *exit_status_;
    }

    int status = 0;
    while (true) {
        pid_t ret = waitpid(pid_, &status, 0);
        if (ret == pid_) {
            exit_status_ = DecodeWaitStatus(status);
            break;
        }
        if (ret == -1 && errno != EINTR) {
            spdlog::warn("waitpid({}) failed: {}", pid_, ErrnoMessage(errno));
            exit_status_ = -1;
            break;
        }
    }
    return *exit_status_;
}

void Subprocess::Kill(int signal) {
    if (pid_ > 0 && !exit_status_) {
        kill(pid_, signal);
    }
}

// ============================================================================
// BUFFERED HELPER EXECUTION
// ============================================================================

CommandOutput RunCommand(const std::vector<std::string>& argv,
                         std::optional<std::chrono::milliseconds> timeout,
                         const CancellationToken& cancel,
                         const std::optional<std::filesystem::path>& stdin_file) {
    SubprocessOptions options;
    options.stdin_file = stdin_file;
    auto proc = Subprocess::Spawn(argv, options);

    const auto deadline = timeout
        ? std::chrono::steady_clock::now() + *timeout
        : std::chrono::steady_clock::time_point::max();

    CommandOutput output;
    std::array<pollfd, 2> fds{{{proc->StdoutFd(), POLLIN, 0}, {proc->StderrFd(), POLLIN, 0}}};
    std::array<std::string*, 2> sinks{{&output.stdout_output, &output.stderr_output}};
    std::array<char, 16 * 1024> buffer{};
    int open_streams = 2;

    while (open_streams > 0) {
        if (std::chrono::steady_clock::now() >= deadline || cancel.IsCancelled()) {
            output.timed_out = true;
            proc->Kill(SIGKILL);
            break;
        }

        int ready = poll(fds.data(), fds.size(), 50);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "poll");
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd == -1 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    int status = proc->Wait();
    if (!output.timed_out) {
        output.exit_code = status;
    }
    return output;
}

// ============================================================================
// LOW-LEVEL HELPERS
// ============================================================================

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

bool WriteAll(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        ssize_t n = write(fd, data, size);
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

std::string ErrnoMessage(int err) {
    return std::error_code(err, std::generic_category()).message();
}

} // namespace utils
} // namespace warden
