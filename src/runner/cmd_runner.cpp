/**
 * @file cmd_runner.cpp
 * @brief warden-cmd-runner - helper executed inside every sandbox container
 *
 * Linked statically and copied into the container at provisioning time, so it
 * runs on any image regardless of its libc or installed interpreters.
 *
 * **Modes**:
 * - `--hold`: idle main process of the container. Reaps orphaned zombies and
 *   exits on SIGTERM/SIGINT.
 * - `--cmd-id ID [options] -- CMD...`: launch CMD in its own session with the
 *   requested rlimits, forward its stdout/stderr as frames on our stdout, and
 *   finish with a STATUS frame.
 *
 * **Privileges**:
 * The runner itself is started as root and only the forked command switches
 * to `--uid`. The command therefore cannot open the runner's descriptors
 * through /proc or signal it, and the frame channel stays trustworthy.
 * - `--reap ID`: SIGKILL the process tree and session of the command started
 *   with `--cmd-id ID`.
 *
 * **Status Frame** (JSON):
 * ```
 * {"return_code": 0 | -signal | null, "launch_error": null | "message"}
 * ```
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <nlohmann/json.hpp>

#include "warden/utils/process_utils.hpp"
#include "warden/utils/stream_frames.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;
using warden::utils::ErrnoMessage;
using warden::utils::FrameType;

namespace {

/// How long output is still forwarded after the command itself exited
constexpr auto kDrainGrace = std::chrono::milliseconds(1000);
/// Quiet period after which a lingering writer is no longer waited for
constexpr auto kDrainQuiet = std::chrono::milliseconds(100);

struct LaunchOptions {
    std::string cmd_id;
    bool stdin_devnull{false};
    bool block_process_spawn{false};
    std::optional<uid_t> uid;
    std::optional<long long> max_stack_size;
    std::optional<long long> max_virtual_memory;
    std::string working_dir;
    std::vector<std::string> command;
};

/*******************************************************************************
 * Hold Mode
 ******************************************************************************/

int Hold() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGCHLD);
    if (sigprocmask(SIG_BLOCK, &signals, nullptr) != 0) {
        spdlog::error("sigprocmask: {}", ErrnoMessage(errno));
        return 1;
    }

    spdlog::debug("Holding as pid {}", getpid());
    while (true) {
        int sig = 0;
        if (sigwait(&signals, &sig) != 0) {
            continue;
        }
        if (sig == SIGCHLD) {
            while (waitpid(-1, nullptr, WNOHANG) > 0) {
            }
            continue;
        }
        spdlog::debug("Received signal {}, exiting", sig);
        return 0;
    }
}

/*******************************************************************************
 * Launch Mode
 ******************************************************************************/

// Runs in the forked child: only async-signal-safe calls plus the
// preformatted buffers below until exec.
[[noreturn]] void ExecChild(const LaunchOptions& options, char* const* argv,
                            int out_fd, int err_fd, int status_fd) {
    auto fail = [status_fd](const char* what) {
        int err = errno;
        char message[256];
        const char* reason = strerror(err);
        int len = snprintf(message, sizeof(message), "%s: %s", what, reason);
        if (len > 0) {
            ssize_t ignored = write(status_fd, message, static_cast<std::size_t>(len));
            (void)ignored;
        }
        _exit(127);
    };

    if (setsid() == -1) {
        fail("setsid");
    }

    if (options.stdin_devnull) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull == -1 || dup2(devnull, STDIN_FILENO) == -1) {
            fail("open /dev/null");
        }
        close(devnull);
    }
    if (dup2(out_fd, STDOUT_FILENO) == -1 || dup2(err_fd, STDERR_FILENO) == -1) {
        fail("dup2");
    }

    signal(SIGPIPE, SIG_DFL);
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);

    if (options.uid && geteuid() != *options.uid) {
        const auto gid = static_cast<gid_t>(*options.uid);
        if (setgroups(0, nullptr) != 0) {
            fail("setgroups");
        }
        if (setgid(gid) != 0) {
            fail("setgid");
        }
        if (setuid(*options.uid) != 0) {
            fail("setuid");
        }
    }

    if (options.max_stack_size) {
        rlimit limit{static_cast<rlim_t>(*options.max_stack_size),
                     static_cast<rlim_t>(*options.max_stack_size)};
        if (setrlimit(RLIMIT_STACK, &limit) != 0) {
            fail("setrlimit(RLIMIT_STACK)");
        }
    }
    if (options.max_virtual_memory) {
        rlimit limit{static_cast<rlim_t>(*options.max_virtual_memory),
                     static_cast<rlim_t>(*options.max_virtual_memory)};
        if (setrlimit(RLIMIT_AS, &limit) != 0) {
            fail("setrlimit(RLIMIT_AS)");
        }
    }

    if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
        fail("chdir");
    }

    // Last: the limit counts processes of this user, so it must not stop the
    // steps above.
    if (options.block_process_spawn) {
        rlimit limit{0, 0};
        if (setrlimit(RLIMIT_NPROC, &limit) != 0) {
            fail("setrlimit(RLIMIT_NPROC)");
        }
    }

    execvp(argv[0], argv);
    fail(argv[0]);
}

bool SendStatus(std::optional<int> return_code, const std::optional<std::string>& launch_error) {
    json status;
    status["return_code"] = return_code ? json(*return_code) : json(nullptr);
    status["launch_error"] = launch_error ? json(*launch_error) : json(nullptr);
    std::string payload = status.dump();
    return warden::utils::WriteFrame(STDOUT_FILENO, FrameType::STATUS, payload.data(), payload.size());
}

std::optional<std::string> ReadLaunchError(int status_fd) {
    std::string message;
    char buffer[512];
    while (true) {
        ssize_t n = read(status_fd, buffer, sizeof(buffer));
        if (n > 0) {
            message.append(buffer, static_cast<std::size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }
    if (message.empty()) {
        return std::nullopt;
    }
    return message;
}

int Launch(const LaunchOptions& options) {
    signal(SIGPIPE, SIG_IGN);

    int out_pipe[2];
    int err_pipe[2];
    int status_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        SendStatus(std::nullopt, "pipe2: " + ErrnoMessage(errno));
        return 0;
    }

    std::vector<char*> argv;
    for (const auto& arg : options.command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t child = fork();
    if (child == -1) {
        SendStatus(std::nullopt, "fork: " + ErrnoMessage(errno));
        return 0;
    }
    if (child == 0) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        close(status_pipe[0]);
        ExecChild(options, argv.data(), out_pipe[1], err_pipe[1], status_pipe[1]);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);
    spdlog::debug("Command {} started as pid {}", options.cmd_id, child);

    // EOF on the status pipe means exec succeeded (CLOEXEC) or the child died.
    std::optional<std::string> launch_error = ReadLaunchError(status_pipe[0]);
    close(status_pipe[0]);

    if (launch_error) {
        int status = 0;
        while (waitpid(child, &status, 0) == -1 && errno == EINTR) {
        }
        close(out_pipe[0]);
        close(err_pipe[0]);
        SendStatus(std::nullopt, launch_error);
        return 0;
    }

    std::array<pollfd, 2> fds{{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
    const std::array<FrameType, 2> types{{FrameType::STDOUT, FrameType::STDERR}};
    std::vector<char> buffer(warden::utils::kMaxFramePayload);

    std::optional<int> return_code;
    std::chrono::steady_clock::time_point exited_at;
    bool host_gone = false;
    int open_streams = 2;

    while (open_streams > 0) {
        if (!return_code) {
            int status = 0;
            pid_t ret = waitpid(child, &status, WNOHANG);
            if (ret == child) {
                return_code = warden::utils::DecodeWaitStatus(status);
                exited_at = std::chrono::steady_clock::now();
            }
        } else if (std::chrono::steady_clock::now() - exited_at > kDrainGrace) {
            spdlog::debug("Output still open after command exit, stopping");
            break;
        }

        int timeout_ms = return_code ? static_cast<int>(kDrainQuiet.count()) : 50;
        int ready = poll(fds.data(), fds.size(), timeout_ms);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll: {}", ErrnoMessage(errno));
            break;
        }
        if (ready == 0) {
            if (return_code) {
                break;  // command gone and nothing left to read
            }
            continue;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd == -1 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                if (!warden::utils::WriteFrame(STDOUT_FILENO, types[i], buffer.data(),
                                               static_cast<std::size_t>(n))) {
                    host_gone = true;
                }
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_streams;
            }
        }

        if (host_gone) {
            spdlog::warn("Host stopped reading, killing command {}", options.cmd_id);
            kill(-child, SIGKILL);
            break;
        }
    }

    for (auto& pfd : fds) {
        if (pfd.fd != -1) {
            close(pfd.fd);
        }
    }

    if (!return_code) {
        int status = 0;
        while (waitpid(child, &status, 0) == -1 && errno == EINTR) {
        }
        return_code = warden::utils::DecodeWaitStatus(status);
    }

    if (!host_gone) {
        SendStatus(return_code, std::nullopt);
    }
    return 0;
}

/*******************************************************************************
 * Reap Mode
 ******************************************************************************/

struct ProcInfo {
    pid_t pid{0};
    pid_t ppid{0};
    pid_t session{0};
};

std::map<pid_t, ProcInfo> ListProcesses() {
    std::map<pid_t, ProcInfo> processes;

    DIR* proc = opendir("/proc");
    if (proc == nullptr) {
        spdlog::error("opendir /proc: {}", ErrnoMessage(errno));
        return processes;
    }

    while (dirent* entry = readdir(proc)) {
        char* end = nullptr;
        long pid = strtol(entry->d_name, &end, 10);
        if (*end != '\0' || pid <= 0) {
            continue;
        }

        std::ifstream stat_file("/proc/" + std::string(entry->d_name) + "/stat");
        std::string stat;
        if (!std::getline(stat_file, stat)) {
            continue;
        }
        // "pid (comm) state ppid pgrp session ..."; comm may contain spaces and ')'.
        std::size_t close_paren = stat.rfind(')');
        if (close_paren == std::string::npos) {
            continue;
        }
        std::istringstream fields(stat.substr(close_paren + 1));
        char state = 0;
        ProcInfo info;
        info.pid = static_cast<pid_t>(pid);
        pid_t pgrp = 0;
        if (fields >> state >> info.ppid >> pgrp >> info.session) {
            processes[info.pid] = info;
        }
    }
    closedir(proc);
    return processes;
}

std::vector<std::string> ReadCmdline(pid_t pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
    std::vector<std::string> args;
    std::string arg;
    while (std::getline(in, arg, '\0')) {
        args.push_back(arg);
    }
    return args;
}

std::optional<pid_t> FindLauncher(const std::string& cmd_id,
                                  const std::map<pid_t, ProcInfo>& processes) {
    const pid_t self = getpid();
    for (const auto& [pid, info] : processes) {
        if (pid == self) {
            continue;
        }
        auto args = ReadCmdline(pid);
        for (std::size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == "--") {
                break;
            }
            if (args[i] == "--cmd-id" && args[i + 1] == cmd_id) {
                return pid;
            }
        }
    }
    return std::nullopt;
}

std::set<pid_t> CollectTargets(pid_t launcher, const std::map<pid_t, ProcInfo>& processes) {
    std::set<pid_t> targets;

    // Descendants of the launcher.
    bool grew = true;
    while (grew) {
        grew = false;
        for (const auto& [pid, info] : processes) {
            if (targets.count(pid) != 0) {
                continue;
            }
            if (info.ppid == launcher || targets.count(info.ppid) != 0) {
                targets.insert(pid);
                grew = true;
            }
        }
    }

    // Members of the command's session, including daemonized ones whose
    // parent is no longer in the tree.
    std::set<pid_t> sessions;
    for (pid_t pid : targets) {
        auto it = processes.find(pid);
        if (it != processes.end() && it->second.session == pid) {
            sessions.insert(pid);
        }
    }
    for (const auto& [pid, info] : processes) {
        if (sessions.count(info.session) != 0) {
            targets.insert(pid);
        }
    }

    targets.erase(launcher);
    targets.erase(getpid());
    return targets;
}

int Reap(const std::string& cmd_id) {
    constexpr int kRounds = 5;
    std::size_t killed = 0;

    for (int round = 0; round < kRounds; ++round) {
        auto processes = ListProcesses();
        auto launcher = FindLauncher(cmd_id, processes);
        if (!launcher) {
            if (round == 0) {
                spdlog::info("No command with id {} is running", cmd_id);
            }
            break;
        }

        auto targets = CollectTargets(*launcher, processes);
        if (targets.empty()) {
            break;
        }
        for (pid_t pid : targets) {
            if (kill(pid, SIGKILL) == 0) {
                ++killed;
            } else if (errno != ESRCH) {
                spdlog::warn("kill({}): {}", pid, ErrnoMessage(errno));
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    spdlog::info("Reaped {} process(es) of command {}", killed, cmd_id);
    return 0;
}

} // anonymous namespace

/*******************************************************************************
 * Main Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"warden-cmd-runner: launches and reaps sandboxed commands"};

    bool hold = false;
    std::string reap_id;
    bool verbose = false;
    LaunchOptions options;
    long long max_stack_size = 0;
    long long max_virtual_memory = 0;
    long long uid = 0;

    app.add_flag("--hold", hold, "Act as the container's idle main process");
    app.add_option("--reap", reap_id, "Kill the process tree of the command with this id");
    app.add_option("--cmd-id", options.cmd_id, "Identifier of the command to launch");
    auto* uid_opt = app.add_option("--uid", uid, "User (and group) id the command runs as")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("--stdin-devnull", options.stdin_devnull, "Read stdin from /dev/null");
    app.add_flag("--block-process-spawn", options.block_process_spawn,
                 "Forbid the command from creating processes (RLIMIT_NPROC=0)");
    auto* stack_opt = app.add_option("--max-stack-size", max_stack_size, "RLIMIT_STACK in bytes")
        ->check(CLI::PositiveNumber);
    auto* vmem_opt = app.add_option("--max-virtual-memory", max_virtual_memory, "RLIMIT_AS in bytes")
        ->check(CLI::PositiveNumber);
    app.add_option("--working-dir", options.working_dir, "Directory to run the command in");
    app.add_option("command", options.command, "Command and arguments (after --)");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    CLI11_PARSE(app, argc, argv);

    auto logger = spdlog::stderr_logger_st("warden-cmd-runner");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    if (*uid_opt) {
        options.uid = static_cast<uid_t>(uid);
    }
    if (*stack_opt) {
        options.max_stack_size = max_stack_size;
    }
    if (*vmem_opt) {
        options.max_virtual_memory = max_virtual_memory;
    }

    const int modes = (hold ? 1 : 0) + (reap_id.empty() ? 0 : 1) + (options.cmd_id.empty() ? 0 : 1);
    if (modes != 1) {
        spdlog::error("Exactly one of --hold, --reap or --cmd-id is required");
        return 2;
    }

    try {
        if (hold) {
            return Hold();
        }
        if (!reap_id.empty()) {
            return Reap(reap_id);
        }
        if (options.command.empty()) {
            SendStatus(std::nullopt, std::string("no command given"));
            return 0;
        }
        return Launch(options);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
