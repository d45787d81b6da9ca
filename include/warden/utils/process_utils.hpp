/**
 * @file process_utils.hpp
 * @brief Host-side process spawning with pipe redirection
 *
 * Every interaction with the container runtime goes through a child process
 * (the runtime's CLI). Subprocess spawns it from an argument vector (never a
 * shell string), exposes the pipe ends so callers can stream I/O concurrently,
 * and guarantees the child is killed and reaped when the object goes away.
 *
 * @date 2025
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "warden/utils/cancellation.hpp"

namespace warden {
namespace utils {

/**
 * @struct SubprocessOptions
 * @brief How the child's standard streams are wired
 */
struct SubprocessOptions {
    bool pipe_stdin{false};                          ///< Give the caller a stdin pipe
    std::optional<std::filesystem::path> stdin_file; ///< Read stdin from a file instead
    bool capture_output{true};                       ///< Pipe stdout/stderr (else inherit)
};

/**
 * @struct CommandOutput
 * @brief Fully buffered result of a short helper command
 */
struct CommandOutput {
    std::optional<int> exit_code;  ///< Exit code, or -signal; empty if killed on timeout
    std::string stdout_output;     ///< Standard output
    std::string stderr_output;     ///< Standard error
    bool timed_out{false};         ///< Deadline or cancellation hit before exit

    bool Success() const { return exit_code && *exit_code == 0 && !timed_out; }
};

/**
 * @class Subprocess
 * @brief A spawned child process and the host ends of its pipes
 *
 * Pipe descriptors stay owned by the Subprocess; reader/writer threads borrow
 * them and must be joined before the object is destroyed. The destructor sends
 * SIGKILL to a child that is still running and always reaps it.
 */
class Subprocess {
public:
    /**
     * @brief Spawn @p argv[0] (searched in PATH) with the given wiring
     * @throws std::system_error if the pipes cannot be created or spawn fails
     */
    static std::unique_ptr<Subprocess> Spawn(const std::vector<std::string>& argv,
                                             const SubprocessOptions& options = {});

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    pid_t Pid() const { return pid_; }

    int StdinFd() const { return stdin_fd_; }
    int StdoutFd() const { return stdout_fd_; }
    int StderrFd() const { return stderr_fd_; }

    /**
     * @brief Close the write end of stdin so the child sees EOF
     */
    void CloseStdin();

    /**
     * @brief Reap the child if it has exited
     * @return Decoded exit status, or empty while it is still running
     */
    std::optional<int> TryWait();

    /**
     * @brief Wait for exit until @p deadline or cancellation
     * @return Decoded exit status, or empty if the wait was cut short
     */
    std::optional<int> WaitUntil(std::chrono::steady_clock::time_point deadline,
                                 const CancellationToken& cancel = {});

    /**
     * @brief Block until the child exits
     */
    int Wait();

    /**
     * @brief Send @p signal to the child if it has not been reaped yet
     */
    void Kill(int signal);

    bool HasExited() const { return exit_status_.has_value(); }

private:
    Subprocess() = default;

    pid_t pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
    std::optional<int> exit_status_;
};

/**
 * @brief Run a helper command to completion, buffering all of its output
 *
 * stdout and stderr are drained concurrently so a chatty child cannot
 * deadlock on a full pipe. On deadline or cancellation the child is killed.
 *
 * @param argv Command and arguments
 * @param timeout Wall-clock limit (empty = unbounded)
 * @param cancel Cancellation signal
 * @param stdin_file Optional file streamed to the child's stdin
 */
CommandOutput RunCommand(const std::vector<std::string>& argv,
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                         const CancellationToken& cancel = {},
                         const std::optional<std::filesystem::path>& stdin_file = std::nullopt);

/**
 * @brief Convert a waitpid() status to an exit code (negative signal when signalled)
 */
int DecodeWaitStatus(int status);

/**
 * @brief Write the whole buffer, retrying on EINTR and short writes
 * @return false if the reader went away (EPIPE) or another error occurred
 */
bool WriteAll(int fd, const char* data, std::size_t size);

/**
 * @brief Describe errno @p err
 */
std::string ErrnoMessage(int err);

} // namespace utils
} // namespace warden
