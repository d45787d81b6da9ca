/**
 * @file command_executor.cpp
 * @brief Implementation of command execution inside a container
 *
 * **Streams**:
 * The runtime client's stdout carries the runner's framed stream (command
 * stdout, command stderr, final status); its stderr carries the runner's own
 * diagnostics. Three tasks run alongside the command:
 * - feeder: writes stdin bytes or a stdin file, then closes the pipe
 * - drain: decodes frames into two SpillBuffers
 * - diagnostics: collects runner stderr for debug logging
 *
 * Draining starts before the wait so a command producing unbounded output
 * never blocks on a full pipe and never grows host memory past the spill
 * threshold.
 *
 * **Deadlines**:
 * ```
 * start ---- timeout ----> reap process tree (runner --reap, as root)
 *       ---- max(2 x timeout, min_fallback_timeout) ----> kill runtime client
 * ```
 *
 * @date 2025
 */

#include "warden/core/command_executor.hpp"

#include "warden/core/errors.hpp"
#include "warden/utils/process_utils.hpp"
#include "warden/utils/stream_frames.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <fstream>
#include <future>

namespace warden {
namespace core {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr std::size_t kMaxDiagnostics = 64 * 1024;
constexpr auto kReapTimeout = std::chrono::seconds(10);

/**
 * @struct RunnerStatus
 * @brief Contents of the runner's final status frame
 */
struct RunnerStatus {
    bool received{false};
    std::optional<int> return_code;
    std::optional<std::string> launch_error;
};

struct DrainOutcome {
    RunnerStatus status;
    std::string protocol_error;
};

ssize_t ReadSome(int fd, char* buffer, std::size_t size) {
    while (true) {
        ssize_t n = read(fd, buffer, size);
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return n;
    }
}

RunnerStatus ParseStatus(const char* data, std::size_t size) {
    json j = json::parse(data, data + size);

    RunnerStatus status;
    status.received = true;
    if (j.contains("return_code") && j["return_code"].is_number_integer()) {
        status.return_code = j["return_code"].get<int>();
    }
    if (j.contains("launch_error") && j["launch_error"].is_string()) {
        status.launch_error = j["launch_error"].get<std::string>();
    }
    return status;
}

// ============================================================================
// STREAM TASKS
// ============================================================================

void FeedStdin(utils::Subprocess& proc, const CommandSpec& spec) {
    const int fd = proc.StdinFd();
    bool complete = true;

    if (spec.stdin_bytes) {
        complete = utils::WriteAll(fd, spec.stdin_bytes->data(), spec.stdin_bytes->size());
    } else if (spec.stdin_file) {
        std::ifstream in(*spec.stdin_file, std::ios::binary);
        std::vector<char> buffer(kReadChunk);
        while (complete && in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = static_cast<std::size_t>(in.gcount());
            if (got > 0) {
                complete = utils::WriteAll(fd, buffer.data(), got);
            }
        }
    }

    if (!complete) {
        spdlog::debug("Command stopped reading stdin before EOF");
    }
    proc.CloseStdin();
}

DrainOutcome DrainFrames(int fd, utils::SpillBuffer& out, utils::SpillBuffer& err) {
    DrainOutcome outcome;

    utils::FrameDecoder decoder([&](utils::FrameType type, const char* data, std::size_t size) {
        switch (type) {
            case utils::FrameType::STDOUT:
                out.Append(data, size);
                break;
            case utils::FrameType::STDERR:
                err.Append(data, size);
                break;
            case utils::FrameType::STATUS:
                outcome.status = ParseStatus(data, size);
                break;
        }
    });

    std::vector<char> buffer(kReadChunk);
    while (true) {
        ssize_t n = ReadSome(fd, buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        if (n < 0) {
            outcome.protocol_error = "read failed: " + utils::ErrnoMessage(errno);
            break;
        }
        if (!outcome.protocol_error.empty()) {
            continue;  // keep the pipe drained
        }
        try {
            decoder.Feed(buffer.data(), static_cast<std::size_t>(n));
        } catch (const std::exception& e) {
            outcome.protocol_error = e.what();
        }
    }

    if (outcome.protocol_error.empty() && !decoder.AtFrameBoundary()) {
        outcome.protocol_error = "stream ended inside a frame";
    }
    return outcome;
}

std::string DrainDiagnostics(int fd) {
    std::string collected;
    std::vector<char> buffer(4096);
    while (true) {
        ssize_t n = ReadSome(fd, buffer.data(), buffer.size());
        if (n <= 0) {
            break;
        }
        if (collected.size() < kMaxDiagnostics) {
            collected.append(buffer.data(),
                             std::min(static_cast<std::size_t>(n), kMaxDiagnostics - collected.size()));
        }
    }
    return collected;
}

void LogDiagnostics(const std::string& container, const std::string& text) {
    for (const auto& line : utils::StringUtils::Split(text, '\n')) {
        spdlog::debug("[{} runner] {}", container, line);
    }
}

std::optional<std::string> DecodeStream(const char* name,
                                        const utils::SpillBuffer& buffer,
                                        const DecodePolicy& policy) {
    try {
        return utils::StringUtils::Decode(buffer.ReadAll(), policy.encoding, policy.errors);
    } catch (const utils::DecodeError& e) {
        throw DecodeFailed(name, e.Offset(), e.what());
    }
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION / VALIDATION
// ============================================================================

CommandExecutor::CommandExecutor(ContainerHandle& handle)
    : handle_(handle) {}

void CommandExecutor::Validate(const CommandSpec& spec) const {
    if (spec.argv.empty()) {
        throw LaunchFailed("Cannot run an empty command");
    }
    if (spec.stdin_bytes && spec.stdin_file) {
        throw LaunchFailed("Both stdin bytes and a stdin file were given");
    }
    if (spec.stdin_file) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(*spec.stdin_file, ec)) {
            throw LaunchFailed("Stdin file not found: " + spec.stdin_file->string());
        }
        std::ifstream readable(*spec.stdin_file, std::ios::binary);
        if (!readable) {
            throw LaunchFailed("Stdin file not readable: " + spec.stdin_file->string());
        }
    }
    if (spec.decode) {
        try {
            utils::StringUtils::CanonicalEncoding(spec.decode->encoding);
        } catch (const std::invalid_argument& e) {
            throw LaunchFailed(e.what());
        }
    }
    if (spec.timeout && spec.timeout->count() <= 0) {
        throw LaunchFailed("Timeout must be positive");
    }
}

std::vector<std::string> CommandExecutor::BuildRunnerArgs(const CommandSpec& spec,
                                                          const std::string& cmd_id) const {
    const auto& settings = handle_.Settings();

    std::vector<std::string> args = {settings.container_runner_path, "--cmd-id", cmd_id};
    if (!spec.as_root) {
        args.insert(args.end(), {"--uid", std::to_string(handle_.Uid())});
    }
    if (!spec.stdin_bytes && !spec.stdin_file) {
        args.push_back("--stdin-devnull");
    }
    if (spec.block_process_spawn.value_or(handle_.Limits().block_process_spawn)) {
        args.push_back("--block-process-spawn");
    }
    if (spec.max_stack_size) {
        args.insert(args.end(), {"--max-stack-size", std::to_string(*spec.max_stack_size)});
    }
    if (spec.max_virtual_memory) {
        args.insert(args.end(), {"--max-virtual-memory", std::to_string(*spec.max_virtual_memory)});
    }
    args.insert(args.end(), {"--working-dir", spec.working_dir.value_or(settings.working_dir)});
    args.push_back("--");
    args.insert(args.end(), spec.argv.begin(), spec.argv.end());
    return args;
}

// ============================================================================
// EXECUTION
// ============================================================================

CommandResult CommandExecutor::Run(const CommandSpec& spec, const utils::CancellationToken& cancel) {
    Validate(spec);

    ContainerHandle::Use use = handle_.BeginUse();

    const std::string cmd_id = utils::StringUtils::RandomHex(16);
    const bool has_stdin = spec.stdin_bytes || spec.stdin_file;

    runtime::ExecRequest request;
    request.argv = BuildRunnerArgs(spec, cmd_id);
    // The runner stays root; only the forked command drops to the leased uid.
    request.user = 0;
    request.env = spec.env;
    if (!spec.as_root) {
        request.env.emplace("HOME", handle_.Settings().home_dir);
    }
    request.pipe_stdin = has_stdin;

    spdlog::info("Running in {} [{}]: {}", handle_.Name(), cmd_id,
                 utils::StringUtils::Join(spec.argv, " "));

    auto stdout_buffer = std::make_shared<utils::SpillBuffer>(spec.truncate_stdout);
    auto stderr_buffer = std::make_shared<utils::SpillBuffer>(spec.truncate_stderr);

    const auto start = std::chrono::steady_clock::now();

    std::unique_ptr<utils::Subprocess> proc;
    try {
        proc = handle_.Runtime().Exec(handle_.Name(), request);
    } catch (const std::exception& e) {
        throw LaunchFailed(std::string("Could not start runtime client: ") + e.what());
    }

    std::future<void> feeder;
    if (has_stdin) {
        feeder = std::async(std::launch::async, FeedStdin, std::ref(*proc), std::cref(spec));
    }
    auto drain = std::async(std::launch::async, DrainFrames, proc->StdoutFd(),
                            std::ref(*stdout_buffer), std::ref(*stderr_buffer));
    auto diagnostics = std::async(std::launch::async, DrainDiagnostics, proc->StderrFd());

    // Nothing between here and the joins below may throw: the tasks borrow
    // proc's descriptors.
    const auto deadline = spec.timeout ? start + *spec.timeout
                                       : std::chrono::steady_clock::time_point::max();

    bool timed_out = false;
    bool cancelled = false;
    bool client_killed = false;

    std::optional<int> client_status = proc->WaitUntil(deadline, cancel);
    if (!client_status) {
        cancelled = cancel.IsCancelled();
        timed_out = !cancelled;
        spdlog::info("Command {} in {} {}, reaping", cmd_id, handle_.Name(),
                     cancelled ? "cancelled" : "timed out");
        Reap(cmd_id);

        auto fallback = spec.timeout
            ? start + std::max<std::chrono::steady_clock::duration>(
                  2 * *spec.timeout, handle_.Settings().min_fallback_timeout)
            : std::chrono::steady_clock::now() + handle_.Settings().min_fallback_timeout;
        client_status = proc->WaitUntil(fallback);
        if (!client_status) {
            spdlog::warn("Runtime client for {} did not exit, killing it", cmd_id);
            proc->Kill(SIGKILL);
            proc->Wait();
            client_killed = true;
        }
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (feeder.valid()) {
        feeder.get();
    }
    DrainOutcome outcome;
    try {
        outcome = drain.get();
    } catch (const std::exception& e) {
        outcome.protocol_error = e.what();
    }
    const std::string runner_stderr = diagnostics.get();
    LogDiagnostics(handle_.Name(), runner_stderr);

    if (!use.Finish()) {
        throw ExecutionFailed("Container " + handle_.Name() + " was destroyed during execution");
    }

    if (outcome.status.launch_error) {
        throw LaunchFailed(*outcome.status.launch_error);
    }

    CommandResult result;
    result.timed_out = timed_out;
    result.duration = duration;

    if (!client_killed) {
        if (!outcome.protocol_error.empty() && !timed_out && !cancelled) {
            throw ExecutionFailed("Runner protocol error for " + cmd_id + ": " +
                                  outcome.protocol_error);
        }
        if (outcome.status.received) {
            result.return_code = outcome.status.return_code;
        } else if (!timed_out && !cancelled) {
            throw ExecutionFailed("Runner exited with " + std::to_string(client_status.value_or(-1)) +
                                  " without a status: " + utils::StringUtils::Trim(runner_stderr));
        }
    }

    result.stdout_truncated = stdout_buffer->Truncated();
    result.stderr_truncated = stderr_buffer->Truncated();
    result.stdout_capture = stdout_buffer;
    result.stderr_capture = stderr_buffer;

    if (cancelled) {
        throw OperationCancelled("Command " + cmd_id + " cancelled");
    }

    if (spec.decode) {
        result.stdout_text = DecodeStream("stdout", *stdout_buffer, *spec.decode);
        result.stderr_text = DecodeStream("stderr", *stderr_buffer, *spec.decode);
    }

    spdlog::debug("Command {} finished: rc={} timed_out={} stdout={}B stderr={}B in {}ms",
                  cmd_id, result.return_code ? std::to_string(*result.return_code) : "none",
                  result.timed_out, stdout_buffer->BytesSeen(), stderr_buffer->BytesSeen(),
                  duration.count());

    if (spec.check) {
        if (result.timed_out) {
            throw TimedOut("Command timed out: " + utils::StringUtils::Join(spec.argv, " "),
                           std::move(result));
        }
        if (!result.return_code || *result.return_code != 0) {
            throw NonZeroExit("Command exited with " +
                              (result.return_code ? std::to_string(*result.return_code)
                                                  : std::string("no status")) +
                              ": " + utils::StringUtils::Join(spec.argv, " "),
                              std::move(result));
        }
    }
    return result;
}

void CommandExecutor::Reap(const std::string& cmd_id) {
    runtime::ExecRequest request;
    request.argv = {handle_.Settings().container_runner_path, "--reap", cmd_id};
    request.user = 0;
    request.pipe_stdin = false;

    try {
        auto reaper = handle_.Runtime().Exec(handle_.Name(), request);
        // Reaper output is a few lines and fits in the pipe buffer.
        auto status = reaper->WaitUntil(std::chrono::steady_clock::now() + kReapTimeout);
        if (!status) {
            spdlog::warn("Reaper for {} did not finish in time", cmd_id);
            reaper->Kill(SIGKILL);
        } else if (*status != 0) {
            spdlog::warn("Reaper for {} exited with {}", cmd_id, *status);
        }
    } catch (const std::exception& e) {
        spdlog::error("Could not start reaper for {}: {}", cmd_id, e.what());
    }
}

} // namespace core
} // namespace warden
