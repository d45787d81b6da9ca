/**
 * @file docker_runtime.cpp
 * @brief Implementation of the Docker CLI container runtime
 *
 * **Resource Limits**:
 * - Memory: --memory and --memory-swap set to the same value (no swap),
 *   with --oom-kill-disable so a command hitting the limit stalls instead of
 *   taking the container's main process down with it
 * - Processes: --pids-limit
 * - CPU: --cpus (fractional cores) and --cpuset-cpus (affinity)
 * - Network: --net none unless network access was requested
 *
 * The image's ENTRYPOINT is always cleared so a custom image cannot replace
 * the idle main process.
 *
 * @date 2025
 */

#include "warden/runtime/docker_runtime.hpp"

#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace warden {
namespace runtime {

namespace {

std::string FormatCpus(double cores) {
    std::ostringstream oss;
    oss << cores;
    return oss.str();
}

std::chrono::milliseconds Remaining(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / RUNTIME DETECTION
// ============================================================================

DockerRuntime::DockerRuntime(std::string docker_binary, std::chrono::milliseconds command_timeout)
    : docker_binary_(std::move(docker_binary))
    , command_timeout_(command_timeout) {}

bool DockerRuntime::IsAvailable(const std::string& docker_binary) {
    try {
        auto result = utils::RunCommand({docker_binary, "version", "--format", "{{.Server.Version}}"},
                                        std::chrono::seconds(10));
        return result.Success();
    } catch (const std::exception& e) {
        spdlog::debug("Docker availability check failed: {}", e.what());
        return false;
    }
}

std::string DockerRuntime::GetVersion(const std::string& docker_binary) {
    try {
        auto result = utils::RunCommand({docker_binary, "version", "--format", "{{.Server.Version}}"},
                                        std::chrono::seconds(10));
        if (result.Success()) {
            return utils::StringUtils::Trim(result.stdout_output);
        }
    } catch (const std::exception& e) {
        spdlog::debug("Docker version query failed: {}", e.what());
    }
    return "unknown";
}

// ============================================================================
// ARGUMENT BUILDING
// ============================================================================

std::vector<std::string> DockerRuntime::BuildCreateArgs(const ContainerSpec& spec) const {
    const std::string memory = std::to_string(spec.limits.memory_bytes);

    std::vector<std::string> args = {
        docker_binary_, "create",
        "--name", spec.name,
        "--user", std::to_string(spec.uid) + ":" + std::to_string(spec.uid),
        "--pids-limit", std::to_string(spec.limits.pids_limit),
        "--memory", memory,
        "--memory-swap", memory,
        "--oom-kill-disable",
    };

    if (spec.limits.cpu_cores) {
        args.insert(args.end(), {"--cpus", FormatCpus(*spec.limits.cpu_cores)});
    }
    if (spec.limits.cpuset) {
        args.insert(args.end(), {"--cpuset-cpus", *spec.limits.cpuset});
    }
    if (!spec.limits.allow_network) {
        args.insert(args.end(), {"--net", "none"});
    }
    for (const auto& [key, value] : spec.env) {
        args.insert(args.end(), {"-e", key + "=" + value});
    }

    args.insert(args.end(), {"--entrypoint", "", spec.image});
    args.insert(args.end(), spec.main_command.begin(), spec.main_command.end());
    return args;
}

std::vector<std::string> DockerRuntime::BuildExecArgs(const std::string& container,
                                                      const ExecRequest& request) const {
    std::vector<std::string> args = {docker_binary_, "exec"};
    if (request.pipe_stdin) {
        args.push_back("-i");
    }
    if (request.user) {
        args.insert(args.end(), {"--user", std::to_string(*request.user)});
    }
    for (const auto& [key, value] : request.env) {
        args.insert(args.end(), {"--env", key + "=" + value});
    }
    args.push_back(container);
    args.insert(args.end(), request.argv.begin(), request.argv.end());
    return args;
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

void DockerRuntime::Create(const ContainerSpec& spec,
                           const std::filesystem::path& provisioning_archive,
                           std::chrono::milliseconds timeout,
                           const utils::CancellationToken& cancel) {
    spdlog::info("Creating container {} from {} (uid {})", spec.name, spec.image, spec.uid);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    RunDocker(BuildCreateArgs(spec), Remaining(deadline), cancel);
    RunDocker({docker_binary_, "cp", "--archive", "-", spec.name + ":/"},
              Remaining(deadline), cancel, provisioning_archive);
    RunDocker({docker_binary_, "start", spec.name}, Remaining(deadline), cancel);

    spdlog::debug("Container {} started", spec.name);
}

std::unique_ptr<utils::Subprocess> DockerRuntime::Exec(const std::string& container,
                                                       const ExecRequest& request) {
    auto args = BuildExecArgs(container, request);
    spdlog::debug("Exec in {}: {}", container, utils::StringUtils::Join(request.argv, " "));

    utils::SubprocessOptions options;
    options.pipe_stdin = request.pipe_stdin;
    return utils::Subprocess::Spawn(args, options);
}

void DockerRuntime::CopyArchive(const std::string& container,
                                const std::string& dest_dir,
                                const std::filesystem::path& archive,
                                std::chrono::milliseconds timeout) {
    spdlog::debug("Copying archive {} into {}:{}", archive.string(), container, dest_dir);
    RunDocker({docker_binary_, "cp", "--archive", "-", container + ":" + dest_dir},
              timeout, {}, archive);
}

void DockerRuntime::Restart(const std::string& container, std::chrono::milliseconds timeout) {
    spdlog::info("Restarting container {}", container);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    RunDocker({docker_binary_, "stop", "--time", "1", container}, Remaining(deadline));
    RunDocker({docker_binary_, "start", container}, Remaining(deadline));
}

void DockerRuntime::Destroy(const std::string& container) {
    spdlog::info("Removing container {}", container);

    // A failed stop is not fatal: rm -f kills whatever is left.
    try {
        RunDocker({docker_binary_, "stop", "--time", "1", container}, command_timeout_);
    } catch (const RuntimeError& e) {
        spdlog::warn("Stopping container {} failed: {}", container, e.what());
    }

    auto result = utils::RunCommand({docker_binary_, "rm", "-f", container}, command_timeout_);
    if (result.Success()) {
        return;
    }
    if (result.stderr_output.find("No such container") != std::string::npos) {
        spdlog::debug("Container {} already removed", container);
        return;
    }
    throw RuntimeError("docker rm -f " + container + " failed: " +
                       utils::StringUtils::Trim(result.stderr_output));
}

// ============================================================================
// DOCKER CLIENT INVOCATION
// ============================================================================

utils::CommandOutput DockerRuntime::RunDocker(const std::vector<std::string>& args,
                                              std::chrono::milliseconds timeout,
                                              const utils::CancellationToken& cancel,
                                              const std::optional<std::filesystem::path>& stdin_file) const {
    const std::string description = args.size() > 1 ? "docker " + args[1] : "docker";

    if (timeout.count() <= 0) {
        throw RuntimeError(description + " not started: time budget exhausted");
    }

    utils::CommandOutput result;
    try {
        result = utils::RunCommand(args, timeout, cancel, stdin_file);
    } catch (const std::system_error& e) {
        throw RuntimeError(description + " could not be spawned: " + e.what());
    }

    if (result.timed_out) {
        throw RuntimeError(description + (cancel.IsCancelled() ? " cancelled" : " timed out"));
    }
    if (!result.Success()) {
        throw RuntimeError(description + " failed (exit " +
                           std::to_string(result.exit_code.value_or(-1)) + "): " +
                           utils::StringUtils::Trim(result.stderr_output));
    }
    return result;
}

} // namespace runtime
} // namespace warden
