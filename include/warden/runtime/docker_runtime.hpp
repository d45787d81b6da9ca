/**
 * @file docker_runtime.hpp
 * @brief Container runtime backed by the Docker CLI
 *
 * Every operation spawns the docker client from an argument vector, never
 * through a shell, so container names, image references and command
 * arguments are passed through verbatim.
 *
 * **Container Lifecycle**:
 * ```
 * docker create --entrypoint '' IMAGE RUNNER --hold
 *   -> docker cp --archive - NAME:/      (provisioning tar on stdin)
 *   -> docker start NAME
 *   -> docker exec -i NAME RUNNER --cmd-id ...   (per command)
 *   -> docker stop --time 1 NAME -> docker rm -f NAME
 * ```
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "warden/runtime/container_runtime.hpp"

namespace warden {
namespace runtime {

/**
 * @class DockerRuntime
 * @brief ContainerRuntime implementation using the docker command-line client
 *
 * **Thread Safety**: Thread-safe; holds no mutable state.
 *
 * **Usage Example**:
 * @code
 * DockerRuntime docker;
 * if (!DockerRuntime::IsAvailable()) {
 *     spdlog::error("Docker is not available");
 *     return 1;
 * }
 * docker.Create(spec, archive_path, std::chrono::seconds(60), cancel);
 * auto exec = docker.Exec(spec.name, {{"ls", "-l"}});
 * @endcode
 */
class DockerRuntime : public ContainerRuntime {
public:
    /**
     * @param docker_binary Client executable (looked up in PATH)
     * @param command_timeout Budget for short operations (cp, stop, rm)
     */
    explicit DockerRuntime(std::string docker_binary = "docker",
                           std::chrono::milliseconds command_timeout = std::chrono::seconds(60));

    /**
     * @brief Check whether the daemon answers through the client
     */
    static bool IsAvailable(const std::string& docker_binary = "docker");

    /**
     * @brief Server version reported by the daemon, or "unknown"
     */
    static std::string GetVersion(const std::string& docker_binary = "docker");

    void Create(const ContainerSpec& spec,
                const std::filesystem::path& provisioning_archive,
                std::chrono::milliseconds timeout,
                const utils::CancellationToken& cancel) override;

    std::unique_ptr<utils::Subprocess> Exec(const std::string& container,
                                            const ExecRequest& request) override;

    void CopyArchive(const std::string& container,
                     const std::string& dest_dir,
                     const std::filesystem::path& archive,
                     std::chrono::milliseconds timeout) override;

    void Restart(const std::string& container, std::chrono::milliseconds timeout) override;

    void Destroy(const std::string& container) override;

    /**
     * @brief Arguments of the "docker create" invocation for @p spec
     */
    std::vector<std::string> BuildCreateArgs(const ContainerSpec& spec) const;

    /**
     * @brief Arguments of the "docker exec" invocation for @p request
     */
    std::vector<std::string> BuildExecArgs(const std::string& container,
                                           const ExecRequest& request) const;

private:
    /**
     * @brief Run one docker subcommand to completion
     * @throws RuntimeError on non-zero exit, timeout or cancellation
     */
    utils::CommandOutput RunDocker(const std::vector<std::string>& args,
                                   std::chrono::milliseconds timeout,
                                   const utils::CancellationToken& cancel = {},
                                   const std::optional<std::filesystem::path>& stdin_file = std::nullopt) const;

    std::string docker_binary_;
    std::chrono::milliseconds command_timeout_;
};

} // namespace runtime
} // namespace warden
