/**
 * @file container_runtime.hpp
 * @brief Abstract container runtime driven by the sandbox
 *
 * The sandbox never talks to a container engine directly. Everything it
 * needs (create a limited container, exec into it with piped I/O, extract an
 * archive, restart, remove) goes through this interface, so another engine
 * only needs another implementation.
 *
 * @date 2025
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "warden/utils/cancellation.hpp"
#include "warden/utils/process_utils.hpp"

namespace warden {
namespace runtime {

/**
 * @struct ResourceLimits
 * @brief Container-wide ceilings, fixed at provisioning time
 */
struct ResourceLimits {
    std::int64_t memory_bytes{4LL * 1024 * 1024 * 1024};  ///< Memory ceiling (swap disabled)
    int pids_limit{512};                                  ///< Process-count ceiling
    std::optional<double> cpu_cores;                      ///< Fractional CPU cores
    std::optional<std::string> cpuset;                    ///< CPU affinity, e.g. "0-3,6"
    bool block_process_spawn{false};                      ///< Default for commands
    bool allow_network{false};                            ///< Attach a network stack
};

/**
 * @struct ContainerSpec
 * @brief Everything needed to create one container
 */
struct ContainerSpec {
    std::string name;                              ///< Unique container name
    std::string image;                             ///< Image reference
    uid_t uid{0};                                  ///< Default user (leased token)
    ResourceLimits limits;                         ///< Resource ceilings
    std::vector<std::string> main_command;         ///< Idle main process
    std::map<std::string, std::string> env;        ///< Container environment
};

/**
 * @struct ExecRequest
 * @brief One process to start inside a running container
 */
struct ExecRequest {
    std::vector<std::string> argv;                 ///< Program and arguments
    std::optional<uid_t> user;                     ///< Empty = container default user
    std::map<std::string, std::string> env;        ///< Extra environment
    bool pipe_stdin{true};                         ///< Give the caller a stdin pipe
};

/**
 * @class RuntimeError
 * @brief A runtime operation failed or did not finish in time
 */
class RuntimeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ContainerRuntime
 * @brief Interface to a container engine
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /**
     * @brief Create, provision and start a container
     *
     * @p provisioning_archive is extracted at "/" with ownership preserved
     * before the container starts. On failure the caller is responsible for
     * removing the partially created container with Destroy().
     *
     * @throws RuntimeError on failure, timeout or cancellation
     */
    virtual void Create(const ContainerSpec& spec,
                        const std::filesystem::path& provisioning_archive,
                        std::chrono::milliseconds timeout,
                        const utils::CancellationToken& cancel) = 0;

    /**
     * @brief Start a process in the container with piped standard streams
     * @throws std::system_error if the runtime client cannot be spawned
     */
    virtual std::unique_ptr<utils::Subprocess> Exec(const std::string& container,
                                                    const ExecRequest& request) = 0;

    /**
     * @brief Extract a tar archive under @p dest_dir with ownership preserved
     * @throws RuntimeError on failure
     */
    virtual void CopyArchive(const std::string& container,
                             const std::string& dest_dir,
                             const std::filesystem::path& archive,
                             std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Stop and start the container, keeping its filesystem
     * @throws RuntimeError on failure
     */
    virtual void Restart(const std::string& container, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Stop and remove the container; succeeds if it is already gone
     * @throws RuntimeError if the container could not be removed
     */
    virtual void Destroy(const std::string& container) = 0;
};

} // namespace runtime
} // namespace warden
