/**
 * @file settings.hpp
 * @brief Process-wide sandbox configuration
 *
 * Defaults are compiled in; FromEnvironment() applies WARDEN_* variables and
 * FromJsonFile() applies a JSON document on top of the defaults. Command-line
 * options of the warden tool override both.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "warden/runtime/container_runtime.hpp"

namespace warden {
namespace core {

using json = nlohmann::json;

/**
 * @struct SandboxSettings
 * @brief Configuration shared by every sandbox of a process
 *
 * **Usage Example**:
 * @code
 * auto settings = SandboxSettings::FromEnvironment();
 * settings.pids_limit = 128;
 * Sandbox sandbox(settings, pool, runtime);
 * @endcode
 */
struct SandboxSettings {
    // Container
    std::string docker_image{"eecsautograder/ubuntu22:latest"};  ///< Default image
    std::int64_t memory_limit{4LL * 1024 * 1024 * 1024};           ///< Bytes
    int pids_limit{512};                                           ///< Process ceiling
    std::optional<double> cpu_core_limit;                          ///< Fractional cores
    std::optional<std::string> cpuset;                             ///< CPU affinity
    bool block_process_spawn{false};                               ///< Command default for fork/clone
    std::chrono::seconds container_create_timeout{60};             ///< Provisioning budget
    std::chrono::seconds min_fallback_timeout{60};                 ///< Floor of the client kill deadline

    // Coordination
    std::string redis_host{"localhost"};                           ///< Store host
    int redis_port{6379};                                          ///< Store port
    std::string uid_pool_key{"warden:available_uids"};             ///< Available-set key
    int uid_pool_first{2000};                                      ///< First UID of the pool
    int uid_pool_size{1000};                                       ///< Number of UIDs
    std::chrono::seconds uid_acquire_timeout{60};                  ///< Lease wait budget

    // Runner and layout
    std::string docker_binary{"docker"};                           ///< Client executable
    std::filesystem::path host_runner_path;                        ///< Runner binary on the host
    std::string container_runner_path{"/usr/local/bin/warden-cmd-runner"};
    std::string home_dir{"/home/warden"};                          ///< HOME of the sandbox user
    std::string working_dir{"/home/warden/working_dir"};           ///< Default cwd and file destination

    SandboxSettings();

    /**
     * @brief Defaults overridden by WARDEN_* environment variables
     * @throws std::invalid_argument on malformed values
     */
    static SandboxSettings FromEnvironment();

    /**
     * @brief Defaults overridden by the keys of a JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static SandboxSettings FromJsonFile(const std::filesystem::path& path);

    /**
     * @brief Apply the keys present in @p j
     * @throws std::invalid_argument on malformed values
     */
    void Apply(const json& j);

    /**
     * @brief Container limits derived from these settings
     */
    runtime::ResourceLimits DefaultLimits() const;

    json ToJson() const;
};

} // namespace core
} // namespace warden
