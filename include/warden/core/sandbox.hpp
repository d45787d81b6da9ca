/**
 * @file sandbox.hpp
 * @brief Lifecycle-scoped sandbox for running untrusted commands
 *
 * Constructing a Sandbox leases a UID and provisions a container; destroying
 * it removes the container and returns the UID, however execution ended.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "warden/core/command.hpp"
#include "warden/core/container_handle.hpp"
#include "warden/core/file_injector.hpp"
#include "warden/core/settings.hpp"
#include "warden/core/uid_pool.hpp"
#include "warden/runtime/container_runtime.hpp"
#include "warden/utils/cancellation.hpp"

namespace warden {
namespace core {

/**
 * @struct SandboxOptions
 * @brief Per-sandbox choices layered over SandboxSettings
 */
struct SandboxOptions {
    std::optional<std::string> image;                   ///< Empty = settings.docker_image
    std::optional<runtime::ResourceLimits> limits;      ///< Empty = settings.DefaultLimits()
    std::map<std::string, std::string> environment;     ///< Container environment
};

/**
 * @class Sandbox
 * @brief RAII owner of one container and its identity lease
 *
 * RunCommand() and AddFiles() may be called from several threads; they are
 * serialized on the container. Reset(), Restart() and Close() must not race
 * with each other.
 *
 * **Usage Example**:
 * @code
 * auto settings = SandboxSettings::FromEnvironment();
 * coordination::RedisCoordinationStore store(settings.redis_host, settings.redis_port);
 * UidPool pool(store, {settings.uid_pool_key, settings.uid_pool_first,
 *                      settings.uid_pool_size, settings.uid_acquire_timeout});
 * runtime::DockerRuntime docker(settings.docker_binary);
 *
 * Sandbox sandbox(settings, pool, docker,
 *                 SandboxBuilder(settings).WithPidsLimit(64).Build());
 * sandbox.AddFiles({{"solution.py"}}, FileOwner::kSandboxUser, true);
 *
 * CommandSpec spec;
 * spec.argv = {"python3", "solution.py"};
 * spec.timeout = std::chrono::seconds(5);
 * auto result = sandbox.RunCommand(spec);
 * @endcode
 */
class Sandbox {
public:
    /**
     * @brief Lease a UID and provision a container
     *
     * @throws PoolExhausted if no UID became available
     * @throws ProvisioningFailed if the container could not be started
     * @throws OperationCancelled if @p cancel fired
     */
    Sandbox(const SandboxSettings& settings,
            UidPool& pool,
            runtime::ContainerRuntime& runtime,
            SandboxOptions options = {},
            const utils::CancellationToken& cancel = {});

    /**
     * @brief Tear down; a teardown failure is logged, the UID is always returned
     */
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    /**
     * @brief Run one command; see CommandExecutor::Run()
     */
    CommandResult RunCommand(const CommandSpec& spec, const utils::CancellationToken& cancel = {});

    /**
     * @brief Copy files into the container; see FileInjector::AddFiles()
     */
    std::vector<std::string> AddFiles(const std::vector<FileToAdd>& files,
                                      FileOwner owner = FileOwner::kSandboxUser,
                                      bool read_only = false);

    /**
     * @brief Copy one file into the working directory under @p new_name
     * @return Container path of the copy
     */
    std::string AddAndRenameFile(const std::filesystem::path& source, const std::string& new_name);

    /**
     * @brief Destroy the container and provision a fresh one with a new lease
     *
     * Kills every process and discards every added file.
     */
    void Reset(const utils::CancellationToken& cancel = {});

    /**
     * @brief Restart the container, keeping added files
     */
    void Restart();

    /**
     * @brief Tear down now instead of at destruction
     * @throws TeardownFailed if the runtime could not remove the container
     */
    void Close();

    const std::string& Name() const { return handle_->Name(); }
    IdentityToken Uid() const { return handle_->Uid(); }
    HandleState State() const { return handle_->State(); }
    const runtime::ResourceLimits& Limits() const { return handle_->Limits(); }
    const SandboxSettings& Settings() const { return settings_; }

private:
    void Provision(const utils::CancellationToken& cancel);

    const SandboxSettings settings_;
    UidPool& pool_;
    runtime::ContainerRuntime& runtime_;
    const SandboxOptions options_;
    std::unique_ptr<ContainerHandle> handle_;
};

/**
 * @class SandboxBuilder
 * @brief Fluent API for constructing SandboxOptions
 *
 * Starts from the image and limits of the given settings.
 *
 * **Usage Example**:
 * @code
 * auto options = SandboxBuilder(settings)
 *     .WithImage("eecsautograder/ubuntu22:latest")
 *     .WithMemoryLimit(2LL * 1024 * 1024 * 1024)
 *     .WithPidsLimit(128)
 *     .WithCpuCores(1.5)
 *     .AllowNetwork(false)
 *     .WithEnvironment("LANG", "C.UTF-8")
 *     .Build();
 * @endcode
 */
class SandboxBuilder {
public:
    explicit SandboxBuilder(const SandboxSettings& settings) {
        options_.image = settings.docker_image;
        options_.limits = settings.DefaultLimits();
    }

    SandboxBuilder& WithImage(const std::string& image) {
        options_.image = image;
        return *this;
    }

    /**
     * @brief Set memory ceiling
     * @param bytes Memory limit in bytes (swap is disabled)
     * @return Reference to builder for chaining
     */
    SandboxBuilder& WithMemoryLimit(std::int64_t bytes) {
        options_.limits->memory_bytes = bytes;
        return *this;
    }

    SandboxBuilder& WithPidsLimit(int pids) {
        options_.limits->pids_limit = pids;
        return *this;
    }

    SandboxBuilder& WithCpuCores(double cores) {
        options_.limits->cpu_cores = cores;
        return *this;
    }

    /**
     * @brief Pin the container to CPUs
     * @param cpuset Affinity in docker syntax, e.g. "0-3,6"
     * @return Reference to builder for chaining
     */
    SandboxBuilder& WithCpuset(const std::string& cpuset) {
        options_.limits->cpuset = cpuset;
        return *this;
    }

    SandboxBuilder& AllowNetwork(bool allow = true) {
        options_.limits->allow_network = allow;
        return *this;
    }

    /**
     * @brief Default for commands that do not set block_process_spawn
     * @param block Block fork/clone for commands (default: true)
     * @note Without this call the setting's block_process_spawn applies
     * @return Reference to builder for chaining
     */
    SandboxBuilder& BlockProcessSpawn(bool block = true) {
        options_.limits->block_process_spawn = block;
        return *this;
    }

    SandboxBuilder& WithEnvironment(const std::string& key, const std::string& value) {
        options_.environment[key] = value;
        return *this;
    }

    SandboxOptions Build() const { return options_; }

private:
    SandboxOptions options_;
};

} // namespace core
} // namespace warden
