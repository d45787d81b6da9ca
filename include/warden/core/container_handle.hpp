/**
 * @file container_handle.hpp
 * @brief One provisioned container and the identity lease it runs under
 *
 * **State Machine**:
 * ```
 * UNPROVISIONED --Provision--> READY <--BeginUse/end--> EXECUTING
 *        |                       |                         |
 *        +--------------------Destroy------------------> DESTROYED
 * ```
 *
 * @date 2025
 */

#pragma once

#include <map>
#include <mutex>
#include <string>

#include "warden/core/settings.hpp"
#include "warden/core/uid_pool.hpp"
#include "warden/runtime/container_runtime.hpp"
#include "warden/utils/cancellation.hpp"

namespace warden {
namespace core {

/**
 * @enum HandleState
 * @brief Lifecycle state of a container handle
 */
enum class HandleState {
    UNPROVISIONED,  ///< No container yet
    READY,          ///< Running and idle
    EXECUTING,      ///< A command or file copy is in progress
    DESTROYED       ///< Container removed, lease returned
};

std::string ToString(HandleState state);

/**
 * @class ContainerHandle
 * @brief Owns a container's lifecycle and its UidLease
 *
 * Commands and file copies take the handle through BeginUse(), which
 * serializes them: a second caller blocks until the first returns the handle
 * to READY.
 *
 * **Thread Safety**: Destroy() may race with an ongoing use; the use then
 * observes DESTROYED when it ends.
 */
class ContainerHandle {
public:
    /**
     * @class Use
     * @brief Exclusive READY -> EXECUTING -> READY transition
     */
    class Use {
    public:
        ~Use();

        Use(Use&& other) noexcept;
        Use(const Use&) = delete;
        Use& operator=(const Use&) = delete;
        Use& operator=(Use&&) = delete;

        /**
         * @brief Return the handle to READY
         * @return false if the handle was destroyed meanwhile
         */
        bool Finish();

    private:
        friend class ContainerHandle;
        Use(ContainerHandle* handle, std::unique_lock<std::mutex> lock)
            : handle_(handle), lock_(std::move(lock)) {}

        ContainerHandle* handle_;
        std::unique_lock<std::mutex> lock_;
    };

    /**
     * @param runtime Container engine (must outlive the handle)
     * @param settings Layout and timeouts
     * @param limits Container-wide resource ceilings
     * @param image Image to create the container from
     * @param env Extra container environment
     */
    ContainerHandle(runtime::ContainerRuntime& runtime,
                    const SandboxSettings& settings,
                    runtime::ResourceLimits limits,
                    std::string image,
                    std::map<std::string, std::string> env = {});

    /**
     * @brief Destroys the container if still alive; failures are only logged
     */
    ~ContainerHandle();

    ContainerHandle(const ContainerHandle&) = delete;
    ContainerHandle& operator=(const ContainerHandle&) = delete;

    /**
     * @brief Create, populate and start the container as @p lease's UID
     *
     * The handle takes the lease. On any failure the partial container is
     * removed and the lease released before the exception propagates.
     *
     * @throws ProvisioningFailed on runtime failure or timeout
     * @throws OperationCancelled if @p cancel fired
     */
    void Provision(UidLease lease, const utils::CancellationToken& cancel = {});

    /**
     * @brief Stop and remove the container, then release the lease
     *
     * Runs at most once; the lease is released even when removal fails.
     *
     * @throws TeardownFailed if the runtime could not remove the container
     */
    void Destroy();

    /**
     * @brief Stop and start the container, keeping its filesystem
     * @throws SandboxError if the handle is not READY or the runtime fails
     */
    void Restart();

    /**
     * @brief Wait for exclusive use and move READY -> EXECUTING
     * @throws ExecutionFailed if the handle is not READY
     */
    Use BeginUse();

    HandleState State() const;
    const std::string& Name() const { return name_; }
    IdentityToken Uid() const { return uid_; }
    const runtime::ResourceLimits& Limits() const { return limits_; }
    const std::string& Image() const { return image_; }
    const SandboxSettings& Settings() const { return settings_; }
    runtime::ContainerRuntime& Runtime() { return runtime_; }

private:
    void SetState(HandleState state);

    runtime::ContainerRuntime& runtime_;
    const SandboxSettings& settings_;
    const runtime::ResourceLimits limits_;
    const std::string image_;
    const std::map<std::string, std::string> env_;

    std::string name_;
    IdentityToken uid_{-1};
    UidLease lease_;

    std::mutex use_mutex_;            ///< Serializes uses
    mutable std::mutex state_mutex_;  ///< Guards state_
    HandleState state_{HandleState::UNPROVISIONED};
};

} // namespace core
} // namespace warden
