/**
 * @file container_handle.cpp
 * @brief Implementation of the container handle lifecycle
 *
 * **Provisioning Archive**:
 * The runner binary and the sandbox user's directories reach the container
 * in one tar stream extracted with ownership preserved:
 * ```
 * usr/local/bin/warden-cmd-runner   root:root  0555
 * home/warden                       uid:uid    0755
 * home/warden/working_dir           uid:uid    0755
 * ```
 *
 * @date 2025
 */

#include "warden/core/container_handle.hpp"

#include "warden/core/errors.hpp"
#include "warden/utils/archive_utils.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace warden {
namespace core {

namespace {

std::string Relative(const std::string& path) {
    std::size_t start = path.find_first_not_of('/');
    return start == std::string::npos ? std::string() : path.substr(start);
}

} // anonymous namespace

std::string ToString(HandleState state) {
    switch (state) {
        case HandleState::UNPROVISIONED: return "UNPROVISIONED";
        case HandleState::READY: return "READY";
        case HandleState::EXECUTING: return "EXECUTING";
        case HandleState::DESTROYED: return "DESTROYED";
    }
    return "UNKNOWN";
}

// ============================================================================
// USE GUARD
// ============================================================================

ContainerHandle::Use::~Use() {
    Finish();
}

ContainerHandle::Use::Use(Use&& other) noexcept
    : handle_(other.handle_)
    , lock_(std::move(other.lock_)) {
    other.handle_ = nullptr;
}

bool ContainerHandle::Use::Finish() {
    if (handle_ == nullptr) {
        return true;
    }
    ContainerHandle* handle = handle_;
    handle_ = nullptr;

    bool alive = true;
    {
        std::lock_guard<std::mutex> lock(handle->state_mutex_);
        if (handle->state_ == HandleState::EXECUTING) {
            handle->state_ = HandleState::READY;
        } else {
            alive = false;
        }
    }
    lock_.unlock();
    return alive;
}

// ============================================================================
// CONSTRUCTION / DESTRUCTION
// ============================================================================

ContainerHandle::ContainerHandle(runtime::ContainerRuntime& runtime,
                                 const SandboxSettings& settings,
                                 runtime::ResourceLimits limits,
                                 std::string image,
                                 std::map<std::string, std::string> env)
    : runtime_(runtime)
    , settings_(settings)
    , limits_(std::move(limits))
    , image_(std::move(image))
    , env_(std::move(env))
    , name_("warden-" + utils::StringUtils::RandomHex(24)) {}

ContainerHandle::~ContainerHandle() {
    try {
        Destroy();
    } catch (const std::exception& e) {
        spdlog::error("Teardown of container {} failed: {}", name_, e.what());
    }
}

// ============================================================================
// PROVISIONING
// ============================================================================

void ContainerHandle::Provision(UidLease lease, const utils::CancellationToken& cancel) {
    if (State() != HandleState::UNPROVISIONED) {
        throw ProvisioningFailed("Container " + name_ + " is " + ToString(State()));
    }

    lease_ = std::move(lease);
    uid_ = lease_.Token();
    const auto uid = static_cast<uid_t>(uid_);

    runtime::ContainerSpec spec;
    spec.name = name_;
    spec.image = image_;
    spec.uid = uid;
    spec.limits = limits_;
    spec.main_command = {settings_.container_runner_path, "--hold"};
    spec.env = env_;
    spec.env.emplace("HOME", settings_.home_dir);

    try {
        utils::ArchiveBuilder archive;
        archive.AddFile(settings_.host_runner_path, Relative(settings_.container_runner_path),
                        0, 0, 0555);

        std::set<std::string> directories = {Relative(settings_.home_dir),
                                             Relative(settings_.working_dir)};
        for (const auto& dir : directories) {
            if (!dir.empty()) {
                archive.AddDirectory(dir, uid, uid, 0755);
            }
        }

        runtime_.Create(spec, archive.Finish(), settings_.container_create_timeout, cancel);
    } catch (const std::exception& e) {
        const bool cancelled = cancel.IsCancelled();
        spdlog::error("Provisioning container {} failed: {}", name_, e.what());

        try {
            runtime_.Destroy(name_);
        } catch (const std::exception& cleanup) {
            spdlog::error("Removing partial container {} failed: {}", name_, cleanup.what());
        }
        lease_.Release();
        SetState(HandleState::DESTROYED);

        if (cancelled) {
            throw OperationCancelled("Provisioning of " + name_ + " cancelled");
        }
        throw ProvisioningFailed("Provisioning of " + name_ + " failed: " + e.what());
    }

    SetState(HandleState::READY);
    spdlog::info("Container {} ready (uid {})", name_, uid_);
}

// ============================================================================
// TEARDOWN
// ============================================================================

void ContainerHandle::Destroy() {
    HandleState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_;
        if (previous == HandleState::DESTROYED) {
            return;
        }
        state_ = HandleState::DESTROYED;
    }

    if (previous == HandleState::UNPROVISIONED) {
        lease_.Release();
        return;
    }

    std::string failure;
    try {
        runtime_.Destroy(name_);
    } catch (const std::exception& e) {
        failure = e.what();
    }

    lease_.Release();

    if (!failure.empty()) {
        throw TeardownFailed("Could not remove container " + name_ + ": " + failure);
    }
    spdlog::debug("Container {} destroyed", name_);
}

void ContainerHandle::Restart() {
    Use use = BeginUse();
    try {
        runtime_.Restart(name_, settings_.container_create_timeout);
    } catch (const runtime::RuntimeError& e) {
        throw SandboxError("Restart of " + name_ + " failed: " + e.what());
    }
    if (!use.Finish()) {
        throw ExecutionFailed("Container " + name_ + " was destroyed during restart");
    }
}

// ============================================================================
// STATE
// ============================================================================

ContainerHandle::Use ContainerHandle::BeginUse() {
    std::unique_lock<std::mutex> use_lock(use_mutex_);

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != HandleState::READY) {
        throw ExecutionFailed("Container " + name_ + " is " + ToString(state_) + ", not READY");
    }
    state_ = HandleState::EXECUTING;
    return Use(this, std::move(use_lock));
}

HandleState ContainerHandle::State() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void ContainerHandle::SetState(HandleState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
}

} // namespace core
} // namespace warden
