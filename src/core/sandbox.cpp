/**
 * @file sandbox.cpp
 * @brief Implementation of the sandbox facade
 *
 * @date 2025
 */

#include "warden/core/sandbox.hpp"

#include "warden/core/command_executor.hpp"
#include "warden/core/errors.hpp"

#include <spdlog/spdlog.h>

namespace warden {
namespace core {

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

Sandbox::Sandbox(const SandboxSettings& settings,
                 UidPool& pool,
                 runtime::ContainerRuntime& runtime,
                 SandboxOptions options,
                 const utils::CancellationToken& cancel)
    : settings_(settings)
    , pool_(pool)
    , runtime_(runtime)
    , options_(std::move(options)) {
    Provision(cancel);
}

Sandbox::~Sandbox() {
    try {
        Close();
    } catch (const SandboxError& e) {
        spdlog::error("Sandbox teardown failed: {}", e.what());
    }
}

void Sandbox::Provision(const utils::CancellationToken& cancel) {
    auto handle = std::make_unique<ContainerHandle>(
        runtime_, settings_,
        options_.limits.value_or(settings_.DefaultLimits()),
        options_.image.value_or(settings_.docker_image),
        options_.environment);

    UidLease lease = pool_.Acquire(cancel);
    handle->Provision(std::move(lease), cancel);
    handle_ = std::move(handle);
}

// ============================================================================
// OPERATIONS
// ============================================================================

CommandResult Sandbox::RunCommand(const CommandSpec& spec, const utils::CancellationToken& cancel) {
    CommandExecutor executor(*handle_);
    return executor.Run(spec, cancel);
}

std::vector<std::string> Sandbox::AddFiles(const std::vector<FileToAdd>& files,
                                           FileOwner owner,
                                           bool read_only) {
    FileInjector injector(*handle_);
    return injector.AddFiles(files, owner, read_only);
}

std::string Sandbox::AddAndRenameFile(const std::filesystem::path& source,
                                      const std::string& new_name) {
    auto destinations = AddFiles({{source, new_name}});
    return destinations.front();
}

void Sandbox::Reset(const utils::CancellationToken& cancel) {
    spdlog::info("Resetting sandbox {}", handle_->Name());
    try {
        handle_->Destroy();
    } catch (const TeardownFailed& e) {
        spdlog::error("Teardown during reset failed: {}", e.what());
    }
    Provision(cancel);
}

void Sandbox::Restart() {
    handle_->Restart();
}

void Sandbox::Close() {
    if (handle_) {
        handle_->Destroy();
    }
}

} // namespace core
} // namespace warden
