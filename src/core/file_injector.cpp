/**
 * @file file_injector.cpp
 * @brief Implementation of file injection through ownership-preserving archives
 *
 * @date 2025
 */

#include "warden/core/file_injector.hpp"

#include "warden/core/errors.hpp"
#include "warden/utils/archive_utils.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <csignal>
#include <fstream>
#include <system_error>

namespace warden {
namespace core {

namespace {

namespace fs = std::filesystem;

constexpr auto kCleanupTimeout = std::chrono::seconds(30);

std::string ArchivePath(const std::string& absolute) {
    std::size_t start = absolute.find_first_not_of('/');
    return start == std::string::npos ? std::string() : absolute.substr(start);
}

mode_t SourceMode(const fs::path& path) {
    return static_cast<mode_t>(fs::status(path).permissions() & fs::perms::mask) & 0777;
}

std::optional<std::string> CheckSource(const fs::path& source) {
    std::error_code ec;
    auto status = fs::status(source, ec);
    if (ec || !fs::exists(status)) {
        return std::string("not found");
    }
    if (fs::is_directory(status)) {
        return access(source.c_str(), R_OK | X_OK) == 0 ? std::nullopt
                                                        : std::optional<std::string>("not readable");
    }
    if (!fs::is_regular_file(status)) {
        return std::string("not a regular file or directory");
    }
    std::ifstream readable(source, std::ios::binary);
    if (!readable) {
        return std::string("not readable");
    }
    return std::nullopt;
}

} // anonymous namespace

FileInjector::FileInjector(ContainerHandle& handle)
    : handle_(handle) {}

std::string FileInjector::ResolveDestination(const FileToAdd& file) const {
    const fs::path working_dir(handle_.Settings().working_dir);

    if (!file.destination || file.destination->empty()) {
        return (working_dir / file.source.filename()).lexically_normal().string();
    }
    fs::path destination(*file.destination);
    if (destination.is_absolute()) {
        return destination.lexically_normal().string();
    }
    return (working_dir / destination).lexically_normal().string();
}

// ============================================================================
// ADD FILES
// ============================================================================

std::vector<std::string> FileInjector::AddFiles(const std::vector<FileToAdd>& files,
                                                FileOwner owner,
                                                bool read_only) {
    std::vector<FileInjectionFailed::FailedFile> failures;
    for (const auto& file : files) {
        if (auto problem = CheckSource(file.source)) {
            failures.push_back({file.source, *problem});
        }
    }
    if (!failures.empty()) {
        throw FileInjectionFailed(std::move(failures));
    }
    if (files.empty()) {
        return {};
    }

    ContainerHandle::Use use = handle_.BeginUse();

    const auto id = owner == FileOwner::kRoot ? uid_t{0} : static_cast<uid_t>(handle_.Uid());
    std::vector<std::string> destinations;
    bool copy_started = false;

    try {
        utils::ArchiveBuilder archive;
        for (const auto& file : files) {
            const std::string destination = ResolveDestination(file);
            const std::string root = ArchivePath(destination);
            if (root.empty()) {
                throw std::runtime_error("invalid destination " + destination);
            }

            if (fs::is_directory(file.source)) {
                archive.AddDirectory(root, id, id, read_only ? 0555 : SourceMode(file.source));
                for (const auto& entry : fs::recursive_directory_iterator(file.source)) {
                    const std::string member =
                        root + "/" + fs::relative(entry.path(), file.source).generic_string();
                    if (entry.is_directory()) {
                        archive.AddDirectory(member, id, id,
                                             read_only ? 0555 : SourceMode(entry.path()));
                    } else if (entry.is_regular_file()) {
                        archive.AddFile(entry.path(), member, id, id,
                                        read_only ? 0444 : SourceMode(entry.path()));
                    } else {
                        spdlog::warn("Skipping special file {}", entry.path().string());
                    }
                }
            } else {
                archive.AddFile(file.source, root, id, id,
                                read_only ? 0444 : SourceMode(file.source));
            }
            destinations.push_back(destination);
        }

        const auto& archive_path = archive.Finish();
        copy_started = true;
        handle_.Runtime().CopyArchive(handle_.Name(), "/", archive_path,
                                      handle_.Settings().container_create_timeout);
    } catch (const std::exception& e) {
        spdlog::error("Adding files to {} failed: {}", handle_.Name(), e.what());
        if (copy_started) {
            RemoveCopies(destinations);
        }

        std::vector<FileInjectionFailed::FailedFile> failed;
        for (const auto& file : files) {
            failed.push_back({file.source, e.what()});
        }
        if (!use.Finish()) {
            throw ExecutionFailed("Container " + handle_.Name() + " was destroyed while adding files");
        }
        throw FileInjectionFailed(std::move(failed));
    }

    if (!use.Finish()) {
        throw ExecutionFailed("Container " + handle_.Name() + " was destroyed while adding files");
    }

    spdlog::info("Added {} file(s) to {} (owner {}, {})", files.size(), handle_.Name(),
                 owner == FileOwner::kRoot ? "root" : std::to_string(id),
                 read_only ? "read-only" : "writable");
    return destinations;
}

void FileInjector::RemoveCopies(const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return;
    }

    runtime::ExecRequest request;
    request.argv = {"rm", "-rf", "--"};
    request.argv.insert(request.argv.end(), paths.begin(), paths.end());
    request.user = 0;
    request.pipe_stdin = false;

    try {
        auto proc = handle_.Runtime().Exec(handle_.Name(), request);
        auto status = proc->WaitUntil(std::chrono::steady_clock::now() + kCleanupTimeout);
        if (!status) {
            proc->Kill(SIGKILL);
            spdlog::warn("Cleanup of partial copies in {} timed out", handle_.Name());
        } else if (*status != 0) {
            spdlog::warn("Cleanup of partial copies in {} exited with {}", handle_.Name(), *status);
        }
    } catch (const std::system_error& e) {
        spdlog::warn("Cleanup of partial copies in {} failed: {}", handle_.Name(), e.what());
    }
}

} // namespace core
} // namespace warden
