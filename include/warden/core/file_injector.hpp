/**
 * @file file_injector.hpp
 * @brief Copies host files into a container with fixed ownership and mode
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "warden/core/container_handle.hpp"

namespace warden {
namespace core {

/**
 * @enum FileOwner
 * @brief Who owns injected files inside the container
 */
enum class FileOwner {
    kSandboxUser,  ///< The handle's leased UID
    kRoot          ///< root:root
};

/**
 * @struct FileToAdd
 * @brief One host file or directory and where it goes
 */
struct FileToAdd {
    std::filesystem::path source;             ///< Host path
    std::optional<std::string> destination;   ///< Empty = basename in the working dir;
                                              ///< relative paths resolve against it
};

/**
 * @class FileInjector
 * @brief Adds files to a READY ContainerHandle
 *
 * Every file of one call travels in a single tar archive whose headers carry
 * the final owner and mode, so files never appear in the container with
 * other permissions. Directories are copied recursively.
 *
 * **Usage Example**:
 * @code
 * FileInjector injector(handle);
 * injector.AddFiles({{"tests/input.txt"}, {"solution.py", "src/main.py"}},
 *                   FileOwner::kSandboxUser, true);
 * @endcode
 */
class FileInjector {
public:
    explicit FileInjector(ContainerHandle& handle);

    /**
     * @brief Copy @p files into the container
     *
     * @param files Sources and destinations
     * @param owner Owner of the copies
     * @param read_only Files get mode 0444 (directories 0555)
     * @return Absolute container paths of the copies, in input order
     *
     * @throws FileInjectionFailed if a source is missing or unreadable (before
     *         the container is touched) or the copy fails
     * @throws ExecutionFailed if the handle is not READY
     */
    std::vector<std::string> AddFiles(const std::vector<FileToAdd>& files,
                                      FileOwner owner = FileOwner::kSandboxUser,
                                      bool read_only = false);

    /**
     * @brief Absolute container path for @p file
     */
    std::string ResolveDestination(const FileToAdd& file) const;

private:
    void RemoveCopies(const std::vector<std::string>& paths);

    ContainerHandle& handle_;
};

} // namespace core
} // namespace warden
