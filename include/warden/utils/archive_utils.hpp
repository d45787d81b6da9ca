/**
 * @file archive_utils.hpp
 * @brief Tar archive construction for copying files into containers
 *
 * Ownership and permission bits are written into each tar header, so when
 * the runtime extracts the archive with ownership preserved, a file never
 * exists inside the container with different ownership or mode than
 * requested.
 *
 * @date 2025
 */

#pragma once

#include <sys/types.h>

#include <filesystem>
#include <string>
#include <vector>

struct archive;

namespace warden {
namespace utils {

/**
 * @class ArchiveBuilder
 * @brief Writes a tar archive into a temporary file
 *
 * Restricted pax: plain ustar headers, plus extended headers only for
 * members ustar cannot describe (long paths, files of 8 GiB or more).
 *
 * The temporary file is removed when the builder is destroyed.
 *
 * **Usage Example**:
 * @code
 * ArchiveBuilder builder;
 * builder.AddDirectory("home/warden/working_dir", uid, uid, 0755);
 * builder.AddFile("solution.cpp", "home/warden/working_dir/solution.cpp", uid, uid, 0444);
 * runtime.CopyArchive(container, "/", builder.Finish());
 * @endcode
 */
class ArchiveBuilder {
public:
    /**
     * @param directory Where to create the temporary archive (default: system temp dir)
     * @throws std::runtime_error if the archive cannot be opened
     */
    explicit ArchiveBuilder(const std::filesystem::path& directory = {});
    ~ArchiveBuilder();

    ArchiveBuilder(const ArchiveBuilder&) = delete;
    ArchiveBuilder& operator=(const ArchiveBuilder&) = delete;

    /**
     * @brief Add a regular file with its content read from @p source
     * @throws std::runtime_error if @p source cannot be read or the write fails
     */
    void AddFile(const std::filesystem::path& source, const std::string& archive_path,
                 uid_t uid, gid_t gid, mode_t mode);

    /**
     * @brief Add a directory member
     */
    void AddDirectory(const std::string& archive_path, uid_t uid, gid_t gid, mode_t mode);

    /**
     * @brief Close the archive
     * @return Path of the finished archive file
     */
    const std::filesystem::path& Finish();

    const std::vector<std::string>& EntryPaths() const { return entry_paths_; }

private:
    void CheckOpen() const;

    std::filesystem::path path_;
    struct archive* archive_{nullptr};
    bool finished_{false};
    std::vector<std::string> entry_paths_;
};

} // namespace utils
} // namespace warden
