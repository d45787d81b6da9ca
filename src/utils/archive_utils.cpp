/**
 * @file archive_utils.cpp
 * @brief Implementation of tar archive construction
 *
 * @date 2025
 */

#include "warden/utils/archive_utils.hpp"

#include "warden/utils/process_utils.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <ctime>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace warden {
namespace utils {

namespace {

constexpr std::size_t kCopyBufferSize = 1 << 16;

struct EntryDeleter {
    void operator()(archive_entry* entry) const { archive_entry_free(entry); }
};

using EntryPtr = std::unique_ptr<archive_entry, EntryDeleter>;

EntryPtr NewEntry(const std::string& archive_path, uid_t uid, gid_t gid, mode_t mode) {
    EntryPtr entry(archive_entry_new());
    if (!entry) {
        throw std::runtime_error("archive_entry_new() failed");
    }
    archive_entry_set_pathname(entry.get(), archive_path.c_str());
    archive_entry_set_uid(entry.get(), uid);
    archive_entry_set_gid(entry.get(), gid);
    archive_entry_set_perm(entry.get(), mode & 07777);
    archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);
    return entry;
}

} // anonymous namespace

// ============================================================================
// ARCHIVE BUILDER
// ============================================================================

ArchiveBuilder::ArchiveBuilder(const std::filesystem::path& directory) {
    std::filesystem::path base = directory.empty() ? std::filesystem::temp_directory_path()
                                                   : directory;
    std::string pattern = (base / "warden-archive.XXXXXX").string();

    int fd = mkostemp(pattern.data(), O_CLOEXEC);
    if (fd == -1) {
        throw std::runtime_error("Failed to create archive file in " + base.string() + ": " +
                                 ErrnoMessage(errno));
    }
    close(fd);
    path_ = pattern;

    archive_ = archive_write_new();
    if (!archive_) {
        std::filesystem::remove(path_);
        throw std::runtime_error("archive_write_new() failed");
    }

    if (archive_write_set_format_pax_restricted(archive_) != ARCHIVE_OK ||
        archive_write_open_filename(archive_, path_.c_str()) != ARCHIVE_OK) {
        std::string message = archive_error_string(archive_) ? archive_error_string(archive_)
                                                             : "unknown error";
        archive_write_free(archive_);
        archive_ = nullptr;
        std::filesystem::remove(path_);
        throw std::runtime_error("archive_write_open_filename() - " + message);
    }
}

ArchiveBuilder::~ArchiveBuilder() {
    if (archive_) {
        archive_write_free(archive_);
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove archive {}: {}", path_.string(), ec.message());
    }
}

void ArchiveBuilder::CheckOpen() const {
    if (finished_) {
        throw std::logic_error("Archive already finished");
    }
}

void ArchiveBuilder::AddFile(const std::filesystem::path& source,
                             const std::string& archive_path,
                             uid_t uid, gid_t gid, mode_t mode) {
    CheckOpen();

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot read " + source.string());
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(source, ec);
    if (ec) {
        throw std::runtime_error("Cannot stat " + source.string() + ": " + ec.message());
    }

    EntryPtr entry = NewEntry(archive_path, uid, gid, mode);
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));

    if (archive_write_header(archive_, entry.get()) != ARCHIVE_OK) {
        throw std::runtime_error(std::string("archive_write_header() - ") +
                                 archive_error_string(archive_));
    }

    // Writes exactly the size recorded in the header; a file that changes
    // underneath us is padded or cut by libarchive.
    char buffer[kCopyBufferSize];
    std::uintmax_t written = 0;
    while (written < size && in) {
        in.read(buffer, sizeof(buffer));
        std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        if (archive_write_data(archive_, buffer, static_cast<std::size_t>(got)) < 0) {
            throw std::runtime_error(std::string("archive_write_data() - ") +
                                     archive_error_string(archive_));
        }
        written += static_cast<std::uintmax_t>(got);
    }
    if (in.bad()) {
        throw std::runtime_error("Read error on " + source.string());
    }

    if (archive_write_finish_entry(archive_) != ARCHIVE_OK) {
        throw std::runtime_error(std::string("archive_write_finish_entry() - ") +
                                 archive_error_string(archive_));
    }

    entry_paths_.push_back(archive_path);
    spdlog::debug("Archived {} as {} ({} bytes, {}:{} {:o})",
                  source.string(), archive_path, size, uid, gid, mode);
}

void ArchiveBuilder::AddDirectory(const std::string& archive_path,
                                  uid_t uid, gid_t gid, mode_t mode) {
    CheckOpen();

    EntryPtr entry = NewEntry(archive_path, uid, gid, mode);
    archive_entry_set_filetype(entry.get(), AE_IFDIR);
    archive_entry_set_size(entry.get(), 0);

    if (archive_write_header(archive_, entry.get()) != ARCHIVE_OK) {
        throw std::runtime_error(std::string("archive_write_header() - ") +
                                 archive_error_string(archive_));
    }
    entry_paths_.push_back(archive_path);
}

const std::filesystem::path& ArchiveBuilder::Finish() {
    if (!finished_) {
        if (archive_write_close(archive_) != ARCHIVE_OK) {
            throw std::runtime_error(std::string("archive_write_close() - ") +
                                     archive_error_string(archive_));
        }
        archive_write_free(archive_);
        archive_ = nullptr;
        finished_ = true;
    }
    return path_;
}

} // namespace utils
} // namespace warden
