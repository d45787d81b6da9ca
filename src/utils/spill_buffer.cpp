/**
 * @file spill_buffer.cpp
 * @brief Implementation of bounded spill-to-disk capture
 *
 * @date 2025
 */

#include "warden/utils/spill_buffer.hpp"

#include "warden/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <vector>

namespace warden {
namespace utils {

SpillBuffer::SpillBuffer(std::optional<std::size_t> ceiling,
                         std::size_t memory_threshold,
                         std::filesystem::path spill_directory)
    : ceiling_(ceiling)
    , memory_threshold_(memory_threshold)
    , spill_directory_(std::move(spill_directory)) {
    if (spill_directory_.empty()) {
        spill_directory_ = std::filesystem::temp_directory_path();
    }
}

SpillBuffer::~SpillBuffer() {
    if (spill_fd_ != -1) {
        close(spill_fd_);
    }
}

void SpillBuffer::Append(const char* data, std::size_t size) {
    bytes_seen_ += size;

    std::size_t keep = size;
    if (ceiling_) {
        keep = retained_ >= *ceiling_ ? 0 : std::min(size, *ceiling_ - retained_);
    }
    if (keep == 0) {
        return;
    }

    if (spill_fd_ == -1 && memory_.size() + keep > memory_threshold_) {
        SpillToDisk();
    }

    if (spill_fd_ == -1) {
        memory_.append(data, keep);
    } else if (!WriteAll(spill_fd_, data, keep)) {
        throw std::system_error(errno, std::generic_category(), "write to spill file");
    }
    retained_ += keep;
}

void SpillBuffer::SpillToDisk() {
    std::string pattern = (spill_directory_ / "warden-capture-XXXXXX").string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = mkostemp(name.data(), O_CLOEXEC);
    if (fd == -1) {
        throw std::system_error(errno, std::generic_category(), "mkostemp " + pattern);
    }
    // Anonymous from here on; the descriptor keeps the data alive.
    unlink(name.data());

    if (!WriteAll(fd, memory_.data(), memory_.size())) {
        int err = errno;
        close(fd);
        throw std::system_error(err, std::generic_category(), "write to spill file");
    }

    spdlog::debug("Capture spilled to disk after {} bytes", memory_.size());
    spill_fd_ = fd;
    std::string().swap(memory_);
}

std::size_t SpillBuffer::Read(std::size_t offset, char* out, std::size_t size) const {
    if (offset >= retained_) {
        return 0;
    }
    size = std::min(size, retained_ - offset);

    if (spill_fd_ == -1) {
        std::copy_n(memory_.data() + offset, size, out);
        return size;
    }

    std::size_t done = 0;
    while (done < size) {
        ssize_t n = pread(spill_fd_, out + done, size - done,
                          static_cast<off_t>(offset + done));
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "read spill file");
        }
        if (n == 0) {
            break;
        }
        done += static_cast<std::size_t>(n);
    }
    return done;
}

std::string SpillBuffer::ReadAll() const {
    if (spill_fd_ == -1) {
        return memory_;
    }
    std::string result(retained_, '\0');
    std::size_t n = Read(0, result.data(), retained_);
    result.resize(n);
    return result;
}

void SpillBuffer::CopyTo(std::ostream& out) const {
    std::array<char, 64 * 1024> chunk{};
    std::size_t offset = 0;
    while (offset < retained_) {
        std::size_t n = Read(offset, chunk.data(), chunk.size());
        if (n == 0) {
            break;
        }
        out.write(chunk.data(), static_cast<std::streamsize>(n));
        offset += n;
    }
}

} // namespace utils
} // namespace warden
