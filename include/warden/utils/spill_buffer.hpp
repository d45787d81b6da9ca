/**
 * @file spill_buffer.hpp
 * @brief Bounded output capture that spills to disk
 *
 * Output of untrusted code is adversarial by construction: it may be far
 * larger than memory. SpillBuffer keeps the first bytes in memory and moves
 * everything to an unlinked temporary file once a threshold is crossed.
 * An optional ceiling caps how much is retained; bytes past the ceiling are
 * counted and discarded.
 *
 * The running byte counter is the only input to truncation decisions.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace warden {
namespace utils {

/**
 * @class SpillBuffer
 * @brief Growable byte sink with memory threshold and optional ceiling
 *
 * **Thread Safety**: one writer; read only after the writer is done.
 */
class SpillBuffer {
public:
    static constexpr std::size_t kDefaultMemoryThreshold = 1024 * 1024;

    /**
     * @param ceiling Maximum number of bytes retained (empty = unbounded)
     * @param memory_threshold Bytes kept in memory before spilling
     * @param spill_directory Where the temporary file is created
     */
    explicit SpillBuffer(std::optional<std::size_t> ceiling = std::nullopt,
                         std::size_t memory_threshold = kDefaultMemoryThreshold,
                         std::filesystem::path spill_directory = {});

    ~SpillBuffer();

    SpillBuffer(const SpillBuffer&) = delete;
    SpillBuffer& operator=(const SpillBuffer&) = delete;

    /**
     * @brief Append bytes, honoring the ceiling
     * @throws std::system_error if the spill file cannot be created or written
     */
    void Append(const char* data, std::size_t size);
    void Append(const std::string& data) { Append(data.data(), data.size()); }

    /**
     * @brief Total bytes offered to Append(), retained or not
     */
    std::size_t BytesSeen() const { return bytes_seen_; }

    /**
     * @brief Bytes retained (never more than the ceiling)
     */
    std::size_t Size() const { return retained_; }

    bool Truncated() const { return bytes_seen_ > retained_; }
    bool Spilled() const { return spill_fd_ != -1; }
    const std::optional<std::size_t>& Ceiling() const { return ceiling_; }

    /**
     * @brief Copy up to @p size retained bytes starting at @p offset
     * @return Number of bytes copied
     */
    std::size_t Read(std::size_t offset, char* out, std::size_t size) const;

    /**
     * @brief Load every retained byte into a string
     */
    std::string ReadAll() const;

    /**
     * @brief Stream every retained byte without loading it all at once
     */
    void CopyTo(std::ostream& out) const;

private:
    void SpillToDisk();

    std::optional<std::size_t> ceiling_;
    std::size_t memory_threshold_;
    std::filesystem::path spill_directory_;

    std::string memory_;
    int spill_fd_{-1};
    std::size_t retained_{0};
    std::size_t bytes_seen_{0};
};

} // namespace utils
} // namespace warden
