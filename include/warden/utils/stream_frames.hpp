/**
 * @file stream_frames.hpp
 * @brief Framing used between the in-container runner and the host
 *
 * The runner multiplexes the command's stdout and stderr onto its own stdout
 * and finishes with one status frame. Every frame starts with an 8-byte
 * header, the same layout the Docker attach stream uses:
 *
 * ```
 * [type:1][0][0][0][payload length:4, big endian][payload]
 * ```
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace warden {
namespace utils {

/**
 * @enum FrameType
 * @brief Payload kind carried by a frame
 */
enum class FrameType : std::uint8_t {
    STDOUT = 1,  ///< Bytes the command wrote to stdout
    STDERR = 2,  ///< Bytes the command wrote to stderr
    STATUS = 3   ///< JSON status record, always the last frame
};

constexpr std::size_t kFrameHeaderSize = 8;
constexpr std::size_t kMaxFramePayload = 64 * 1024;

/**
 * @brief Build header + payload for one frame
 * @throws std::length_error if the payload exceeds kMaxFramePayload
 */
std::string EncodeFrame(FrameType type, const char* data, std::size_t size);

/**
 * @brief Encode and write one frame to @p fd
 * @return false if the write failed (reader gone)
 */
bool WriteFrame(int fd, FrameType type, const char* data, std::size_t size);

/**
 * @class FrameDecoder
 * @brief Incremental decoder for a framed byte stream
 *
 * Bytes may arrive split at any position; complete frames are handed to the
 * callback in order. Memory use is bounded by one frame.
 */
class FrameDecoder {
public:
    using FrameCallback = std::function<void(FrameType, const char*, std::size_t)>;

    explicit FrameDecoder(FrameCallback callback);

    /**
     * @brief Consume bytes from the stream
     * @throws std::runtime_error on an unknown frame type or oversized payload
     */
    void Feed(const char* data, std::size_t size);

    /**
     * @brief True when no partial frame is pending
     */
    bool AtFrameBoundary() const { return pending_.empty(); }

private:
    FrameCallback callback_;
    std::string pending_;
};

} // namespace utils
} // namespace warden
