/**
 * @file stream_frames.cpp
 * @brief Implementation of the runner/host frame codec
 *
 * @date 2025
 */

#include "warden/utils/stream_frames.hpp"

#include "warden/utils/process_utils.hpp"

#include <stdexcept>

namespace warden {
namespace utils {

namespace {

bool IsKnownType(std::uint8_t type) {
    return type >= static_cast<std::uint8_t>(FrameType::STDOUT) &&
           type <= static_cast<std::uint8_t>(FrameType::STATUS);
}

std::uint32_t ReadLength(const char* header) {
    auto byte = [header](int i) { return static_cast<std::uint32_t>(static_cast<unsigned char>(header[i])); };
    return (byte(4) << 24) | (byte(5) << 16) | (byte(6) << 8) | byte(7);
}

} // anonymous namespace

std::string EncodeFrame(FrameType type, const char* data, std::size_t size) {
    if (size > kMaxFramePayload) {
        throw std::length_error("Frame payload too large: " + std::to_string(size));
    }

    std::string frame(kFrameHeaderSize, '\0');
    frame[0] = static_cast<char>(type);
    frame[4] = static_cast<char>((size >> 24) & 0xff);
    frame[5] = static_cast<char>((size >> 16) & 0xff);
    frame[6] = static_cast<char>((size >> 8) & 0xff);
    frame[7] = static_cast<char>(size & 0xff);
    frame.append(data, size);
    return frame;
}

bool WriteFrame(int fd, FrameType type, const char* data, std::size_t size) {
    std::string frame = EncodeFrame(type, data, size);
    return WriteAll(fd, frame.data(), frame.size());
}

FrameDecoder::FrameDecoder(FrameCallback callback)
    : callback_(std::move(callback)) {}

void FrameDecoder::Feed(const char* data, std::size_t size) {
    pending_.append(data, size);

    std::size_t offset = 0;
    while (pending_.size() - offset >= kFrameHeaderSize) {
        const char* header = pending_.data() + offset;
        auto type = static_cast<std::uint8_t>(header[0]);
        if (!IsKnownType(type)) {
            throw std::runtime_error("Unknown frame type " + std::to_string(type));
        }

        std::uint32_t length = ReadLength(header);
        if (length > kMaxFramePayload) {
            throw std::runtime_error("Frame payload too large: " + std::to_string(length));
        }
        if (pending_.size() - offset - kFrameHeaderSize < length) {
            break;
        }

        callback_(static_cast<FrameType>(type), header + kFrameHeaderSize, length);
        offset += kFrameHeaderSize + length;
    }

    pending_.erase(0, offset);
}

} // namespace utils
} // namespace warden
