/**
 * @file redis_store.cpp
 * @brief RESP client used by the Redis coordination store
 *
 * **Wire Format** (RESP2):
 * ```
 * request:  *<argc>\r\n  then per argument  $<len>\r\n<bytes>\r\n
 * replies:  +status  -error  :integer  $len bulk / $-1 nil  *count array / *-1 nil
 * ```
 *
 * @date 2025
 */

#include "warden/coordination/redis_store.hpp"

#include "warden/core/errors.hpp"
#include "warden/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace warden {
namespace coordination {

using core::StoreError;

namespace {

constexpr std::size_t kMaxBulkLength = 512 * 1024 * 1024;

// Position of the CRLF ending the line that starts at pos, or npos.
std::size_t FindLineEnd(const std::string& buffer, std::size_t pos) {
    return buffer.find("\r\n", pos);
}

std::int64_t ParseInteger(const std::string& text) {
    if (text.empty()) {
        throw StoreError("Malformed RESP integer: empty");
    }
    std::size_t i = text[0] == '-' ? 1 : 0;
    if (i == text.size()) {
        throw StoreError("Malformed RESP integer: '" + text + "'");
    }
    std::int64_t value = 0;
    for (; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') {
            throw StoreError("Malformed RESP integer: '" + text + "'");
        }
        value = value * 10 + (text[i] - '0');
    }
    return text[0] == '-' ? -value : value;
}

timeval ToTimeval(std::chrono::milliseconds ms) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

std::size_t AsCount(const RedisReply& reply, const char* command) {
    if (reply.type != RedisReply::Type::INTEGER || reply.integer < 0) {
        throw StoreError(std::string("Unexpected reply to ") + command);
    }
    return static_cast<std::size_t>(reply.integer);
}

} // anonymous namespace

// ============================================================================
// PROTOCOL
// ============================================================================

std::string EncodeRedisCommand(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        out += "$" + std::to_string(arg.size()) + "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

std::optional<RedisReply> ParseRedisReply(const std::string& buffer, std::size_t& pos) {
    if (pos >= buffer.size()) {
        return std::nullopt;
    }

    std::size_t line_end = FindLineEnd(buffer, pos);
    if (line_end == std::string::npos) {
        return std::nullopt;
    }

    const char marker = buffer[pos];
    const std::string line = buffer.substr(pos + 1, line_end - pos - 1);
    std::size_t next = line_end + 2;

    RedisReply reply;
    switch (marker) {
        case '+':
            reply.type = RedisReply::Type::STATUS;
            reply.str = line;
            break;

        case '-':
            reply.type = RedisReply::Type::ERROR;
            reply.str = line;
            break;

        case ':':
            reply.type = RedisReply::Type::INTEGER;
            reply.integer = ParseInteger(line);
            break;

        case '$': {
            std::int64_t length = ParseInteger(line);
            if (length < 0) {
                reply.type = RedisReply::Type::NIL;
                break;
            }
            if (static_cast<std::size_t>(length) > kMaxBulkLength) {
                throw StoreError("RESP bulk string too large: " + line);
            }
            auto size = static_cast<std::size_t>(length);
            if (buffer.size() < next + size + 2) {
                return std::nullopt;
            }
            if (buffer.compare(next + size, 2, "\r\n") != 0) {
                throw StoreError("RESP bulk string not terminated by CRLF");
            }
            reply.type = RedisReply::Type::STRING;
            reply.str = buffer.substr(next, size);
            next += size + 2;
            break;
        }

        case '*': {
            std::int64_t count = ParseInteger(line);
            if (count < 0) {
                reply.type = RedisReply::Type::NIL;
                break;
            }
            reply.type = RedisReply::Type::ARRAY;
            for (std::int64_t i = 0; i < count; ++i) {
                auto element = ParseRedisReply(buffer, next);
                if (!element) {
                    return std::nullopt;
                }
                reply.elements.push_back(std::move(*element));
            }
            break;
        }

        default:
            throw StoreError(std::string("Unknown RESP type marker '") + marker + "'");
    }

    pos = next;
    return reply;
}

// ============================================================================
// CONNECTION
// ============================================================================

RedisCoordinationStore::RedisCoordinationStore(std::string host, int port,
                                               std::chrono::milliseconds io_timeout)
    : host_(std::move(host))
    , port_(port)
    , io_timeout_(io_timeout) {}

RedisCoordinationStore::~RedisCoordinationStore() {
    Disconnect();
}

void RedisCoordinationStore::Connect() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    const std::string port = std::to_string(port_);
    int rc = getaddrinfo(host_.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw StoreError("Cannot resolve " + host_ + ": " + gai_strerror(rc));
    }

    std::string last_error = "no addresses";
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd == -1) {
            last_error = utils::ErrnoMessage(errno);
            continue;
        }

        timeval tv = ToTimeval(io_timeout_);
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        int one = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd_ = fd;
            break;
        }
        last_error = utils::ErrnoMessage(errno);
        close(fd);
    }
    freeaddrinfo(result);

    if (fd_ == -1) {
        throw StoreError("Cannot connect to Redis at " + host_ + ":" + port + ": " + last_error);
    }
    read_buffer_.clear();
    spdlog::debug("Connected to Redis at {}:{}", host_, port_);
}

void RedisCoordinationStore::Disconnect() {
    if (fd_ != -1) {
        close(fd_);
        fd_ = -1;
    }
    read_buffer_.clear();
}

RedisReply RedisCoordinationStore::ReadReply() {
    char chunk[4096];
    while (true) {
        std::size_t pos = 0;
        if (auto reply = ParseRedisReply(read_buffer_, pos)) {
            read_buffer_.erase(0, pos);
            return std::move(*reply);
        }

        ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
        if (n > 0) {
            read_buffer_.append(chunk, static_cast<std::size_t>(n));
        } else if (n == 0) {
            throw StoreError("Redis closed the connection");
        } else if (errno != EINTR) {
            throw StoreError("Redis read failed: " + utils::ErrnoMessage(errno));
        }
    }
}

RedisReply RedisCoordinationStore::Command(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fd_ == -1) {
        Connect();
    }

    const std::string request = EncodeRedisCommand(args);
    RedisReply reply;
    try {
        const char* data = request.data();
        std::size_t left = request.size();
        while (left > 0) {
            ssize_t n = send(fd_, data, left, MSG_NOSIGNAL);
            if (n == -1) {
                if (errno == EINTR) {
                    continue;
                }
                throw StoreError("Redis write failed: " + utils::ErrnoMessage(errno));
            }
            data += n;
            left -= static_cast<std::size_t>(n);
        }
        reply = ReadReply();
    } catch (const StoreError&) {
        Disconnect();
        throw;
    }

    if (reply.type == RedisReply::Type::ERROR) {
        throw StoreError("Redis " + args.front() + " failed: " + reply.str);
    }
    return reply;
}

// ============================================================================
// STORE OPERATIONS
// ============================================================================

std::optional<std::string> RedisCoordinationStore::PopMember(const std::string& key) {
    auto reply = Command({"SPOP", key});
    if (reply.type == RedisReply::Type::NIL) {
        return std::nullopt;
    }
    if (reply.type != RedisReply::Type::STRING) {
        throw StoreError("Unexpected reply to SPOP");
    }
    return reply.str;
}

std::size_t RedisCoordinationStore::AddMembers(const std::string& key,
                                               const std::vector<std::string>& members) {
    if (members.empty()) {
        return 0;
    }
    std::vector<std::string> args = {"SADD", key};
    args.insert(args.end(), members.begin(), members.end());
    return AsCount(Command(args), "SADD");
}

std::size_t RedisCoordinationStore::MemberCount(const std::string& key) {
    return AsCount(Command({"SCARD", key}), "SCARD");
}

bool RedisCoordinationStore::SetIfAbsent(const std::string& key, const std::string& value) {
    auto reply = Command({"SET", key, value, "NX"});
    return reply.type == RedisReply::Type::STATUS;
}

void RedisCoordinationStore::DeleteKey(const std::string& key) {
    Command({"DEL", key});
}

} // namespace coordination
} // namespace warden
