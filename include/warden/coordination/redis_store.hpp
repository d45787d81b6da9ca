/**
 * @file redis_store.hpp
 * @brief Coordination store on a Redis server
 *
 * Speaks RESP over a plain TCP connection. Only SPOP, SADD, SCARD,
 * SET NX and DEL are issued, each a single atomic server-side command.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "warden/coordination/coordination_store.hpp"

namespace warden {
namespace coordination {

/**
 * @struct RedisReply
 * @brief One decoded RESP value
 */
struct RedisReply {
    enum class Type {
        STATUS,   ///< +OK
        ERROR,    ///< -ERR ...
        INTEGER,  ///< :42
        STRING,   ///< $3 foo
        NIL,      ///< $-1 or *-1
        ARRAY     ///< *N ...
    };

    Type type{Type::NIL};
    std::string str;                    ///< STATUS, ERROR and STRING payload
    std::int64_t integer{0};            ///< INTEGER payload
    std::vector<RedisReply> elements;   ///< ARRAY members
};

/**
 * @brief Encode a command as a RESP array of bulk strings
 */
std::string EncodeRedisCommand(const std::vector<std::string>& args);

/**
 * @brief Decode one reply starting at @p pos
 *
 * @param buffer Received bytes
 * @param pos In: start offset. Out: offset past the reply (only on success)
 * @return The reply, or empty if @p buffer does not hold a complete one yet
 * @throws core::StoreError on malformed input
 */
std::optional<RedisReply> ParseRedisReply(const std::string& buffer, std::size_t& pos);

/**
 * @class RedisCoordinationStore
 * @brief CoordinationStore backed by a Redis server
 *
 * The connection is opened lazily and reopened after an I/O failure; a
 * failed command is reported, never retried, since it may already have
 * taken effect on the server.
 *
 * **Thread Safety**: Thread-safe; commands are serialized on one connection.
 *
 * **Usage Example**:
 * @code
 * RedisCoordinationStore store("localhost", 6379);
 * auto member = store.PopMember("warden:available_uids");
 * @endcode
 */
class RedisCoordinationStore : public CoordinationStore {
public:
    RedisCoordinationStore(std::string host, int port,
                           std::chrono::milliseconds io_timeout = std::chrono::seconds(5));
    ~RedisCoordinationStore() override;

    RedisCoordinationStore(const RedisCoordinationStore&) = delete;
    RedisCoordinationStore& operator=(const RedisCoordinationStore&) = delete;

    std::optional<std::string> PopMember(const std::string& key) override;
    std::size_t AddMembers(const std::string& key,
                           const std::vector<std::string>& members) override;
    std::size_t MemberCount(const std::string& key) override;
    bool SetIfAbsent(const std::string& key, const std::string& value) override;
    void DeleteKey(const std::string& key) override;

    /**
     * @brief Send one command and wait for its reply
     * @throws core::StoreError on I/O failure or an error reply
     */
    RedisReply Command(const std::vector<std::string>& args);

private:
    void Connect();
    void Disconnect();
    RedisReply ReadReply();

    std::string host_;
    int port_;
    std::chrono::milliseconds io_timeout_;

    std::mutex mutex_;
    int fd_{-1};
    std::string read_buffer_;
};

} // namespace coordination
} // namespace warden
