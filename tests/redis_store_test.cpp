/**
 * @file redis_store_test.cpp
 * @brief RESP codec tests; live-server tests run when WARDEN_REDIS_TESTS is set
 *
 * WARDEN_REDIS_TESTS=host:port (or "1" for localhost:6379) enables the
 * integration tests. They use keys under "warden-test:".
 *
 * @date 2025
 */

#include <gtest/gtest.h>

#include "warden/coordination/redis_store.hpp"
#include "warden/core/errors.hpp"
#include "warden/core/uid_pool.hpp"

#include <cstdlib>
#include <set>

using namespace warden;
using coordination::ParseRedisReply;
using coordination::RedisReply;

TEST(RedisProtocol, EncodesCommandAsBulkArray) {
    EXPECT_EQ(coordination::EncodeRedisCommand({"SPOP", "warden:uids"}),
              "*2\r\n$4\r\nSPOP\r\n$11\r\nwarden:uids\r\n");
    EXPECT_EQ(coordination::EncodeRedisCommand({"SET", "k", ""}),
              "*3\r\n$3\r\nSET\r\n$1\r\nk\r\n$0\r\n\r\n");
}

TEST(RedisProtocol, ParsesScalarReplies) {
    std::string buffer = "+OK\r\n-ERR wrong type\r\n:42\r\n:-7\r\n$5\r\nhello\r\n$-1\r\n";
    std::size_t pos = 0;

    auto status = ParseRedisReply(buffer, pos);
    ASSERT_TRUE(status);
    EXPECT_EQ(status->type, RedisReply::Type::STATUS);
    EXPECT_EQ(status->str, "OK");

    auto error = ParseRedisReply(buffer, pos);
    ASSERT_TRUE(error);
    EXPECT_EQ(error->type, RedisReply::Type::ERROR);
    EXPECT_EQ(error->str, "ERR wrong type");

    auto positive = ParseRedisReply(buffer, pos);
    ASSERT_TRUE(positive);
    EXPECT_EQ(positive->integer, 42);

    auto negative = ParseRedisReply(buffer, pos);
    ASSERT_TRUE(negative);
    EXPECT_EQ(negative->integer, -7);

    auto bulk = ParseRedisReply(buffer, pos);
    ASSERT_TRUE(bulk);
    EXPECT_EQ(bulk->type, RedisReply::Type::STRING);
    EXPECT_EQ(bulk->str, "hello");

    auto nil = ParseRedisReply(buffer, pos);
    ASSERT_TRUE(nil);
    EXPECT_EQ(nil->type, RedisReply::Type::NIL);
    EXPECT_EQ(pos, buffer.size());
}

TEST(RedisProtocol, BulkStringMayContainCrlf) {
    std::string buffer = "$4\r\na\r\nb\r\n";
    std::size_t pos = 0;
    auto reply = ParseRedisReply(buffer, pos);
    ASSERT_TRUE(reply);
    EXPECT_EQ(reply->str, "a\r\nb");
}

TEST(RedisProtocol, ParsesNestedArray) {
    std::string buffer = "*2\r\n:1\r\n*1\r\n$1\r\nx\r\n";
    std::size_t pos = 0;
    auto reply = ParseRedisReply(buffer, pos);
    ASSERT_TRUE(reply);
    ASSERT_EQ(reply->type, RedisReply::Type::ARRAY);
    ASSERT_EQ(reply->elements.size(), 2u);
    EXPECT_EQ(reply->elements[0].integer, 1);
    ASSERT_EQ(reply->elements[1].elements.size(), 1u);
    EXPECT_EQ(reply->elements[1].elements[0].str, "x");
}

TEST(RedisProtocol, IncompleteInputLeavesPositionUnchanged) {
    for (std::string partial : {"", "+OK", "$5\r\nhel", "*2\r\n:1\r\n"}) {
        std::size_t pos = 0;
        EXPECT_FALSE(ParseRedisReply(partial, pos)) << partial;
        EXPECT_EQ(pos, 0u);
    }
}

TEST(RedisProtocol, MalformedInputThrows) {
    for (std::string bad : {"?x\r\n", ":12a\r\n", "$3\r\nabcde\r\n"}) {
        std::size_t pos = 0;
        EXPECT_THROW(ParseRedisReply(bad, pos), core::StoreError) << bad;
    }
}

namespace {

class RedisIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* target = std::getenv("WARDEN_REDIS_TESTS");
        if (target == nullptr || *target == '\0') {
            GTEST_SKIP() << "WARDEN_REDIS_TESTS not set";
        }
        std::string value(target);
        auto colon = value.rfind(':');
        if (colon != std::string::npos) {
            host_ = value.substr(0, colon);
            port_ = std::stoi(value.substr(colon + 1));
        }
        store_ = std::make_unique<coordination::RedisCoordinationStore>(host_, port_);
        store_->DeleteKey("warden-test:set");
        store_->DeleteKey("warden-test:uids");
        store_->DeleteKey("warden-test:uids:initialized");
    }

    std::string host_{"localhost"};
    int port_{6379};
    std::unique_ptr<coordination::RedisCoordinationStore> store_;
};

} // namespace

TEST_F(RedisIntegrationTest, SetOperations) {
    EXPECT_EQ(store_->AddMembers("warden-test:set", {"1", "2", "2"}), 2u);
    EXPECT_EQ(store_->MemberCount("warden-test:set"), 2u);

    std::set<std::string> popped;
    while (auto member = store_->PopMember("warden-test:set")) {
        popped.insert(*member);
    }
    EXPECT_EQ(popped, (std::set<std::string>{"1", "2"}));
    EXPECT_FALSE(store_->PopMember("warden-test:set"));
}

TEST_F(RedisIntegrationTest, PoolAcrossTwoClients) {
    coordination::RedisCoordinationStore other(host_, port_);

    core::UidPoolConfig config;
    config.key = "warden-test:uids";
    config.first_uid = 7000;
    config.pool_size = 2;
    config.acquire_timeout = std::chrono::milliseconds(300);

    core::UidPool a(*store_, config);
    core::UidPool b(other, config);
    EXPECT_TRUE(a.Initialize());
    EXPECT_FALSE(b.Initialize());

    auto first = a.Acquire();
    auto second = b.Acquire();
    EXPECT_NE(first.Token(), second.Token());
    EXPECT_THROW(b.Acquire(), core::PoolExhausted);

    first.Release();
    auto third = b.Acquire();
    EXPECT_EQ(third.Token(), 7000 + 7001 - second.Token());
}

TEST(RedisStore, UnreachableServerThrowsStoreError) {
    coordination::RedisCoordinationStore store("127.0.0.1", 1, std::chrono::milliseconds(200));
    EXPECT_THROW(store.MemberCount("anything"), core::StoreError);
}
