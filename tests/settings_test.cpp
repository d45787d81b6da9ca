/**
 * @file settings_test.cpp
 * @brief Tests for configuration defaults, environment and JSON overrides
 *
 * @date 2025
 */

#include <gtest/gtest.h>

#include "warden/core/settings.hpp"

#include <cstdlib>
#include <fstream>

using warden::core::SandboxSettings;
using json = nlohmann::json;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST(Settings, Defaults) {
    SandboxSettings settings;
    EXPECT_EQ(settings.docker_image, "eecsautograder/ubuntu22:latest");
    EXPECT_EQ(settings.memory_limit, 4LL * 1024 * 1024 * 1024);
    EXPECT_EQ(settings.pids_limit, 512);
    EXPECT_FALSE(settings.cpu_core_limit.has_value());
    EXPECT_EQ(settings.container_create_timeout, std::chrono::seconds(60));
    EXPECT_EQ(settings.redis_port, 6379);
    EXPECT_FALSE(settings.host_runner_path.empty());

    auto limits = settings.DefaultLimits();
    EXPECT_EQ(limits.memory_bytes, settings.memory_limit);
    EXPECT_EQ(limits.pids_limit, 512);
    EXPECT_FALSE(settings.block_process_spawn);
    EXPECT_FALSE(limits.block_process_spawn);
    EXPECT_FALSE(limits.allow_network);
}

TEST(Settings, EnvironmentOverrides) {
    ScopedEnv image("WARDEN_DOCKER_IMAGE", "python:3.12-slim");
    ScopedEnv memory("WARDEN_MEM_LIMIT", "512m");
    ScopedEnv pids("WARDEN_PIDS_LIMIT", "64");
    ScopedEnv cpus("WARDEN_CPU_CORE_LIMIT", "1.5");
    ScopedEnv host("WARDEN_REDIS_HOST", "redis.internal");
    ScopedEnv timeout("WARDEN_CONTAINER_CREATE_TIMEOUT", "15");

    auto settings = SandboxSettings::FromEnvironment();
    EXPECT_EQ(settings.docker_image, "python:3.12-slim");
    EXPECT_EQ(settings.memory_limit, 512LL * 1024 * 1024);
    EXPECT_EQ(settings.pids_limit, 64);
    ASSERT_TRUE(settings.cpu_core_limit.has_value());
    EXPECT_DOUBLE_EQ(*settings.cpu_core_limit, 1.5);
    EXPECT_EQ(settings.redis_host, "redis.internal");
    EXPECT_EQ(settings.container_create_timeout, std::chrono::seconds(15));
}

TEST(Settings, BlockProcessSpawnReachesDefaultLimits) {
    {
        ScopedEnv block("WARDEN_BLOCK_PROCESS_SPAWN", "true");
        auto settings = SandboxSettings::FromEnvironment();
        EXPECT_TRUE(settings.block_process_spawn);
        EXPECT_TRUE(settings.DefaultLimits().block_process_spawn);
    }
    {
        ScopedEnv block("WARDEN_BLOCK_PROCESS_SPAWN", "0");
        EXPECT_FALSE(SandboxSettings::FromEnvironment().block_process_spawn);
    }
    {
        ScopedEnv block("WARDEN_BLOCK_PROCESS_SPAWN", "sometimes");
        EXPECT_THROW(SandboxSettings::FromEnvironment(), std::invalid_argument);
    }

    SandboxSettings settings;
    settings.Apply(json{{"block_process_spawn", true}});
    EXPECT_TRUE(settings.DefaultLimits().block_process_spawn);
    EXPECT_EQ(settings.ToJson()["block_process_spawn"], true);
    EXPECT_THROW(settings.Apply(json{{"block_process_spawn", "yes"}}), std::invalid_argument);
}

TEST(Settings, MalformedEnvironmentValue) {
    ScopedEnv pids("WARDEN_PIDS_LIMIT", "many");
    EXPECT_THROW(SandboxSettings::FromEnvironment(), std::invalid_argument);
}

TEST(Settings, ApplyJson) {
    SandboxSettings settings;
    settings.Apply(json{{"memory_limit", "2g"},
                        {"pids_limit", 128},
                        {"cpuset", "0-3"},
                        {"uid_pool_first", 3000},
                        {"uid_acquire_timeout_s", 5}});

    EXPECT_EQ(settings.memory_limit, 2LL * 1024 * 1024 * 1024);
    EXPECT_EQ(settings.pids_limit, 128);
    EXPECT_EQ(settings.cpuset.value_or(""), "0-3");
    EXPECT_EQ(settings.uid_pool_first, 3000);
    EXPECT_EQ(settings.uid_acquire_timeout, std::chrono::seconds(5));

    settings.Apply(json{{"memory_limit", 1048576}, {"cpuset", nullptr}});
    EXPECT_EQ(settings.memory_limit, 1048576);
    EXPECT_FALSE(settings.cpuset.has_value());

    EXPECT_THROW(settings.Apply(json{{"pids_limit", "lots"}}), std::invalid_argument);
}

TEST(Settings, JsonFileRoundTrip) {
    SandboxSettings original;
    original.docker_image = "alpine:3.20";
    original.cpu_core_limit = 0.5;
    original.working_dir = "/tmp/work";

    auto path = std::filesystem::temp_directory_path() / "warden-settings-test.json";
    {
        std::ofstream out(path);
        out << original.ToJson().dump();
    }

    auto loaded = SandboxSettings::FromJsonFile(path);
    std::filesystem::remove(path);

    EXPECT_EQ(loaded.ToJson(), original.ToJson());
}

TEST(Settings, JsonFileErrors) {
    EXPECT_THROW(SandboxSettings::FromJsonFile("/nonexistent/warden.json"), std::runtime_error);

    auto path = std::filesystem::temp_directory_path() / "warden-settings-bad.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(SandboxSettings::FromJsonFile(path), std::runtime_error);
    std::filesystem::remove(path);
}
