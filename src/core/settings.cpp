/**
 * @file settings.cpp
 * @brief Loading of sandbox configuration from environment and JSON
 *
 * @date 2025
 */

#include "warden/core/settings.hpp"

#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#ifndef WARDEN_DEFAULT_CMD_RUNNER
#define WARDEN_DEFAULT_CMD_RUNNER "warden-cmd-runner"
#endif

namespace warden {
namespace core {

namespace {

std::optional<std::string> Env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

int ParseInt(const std::string& name, const std::string& value) {
    try {
        std::size_t used = 0;
        int result = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(name + ": expected an integer, got '" + value + "'");
    }
}

double ParseDouble(const std::string& name, const std::string& value) {
    try {
        std::size_t used = 0;
        double result = std::stod(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(name + ": expected a number, got '" + value + "'");
    }
}

bool ParseBool(const std::string& name, const std::string& value) {
    const std::string lowered = utils::StringUtils::ToLower(value);
    if (lowered == "1" || lowered == "true" || lowered == "yes") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no") {
        return false;
    }
    throw std::invalid_argument(name + ": expected a boolean, got '" + value + "'");
}

std::int64_t ByteSize(const json& value) {
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    return utils::StringUtils::ParseByteSize(value.get<std::string>());
}

} // anonymous namespace

SandboxSettings::SandboxSettings()
    : host_runner_path(WARDEN_DEFAULT_CMD_RUNNER) {}

// ============================================================================
// ENVIRONMENT
// ============================================================================

SandboxSettings SandboxSettings::FromEnvironment() {
    SandboxSettings s;

    if (auto v = Env("WARDEN_DOCKER_IMAGE")) s.docker_image = *v;
    if (auto v = Env("WARDEN_MEM_LIMIT")) s.memory_limit = utils::StringUtils::ParseByteSize(*v);
    if (auto v = Env("WARDEN_PIDS_LIMIT")) s.pids_limit = ParseInt("WARDEN_PIDS_LIMIT", *v);
    if (auto v = Env("WARDEN_CPU_CORE_LIMIT")) {
        s.cpu_core_limit = ParseDouble("WARDEN_CPU_CORE_LIMIT", *v);
    }
    if (auto v = Env("WARDEN_CPUSET")) s.cpuset = *v;
    if (auto v = Env("WARDEN_BLOCK_PROCESS_SPAWN")) {
        s.block_process_spawn = ParseBool("WARDEN_BLOCK_PROCESS_SPAWN", *v);
    }
    if (auto v = Env("WARDEN_CONTAINER_CREATE_TIMEOUT")) {
        s.container_create_timeout =
            std::chrono::seconds(ParseInt("WARDEN_CONTAINER_CREATE_TIMEOUT", *v));
    }
    if (auto v = Env("WARDEN_MIN_FALLBACK_TIMEOUT")) {
        s.min_fallback_timeout = std::chrono::seconds(ParseInt("WARDEN_MIN_FALLBACK_TIMEOUT", *v));
    }
    if (auto v = Env("WARDEN_REDIS_HOST")) s.redis_host = *v;
    if (auto v = Env("WARDEN_REDIS_PORT")) s.redis_port = ParseInt("WARDEN_REDIS_PORT", *v);
    if (auto v = Env("WARDEN_UID_POOL_KEY")) s.uid_pool_key = *v;
    if (auto v = Env("WARDEN_UID_POOL_FIRST")) s.uid_pool_first = ParseInt("WARDEN_UID_POOL_FIRST", *v);
    if (auto v = Env("WARDEN_UID_POOL_SIZE")) s.uid_pool_size = ParseInt("WARDEN_UID_POOL_SIZE", *v);
    if (auto v = Env("WARDEN_UID_ACQUIRE_TIMEOUT")) {
        s.uid_acquire_timeout = std::chrono::seconds(ParseInt("WARDEN_UID_ACQUIRE_TIMEOUT", *v));
    }
    if (auto v = Env("WARDEN_DOCKER_BINARY")) s.docker_binary = *v;
    if (auto v = Env("WARDEN_CMD_RUNNER")) s.host_runner_path = *v;

    return s;
}

// ============================================================================
// JSON
// ============================================================================

SandboxSettings SandboxSettings::FromJsonFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open settings file: " + path.string());
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid settings file " + path.string() + ": " + e.what());
    }

    SandboxSettings s;
    s.Apply(j);
    spdlog::debug("Loaded settings from {}", path.string());
    return s;
}

void SandboxSettings::Apply(const json& j) {
    try {
        if (j.contains("docker_image")) docker_image = j["docker_image"].get<std::string>();
        if (j.contains("memory_limit")) memory_limit = ByteSize(j["memory_limit"]);
        if (j.contains("pids_limit")) pids_limit = j["pids_limit"].get<int>();
        if (j.contains("cpu_core_limit")) {
            cpu_core_limit = j["cpu_core_limit"].is_null()
                ? std::nullopt
                : std::optional<double>(j["cpu_core_limit"].get<double>());
        }
        if (j.contains("cpuset")) {
            cpuset = j["cpuset"].is_null()
                ? std::nullopt
                : std::optional<std::string>(j["cpuset"].get<std::string>());
        }
        if (j.contains("block_process_spawn")) {
            block_process_spawn = j["block_process_spawn"].get<bool>();
        }
        if (j.contains("container_create_timeout_s")) {
            container_create_timeout = std::chrono::seconds(j["container_create_timeout_s"].get<int>());
        }
        if (j.contains("min_fallback_timeout_s")) {
            min_fallback_timeout = std::chrono::seconds(j["min_fallback_timeout_s"].get<int>());
        }
        if (j.contains("redis_host")) redis_host = j["redis_host"].get<std::string>();
        if (j.contains("redis_port")) redis_port = j["redis_port"].get<int>();
        if (j.contains("uid_pool_key")) uid_pool_key = j["uid_pool_key"].get<std::string>();
        if (j.contains("uid_pool_first")) uid_pool_first = j["uid_pool_first"].get<int>();
        if (j.contains("uid_pool_size")) uid_pool_size = j["uid_pool_size"].get<int>();
        if (j.contains("uid_acquire_timeout_s")) {
            uid_acquire_timeout = std::chrono::seconds(j["uid_acquire_timeout_s"].get<int>());
        }
        if (j.contains("docker_binary")) docker_binary = j["docker_binary"].get<std::string>();
        if (j.contains("host_runner_path")) host_runner_path = j["host_runner_path"].get<std::string>();
        if (j.contains("container_runner_path")) {
            container_runner_path = j["container_runner_path"].get<std::string>();
        }
        if (j.contains("home_dir")) home_dir = j["home_dir"].get<std::string>();
        if (j.contains("working_dir")) working_dir = j["working_dir"].get<std::string>();
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("Invalid settings value: ") + e.what());
    }
}

json SandboxSettings::ToJson() const {
    json j;
    j["docker_image"] = docker_image;
    j["memory_limit"] = memory_limit;
    j["pids_limit"] = pids_limit;
    j["cpu_core_limit"] = cpu_core_limit ? json(*cpu_core_limit) : json(nullptr);
    j["cpuset"] = cpuset ? json(*cpuset) : json(nullptr);
    j["block_process_spawn"] = block_process_spawn;
    j["container_create_timeout_s"] = container_create_timeout.count();
    j["min_fallback_timeout_s"] = min_fallback_timeout.count();
    j["redis_host"] = redis_host;
    j["redis_port"] = redis_port;
    j["uid_pool_key"] = uid_pool_key;
    j["uid_pool_first"] = uid_pool_first;
    j["uid_pool_size"] = uid_pool_size;
    j["uid_acquire_timeout_s"] = uid_acquire_timeout.count();
    j["docker_binary"] = docker_binary;
    j["host_runner_path"] = host_runner_path.string();
    j["container_runner_path"] = container_runner_path;
    j["home_dir"] = home_dir;
    j["working_dir"] = working_dir;
    return j;
}

runtime::ResourceLimits SandboxSettings::DefaultLimits() const {
    runtime::ResourceLimits limits;
    limits.memory_bytes = memory_limit;
    limits.pids_limit = pids_limit;
    limits.cpu_cores = cpu_core_limit;
    limits.cpuset = cpuset;
    limits.block_process_spawn = block_process_spawn;
    return limits;
}

} // namespace core
} // namespace warden
