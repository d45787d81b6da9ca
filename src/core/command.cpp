/**
 * @file command.cpp
 * @brief Serialization of command results
 *
 * @date 2025
 */

#include "warden/core/command.hpp"

namespace warden {
namespace core {

namespace {

std::string AsText(const std::optional<std::string>& text, const std::string& raw) {
    if (text) {
        return *text;
    }
    return utils::StringUtils::Decode(raw, "utf-8", utils::DecodeErrors::REPLACE);
}

} // anonymous namespace

json ToJson(const CommandResult& result) {
    json j;
    j["return_code"] = result.return_code ? json(*result.return_code) : json(nullptr);
    j["timed_out"] = result.timed_out;
    j["stdout_truncated"] = result.stdout_truncated;
    j["stderr_truncated"] = result.stderr_truncated;
    j["duration_ms"] = result.duration.count();
    j["stdout"] = AsText(result.stdout_text, result.Stdout());
    j["stderr"] = AsText(result.stderr_text, result.Stderr());
    return j;
}

} // namespace core
} // namespace warden
