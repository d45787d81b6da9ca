/**
 * @file command.hpp
 * @brief Command specification and result types
 *
 * A CommandSpec describes one invocation inside a sandbox; executing it
 * produces exactly one CommandResult. Results are never mutated after they
 * are returned: captured output is shared read-only.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/utils/spill_buffer.hpp"
#include "warden/utils/string_utils.hpp"

namespace warden {
namespace core {

using json = nlohmann::json;

/// Output of one stream, in memory up to a threshold and on disk beyond it
using CapturedOutput = utils::SpillBuffer;

/**
 * @struct DecodePolicy
 * @brief Requested conversion of captured bytes to text
 */
struct DecodePolicy {
    std::string encoding{"utf-8"};                           ///< utf-8, ascii or latin-1
    utils::DecodeErrors errors{utils::DecodeErrors::STRICT}; ///< Handling of invalid input
};

/**
 * @struct CommandSpec
 * @brief One command to run inside a sandbox
 *
 * At most one of stdin_bytes and stdin_file may be set; with neither the
 * command reads from /dev/null.
 *
 * **Usage Example**:
 * @code
 * CommandSpec spec;
 * spec.argv = {"python3", "test_runner.py"};
 * spec.timeout = std::chrono::seconds(10);
 * spec.truncate_stdout = 64 * 1024;
 * spec.decode = DecodePolicy{"utf-8", utils::DecodeErrors::REPLACE};
 * auto result = sandbox.RunCommand(spec);
 * @endcode
 */
struct CommandSpec {
    std::vector<std::string> argv;                       ///< Program and arguments (non-empty)
    std::optional<std::string> stdin_bytes;              ///< Literal stdin content
    std::optional<std::filesystem::path> stdin_file;     ///< Host file streamed to stdin
    std::optional<std::chrono::milliseconds> timeout;    ///< Wall-clock budget (empty = unbounded)
    std::optional<std::size_t> truncate_stdout;          ///< Retained stdout ceiling
    std::optional<std::size_t> truncate_stderr;          ///< Retained stderr ceiling
    std::optional<DecodePolicy> decode;                  ///< Empty = raw bytes only
    bool check{false};                                   ///< Throw TimedOut/NonZeroExit
    std::optional<bool> block_process_spawn;             ///< Empty = container default
    bool as_root{false};                                 ///< Run as root instead of the leased UID
    std::optional<std::int64_t> max_stack_size;          ///< RLIMIT_STACK in bytes
    std::optional<std::int64_t> max_virtual_memory;      ///< RLIMIT_AS in bytes
    std::optional<std::string> working_dir;              ///< Empty = sandbox working directory
    std::map<std::string, std::string> env;              ///< Extra environment variables
};

/**
 * @struct CommandResult
 * @brief Outcome of one command execution
 */
struct CommandResult {
    /// Exit code; negative signal number when killed by a signal; empty when
    /// the status was lost because the runtime client had to be killed
    std::optional<int> return_code;

    std::shared_ptr<const CapturedOutput> stdout_capture;  ///< Retained stdout
    std::shared_ptr<const CapturedOutput> stderr_capture;  ///< Retained stderr
    bool stdout_truncated{false};                          ///< stdout exceeded its ceiling
    bool stderr_truncated{false};                          ///< stderr exceeded its ceiling
    bool timed_out{false};                                 ///< Killed on deadline
    std::optional<std::string> stdout_text;                ///< Decoded stdout (with DecodePolicy)
    std::optional<std::string> stderr_text;                ///< Decoded stderr (with DecodePolicy)
    std::chrono::milliseconds duration{0};                 ///< Wall-clock duration

    std::string Stdout() const { return stdout_capture ? stdout_capture->ReadAll() : std::string(); }
    std::string Stderr() const { return stderr_capture ? stderr_capture->ReadAll() : std::string(); }
};

/**
 * @brief Serialize a result for reports and the command-line tool
 *
 * Output bytes are included as text: the decoded text when present, the raw
 * bytes decoded with U+FFFD replacement otherwise.
 */
json ToJson(const CommandResult& result);

} // namespace core
} // namespace warden
