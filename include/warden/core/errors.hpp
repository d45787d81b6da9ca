/**
 * @file errors.hpp
 * @brief Exception hierarchy of the sandbox engine
 *
 * Every failure surfaced to callers derives from SandboxError, so a caller
 * can catch the whole family at once or single out the conditions it
 * handles (typically PoolExhausted for backpressure and CommandCheckFailed
 * for failing student code).
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "warden/core/command.hpp"

namespace warden {
namespace core {

/**
 * @class SandboxError
 * @brief Base of all sandbox failures
 */
class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// No identity token became available within the acquisition budget
class PoolExhausted : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Container could not be created or started; the token was already returned
class ProvisioningFailed : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Command could not be started (empty argv, missing program, bad stdin...)
class LaunchFailed : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/**
 * @class CommandCheckFailed
 * @brief Raised by checked commands; carries the full result
 */
class CommandCheckFailed : public SandboxError {
public:
    CommandCheckFailed(const std::string& message, CommandResult result)
        : SandboxError(message)
        , result_(std::move(result)) {}

    const CommandResult& Result() const { return result_; }

private:
    CommandResult result_;
};

/// Checked command exceeded its wall-clock budget
class TimedOut : public CommandCheckFailed {
public:
    using CommandCheckFailed::CommandCheckFailed;
};

/// Checked command finished with a non-zero (or missing) return code
class NonZeroExit : public CommandCheckFailed {
public:
    using CommandCheckFailed::CommandCheckFailed;
};

/// Runtime could not remove the container; the token was still released
class TeardownFailed : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/**
 * @class DecodeFailed
 * @brief Strict decoding of captured output failed
 */
class DecodeFailed : public SandboxError {
public:
    DecodeFailed(std::string stream, std::size_t offset, const std::string& message)
        : SandboxError(stream + ": " + message)
        , stream_(std::move(stream))
        , offset_(offset) {}

    const std::string& Stream() const { return stream_; }   ///< "stdout" or "stderr"
    std::size_t Offset() const { return offset_; }          ///< Offset of the bad byte

private:
    std::string stream_;
    std::size_t offset_;
};

/// Runner protocol failure, or the handle was destroyed mid-execution
class ExecutionFailed : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/**
 * @class FileInjectionFailed
 * @brief One or more files could not be copied into the container
 */
class FileInjectionFailed : public SandboxError {
public:
    struct FailedFile {
        std::filesystem::path source;  ///< Host path
        std::string reason;            ///< What went wrong
    };

    explicit FileInjectionFailed(std::vector<FailedFile> failures)
        : SandboxError(Describe(failures))
        , failures_(std::move(failures)) {}

    const std::vector<FailedFile>& Failures() const { return failures_; }

private:
    static std::string Describe(const std::vector<FailedFile>& failures) {
        std::string message = "Failed to add files:";
        for (const auto& failure : failures) {
            message += " " + failure.source.string() + " (" + failure.reason + ")";
        }
        return message;
    }

    std::vector<FailedFile> failures_;
};

/// A cancellable wait observed cancellation
class OperationCancelled : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Coordination store I/O or protocol failure
class StoreError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

} // namespace core
} // namespace warden
