/**
 * @file command_executor.hpp
 * @brief Runs one command inside a READY container
 *
 * **Execution Workflow**:
 * 1. Validate the CommandSpec (argv, stdin source, encoding) before touching the container
 * 2. Take the handle READY -> EXECUTING (serialized with other uses)
 * 3. Start the in-container runner through the runtime as the leased UID
 * 4. Feed stdin, drain the framed output and runner diagnostics concurrently
 * 5. On deadline or cancellation, reap the command's process tree in the container
 * 6. Collect the status frame, apply truncation flags and decoding
 * 7. Return the handle to READY and apply the check policy
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

#include "warden/core/command.hpp"
#include "warden/core/container_handle.hpp"
#include "warden/utils/cancellation.hpp"

namespace warden {
namespace core {

/**
 * @class CommandExecutor
 * @brief Executes CommandSpecs against one ContainerHandle
 *
 * **Thread Safety**: Concurrent Run() calls on the same handle are
 * serialized by the handle.
 *
 * **Usage Example**:
 * @code
 * CommandExecutor executor(handle);
 * CommandSpec spec;
 * spec.argv = {"echo", "hello"};
 * auto result = executor.Run(spec);
 * // result.return_code == 0, result.Stdout() == "hello\n"
 * @endcode
 */
class CommandExecutor {
public:
    explicit CommandExecutor(ContainerHandle& handle);

    /**
     * @brief Run @p spec to completion or timeout
     *
     * @return Exactly one CommandResult (partial output on timeout)
     *
     * @throws LaunchFailed if the command could not start
     * @throws DecodeFailed under a strict decoding policy
     * @throws TimedOut / NonZeroExit when spec.check is set
     * @throws ExecutionFailed on runner protocol errors or concurrent teardown
     * @throws OperationCancelled after reaping when @p cancel fired
     */
    CommandResult Run(const CommandSpec& spec, const utils::CancellationToken& cancel = {});

    /**
     * @brief Runner invocation used inside the container for @p spec
     */
    std::vector<std::string> BuildRunnerArgs(const CommandSpec& spec,
                                             const std::string& cmd_id) const;

private:
    void Validate(const CommandSpec& spec) const;
    void Reap(const std::string& cmd_id);

    ContainerHandle& handle_;
};

} // namespace core
} // namespace warden
