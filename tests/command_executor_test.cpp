/**
 * @file command_executor_test.cpp
 * @brief Execution protocol tests against the real runner on the host
 *
 * @date 2025
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "sandbox_fixture.hpp"
#include "warden/core/command_executor.hpp"
#include "warden/core/errors.hpp"

#include <unistd.h>

#include <algorithm>
#include <future>
#include <thread>

using namespace warden;
using namespace std::chrono_literals;
using ::testing::Contains;
using ::testing::HasSubstr;

namespace {

class CommandExecutorTest : public fakes::SandboxFixture {};

core::CommandSpec Shell(const std::string& script) {
    core::CommandSpec spec;
    spec.argv = {"sh", "-c", script};
    spec.timeout = 10s;
    return spec;
}

} // namespace

TEST_F(CommandExecutorTest, CapturesStdoutAndExitCode) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    core::CommandSpec spec;
    spec.argv = {"echo", "hello"};
    auto result = executor.Run(spec);

    EXPECT_EQ(result.return_code, 0);
    EXPECT_EQ(result.Stdout(), "hello\n");
    EXPECT_EQ(result.Stderr(), "");
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.stdout_truncated);
    EXPECT_FALSE(result.stdout_text.has_value());
    EXPECT_EQ(handle->State(), core::HandleState::READY);
}

TEST_F(CommandExecutorTest, SeparatesStreamsAndReportsStatus) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto result = executor.Run(Shell("echo out; echo err >&2; exit 3"));
    EXPECT_EQ(result.return_code, 3);
    EXPECT_EQ(result.Stdout(), "out\n");
    EXPECT_EQ(result.Stderr(), "err\n");
}

TEST_F(CommandExecutorTest, SignalIsNegativeReturnCode) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto result = executor.Run(Shell("kill -TERM $$"));
    EXPECT_EQ(result.return_code, -15);
}

TEST_F(CommandExecutorTest, StdinBytesAndFile) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    core::CommandSpec spec;
    spec.argv = {"cat"};
    spec.stdin_bytes = std::string("line one\nline two\n");
    EXPECT_EQ(executor.Run(spec).Stdout(), "line one\nline two\n");

    spec.stdin_bytes.reset();
    spec.stdin_file = WriteHostFile("input.txt", "from file");
    EXPECT_EQ(executor.Run(spec).Stdout(), "from file");
}

TEST_F(CommandExecutorTest, NoStdinReadsEof) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    core::CommandSpec spec;
    spec.argv = {"cat"};
    spec.timeout = 5s;
    auto result = executor.Run(spec);
    EXPECT_EQ(result.return_code, 0);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.Stdout(), "");
}

TEST_F(CommandExecutorTest, RunsInWorkingDirectory) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto result = executor.Run(Shell("pwd"));
    EXPECT_EQ(result.Stdout(), settings_.working_dir + "\n");

    auto spec = Shell("pwd");
    spec.working_dir = root_.string();
    EXPECT_EQ(executor.Run(spec).Stdout(), root_.string() + "\n");
}

TEST_F(CommandExecutorTest, TimeoutReturnsPartialOutput) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto spec = Shell("echo started; sleep 10");
    spec.timeout = 1s;

    auto start = std::chrono::steady_clock::now();
    auto result = executor.Run(spec);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.Stdout(), "started\n");
    EXPECT_LT(elapsed, 6s);

    // The handle stays usable.
    auto next = executor.Run(Shell("echo again"));
    EXPECT_EQ(next.Stdout(), "again\n");
    EXPECT_FALSE(next.timed_out);
}

TEST_F(CommandExecutorTest, TimeoutReapsBackgroundChildren) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto marker = root_ / "survivor";
    auto spec = Shell("(sleep 2; touch '" + marker.string() + "') & sleep 10");
    spec.timeout = 500ms;
    auto result = executor.Run(spec);
    EXPECT_TRUE(result.timed_out);

    std::this_thread::sleep_for(3s);
    EXPECT_FALSE(std::filesystem::exists(marker));

    bool reaped = false;
    for (const auto& request : runtime_.exec_log) {
        if (request.argv.size() >= 2 && request.argv[1] == "--reap") {
            reaped = true;
            ASSERT_TRUE(request.user.has_value());
            EXPECT_EQ(*request.user, 0u);
        }
    }
    EXPECT_TRUE(reaped);
}

TEST_F(CommandExecutorTest, TimeoutSurvivesReaperFailure) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);
    runtime_.fail_reap = true;
    settings_.min_fallback_timeout = 1s;

    auto spec = Shell("echo started; sleep 3");
    spec.timeout = 300ms;
    auto result = executor.Run(spec);

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.return_code.has_value());
    EXPECT_EQ(result.Stdout(), "started\n");
    EXPECT_EQ(handle->State(), core::HandleState::READY);
}

TEST_F(CommandExecutorTest, TruncationKeepsExactPrefix) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto spec = Shell("printf 0123456789; printf abcdef >&2");
    spec.truncate_stdout = 4;
    spec.truncate_stderr = 100;
    auto result = executor.Run(spec);

    EXPECT_EQ(result.Stdout(), "0123");
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_EQ(result.Stderr(), "abcdef");
    EXPECT_FALSE(result.stderr_truncated);
}

TEST_F(CommandExecutorTest, OutputExactlyAtCeilingIsNotTruncated) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto spec = Shell("printf 12345");
    spec.truncate_stdout = 5;
    auto result = executor.Run(spec);
    EXPECT_EQ(result.Stdout(), "12345");
    EXPECT_FALSE(result.stdout_truncated);
}

TEST_F(CommandExecutorTest, LargeOutputIsDrainedWhileRunning) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    // Far more than a pipe buffer; would deadlock without concurrent draining.
    auto spec = Shell("head -c 5000000 /dev/zero; echo done >&2");
    spec.truncate_stdout = 1000;
    auto result = executor.Run(spec);

    EXPECT_EQ(result.return_code, 0);
    EXPECT_EQ(result.stdout_capture->Size(), 1000u);
    EXPECT_EQ(result.stdout_capture->BytesSeen(), 5000000u);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_EQ(result.Stderr(), "done\n");
}

TEST_F(CommandExecutorTest, HugeOutputStaysBoundedByCeiling) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto spec = Shell("head -c 104857600 /dev/zero");
    spec.timeout = 60s;
    spec.truncate_stdout = 1024;
    auto result = executor.Run(spec);

    EXPECT_EQ(result.return_code, 0);
    EXPECT_EQ(result.stdout_capture->Size(), 1024u);
    EXPECT_EQ(result.stdout_capture->BytesSeen(), 104857600u);
    EXPECT_TRUE(result.stdout_truncated);
    // Below the memory threshold, so nothing went to disk either.
    EXPECT_FALSE(result.stdout_capture->Spilled());
}

TEST_F(CommandExecutorTest, DecodesWithPolicy) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto spec = Shell("printf 'caf\\303\\251 \\377'");
    spec.decode = core::DecodePolicy{"utf-8", utils::DecodeErrors::REPLACE};
    auto result = executor.Run(spec);
    ASSERT_TRUE(result.stdout_text.has_value());
    EXPECT_EQ(*result.stdout_text, "caf\xC3\xA9 \xEF\xBF\xBD");
    EXPECT_EQ(result.stderr_text.value_or("x"), "");

    spec.decode = core::DecodePolicy{"utf-8", utils::DecodeErrors::STRICT};
    try {
        executor.Run(spec);
        FAIL() << "expected DecodeFailed";
    } catch (const core::DecodeFailed& e) {
        EXPECT_EQ(e.Stream(), "stdout");
        EXPECT_EQ(e.Offset(), 6u);
    }
}

TEST_F(CommandExecutorTest, LaunchFailures) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    core::CommandSpec empty;
    EXPECT_THROW(executor.Run(empty), core::LaunchFailed);

    core::CommandSpec missing;
    missing.argv = {"/nonexistent/program"};
    try {
        executor.Run(missing);
        FAIL() << "expected LaunchFailed";
    } catch (const core::LaunchFailed& e) {
        EXPECT_THAT(e.what(), HasSubstr("/nonexistent/program"));
    }

    core::CommandSpec bad_dir;
    bad_dir.argv = {"true"};
    bad_dir.working_dir = "/nonexistent/dir";
    EXPECT_THROW(executor.Run(bad_dir), core::LaunchFailed);

    core::CommandSpec bad_stdin;
    bad_stdin.argv = {"cat"};
    bad_stdin.stdin_file = root_ / "no-such-input";
    EXPECT_THROW(executor.Run(bad_stdin), core::LaunchFailed);

    core::CommandSpec both;
    both.argv = {"cat"};
    both.stdin_bytes = std::string("x");
    both.stdin_file = WriteHostFile("x", "x");
    EXPECT_THROW(executor.Run(both), core::LaunchFailed);

    core::CommandSpec bad_encoding;
    bad_encoding.argv = {"true"};
    bad_encoding.decode = core::DecodePolicy{"klingon", utils::DecodeErrors::STRICT};
    EXPECT_THROW(executor.Run(bad_encoding), core::LaunchFailed);

    EXPECT_EQ(handle->State(), core::HandleState::READY);
    EXPECT_EQ(executor.Run(Shell("echo ok")).Stdout(), "ok\n");
}

TEST_F(CommandExecutorTest, ValidationFailsBeforeTouchingContainer) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);
    const auto execs = runtime_.exec_log.size();

    core::CommandSpec bad_stdin;
    bad_stdin.argv = {"cat"};
    bad_stdin.stdin_file = root_ / "no-such-input";
    EXPECT_THROW(executor.Run(bad_stdin), core::LaunchFailed);
    EXPECT_EQ(runtime_.exec_log.size(), execs);
}

TEST_F(CommandExecutorTest, CheckRaisesWithResult) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto failing = Shell("echo partial; exit 2");
    failing.check = true;
    try {
        executor.Run(failing);
        FAIL() << "expected NonZeroExit";
    } catch (const core::NonZeroExit& e) {
        EXPECT_EQ(e.Result().return_code, 2);
        EXPECT_EQ(e.Result().Stdout(), "partial\n");
    }

    auto slow = Shell("sleep 10");
    slow.timeout = 300ms;
    slow.check = true;
    try {
        executor.Run(slow);
        FAIL() << "expected TimedOut";
    } catch (const core::TimedOut& e) {
        EXPECT_TRUE(e.Result().timed_out);
    }

    auto passing = Shell("true");
    passing.check = true;
    EXPECT_EQ(executor.Run(passing).return_code, 0);
}

TEST_F(CommandExecutorTest, CancellationReapsAndThrows) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    utils::CancellationSource source;
    auto run = std::async(std::launch::async, [&] {
        return executor.Run(Shell("sleep 30"), source.Token());
    });
    std::this_thread::sleep_for(300ms);
    source.Cancel();

    EXPECT_THROW(run.get(), core::OperationCancelled);
    EXPECT_EQ(handle->State(), core::HandleState::READY);
}

TEST_F(CommandExecutorTest, ConcurrentRunsAreSerialized) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto marker = (root_ / "busy").string();
    // Each command fails if it ever sees another one running.
    auto spec = Shell("[ ! -e '" + marker + "' ] || exit 9; touch '" + marker +
                      "'; sleep 0.2; rm '" + marker + "'");

    std::vector<std::future<core::CommandResult>> runs;
    for (int i = 0; i < 4; ++i) {
        runs.push_back(std::async(std::launch::async, [&] { return executor.Run(spec); }));
    }
    for (auto& run : runs) {
        EXPECT_EQ(run.get().return_code, 0);
    }
}

TEST_F(CommandExecutorTest, DestroyedHandleRejectsRuns) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);
    handle->Destroy();

    core::CommandSpec spec;
    spec.argv = {"true"};
    EXPECT_THROW(executor.Run(spec), core::ExecutionFailed);
}

TEST_F(CommandExecutorTest, DestroyDuringRunIsExecutionError) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto run = std::async(std::launch::async, [&] { return executor.Run(Shell("sleep 1")); });
    std::this_thread::sleep_for(200ms);
    handle->Destroy();

    EXPECT_THROW(run.get(), core::ExecutionFailed);
    EXPECT_EQ(handle->State(), core::HandleState::DESTROYED);
}

TEST_F(CommandExecutorTest, RunnerArguments) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    core::CommandSpec spec;
    spec.argv = {"python3", "main.py"};
    spec.block_process_spawn = true;
    spec.max_stack_size = 8 << 20;
    spec.max_virtual_memory = 1LL << 30;

    auto args = executor.BuildRunnerArgs(spec, "abc123");
    const std::vector<std::string> expected = {
        settings_.container_runner_path, "--cmd-id", "abc123",
        "--uid", std::to_string(handle->Uid()), "--stdin-devnull",
        "--block-process-spawn", "--max-stack-size", "8388608",
        "--max-virtual-memory", "1073741824", "--working-dir", settings_.working_dir,
        "--", "python3", "main.py",
    };
    EXPECT_EQ(args, expected);

    spec.block_process_spawn.reset();
    spec.stdin_bytes = std::string();
    args = executor.BuildRunnerArgs(spec, "abc123");
    EXPECT_THAT(args, ::testing::Not(Contains("--block-process-spawn")));
    EXPECT_THAT(args, ::testing::Not(Contains("--stdin-devnull")));

    spec.as_root = true;
    args = executor.BuildRunnerArgs(spec, "abc123");
    EXPECT_THAT(args, ::testing::Not(Contains("--uid")));
}

TEST_F(CommandExecutorTest, RunnerStaysRootAndCommandGetsLeasedUid) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    core::CommandSpec spec;
    spec.argv = {"true"};
    executor.Run(spec);
    ASSERT_FALSE(runtime_.exec_log.empty());
    const auto& request = runtime_.exec_log.back();
    EXPECT_EQ(request.user, uid_t{0});
    EXPECT_EQ(request.env.at("HOME"), settings_.home_dir);
    auto uid = std::find(request.argv.begin(), request.argv.end(), "--uid");
    ASSERT_NE(uid, request.argv.end());
    ASSERT_NE(uid + 1, request.argv.end());
    EXPECT_EQ(*(uid + 1), std::to_string(handle->Uid()));

    spec.as_root = true;
    executor.Run(spec);
    EXPECT_EQ(runtime_.exec_log.back().user, uid_t{0});
    EXPECT_THAT(runtime_.exec_log.back().argv, ::testing::Not(Contains("--uid")));
}

// The remaining privilege tests need a real uid switch on the host.

TEST_F(CommandExecutorTest, CommandRunsAsLeasedUid) {
    if (geteuid() != 0) {
        GTEST_SKIP() << "switching to a pool uid needs root";
    }
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto result = executor.Run(Shell("id -u; id -g; id -G"));
    const std::string uid = std::to_string(handle->Uid());
    EXPECT_EQ(result.Stdout(), uid + "\n" + uid + "\n" + uid + "\n");

    auto spec = Shell("id -u");
    spec.as_root = true;
    EXPECT_EQ(executor.Run(spec).Stdout(), "0\n");
}

TEST_F(CommandExecutorTest, CommandCannotForgeStatusThroughRunner) {
    if (geteuid() != 0) {
        GTEST_SKIP() << "switching to a pool uid needs root";
    }
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    // A STATUS frame claiming success, written into the runner's stdout.
    auto spec = Shell(R"(printf '\003\0\0\0\0\0\0\021{"return_code":0}' > /proc/$PPID/fd/1;)"
                      R"( kill -9 $PPID; exit 1)");
    spec.check = true;
    try {
        executor.Run(spec);
        FAIL() << "expected NonZeroExit";
    } catch (const core::NonZeroExit& e) {
        EXPECT_EQ(e.Result().return_code, 1);
        EXPECT_FALSE(e.Result().timed_out);
    }
}

TEST_F(CommandExecutorTest, CommandCannotKillRunner) {
    if (geteuid() != 0) {
        GTEST_SKIP() << "switching to a pool uid needs root";
    }
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto result = executor.Run(Shell("echo out; kill -9 $PPID; exit 3"));
    EXPECT_EQ(result.return_code, 3);
    EXPECT_EQ(result.Stdout(), "out\n");
    EXPECT_THAT(result.Stderr(), ::testing::Not(::testing::IsEmpty()));
}

TEST_F(CommandExecutorTest, BlockedProcessSpawn) {
    auto handle = ReadyHandle();
    core::CommandExecutor executor(*handle);

    auto spec = Shell("listing=$(ls /); echo spawned");
    spec.block_process_spawn = true;
    auto result = executor.Run(spec);
    EXPECT_NE(result.return_code, 0);
    EXPECT_EQ(result.Stdout().find("spawned"), std::string::npos);

    spec.block_process_spawn = false;
    EXPECT_EQ(executor.Run(spec).Stdout(), "spawned\n");
}
