/**
 * @file docker_runtime_test.cpp
 * @brief Docker client invocation tests
 *
 * Argument building and error mapping run against a stub client script.
 * End-to-end sandbox tests run only when WARDEN_DOCKER_TESTS is set (its
 * value, unless "1", names the image to use).
 *
 * @date 2025
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "warden/coordination/coordination_store.hpp"
#include "warden/core/errors.hpp"
#include "warden/core/sandbox.hpp"
#include "warden/runtime/docker_runtime.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace warden;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

runtime::ContainerSpec SampleSpec() {
    runtime::ContainerSpec spec;
    spec.name = "warden-abc";
    spec.image = "eecsautograder/ubuntu22:latest";
    spec.uid = 2042;
    spec.limits.memory_bytes = 512LL * 1024 * 1024;
    spec.limits.pids_limit = 64;
    spec.main_command = {"/usr/local/bin/warden-cmd-runner", "--hold"};
    spec.env = {{"HOME", "/home/warden"}};
    return spec;
}

/// Stand-in docker client: appends its arguments to a log and fails on demand.
class StubDockerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("warden-docker-stub-" + std::to_string(getpid()));
        fs::create_directories(dir_);
        log_ = dir_ / "calls.log";
        binary_ = dir_ / "docker";
    }

    void TearDown() override { fs::remove_all(dir_); }

    // @p failing_command makes that docker subcommand print @p message and exit 1.
    void WriteStub(const std::string& failing_command = "", const std::string& message = "") {
        std::ofstream out(binary_);
        out << "#!/bin/sh\n"
            << "echo \"$*\" >> '" << log_.string() << "'\n"
            << "if [ \"$1\" = '" << failing_command << "' ]; then\n"
            << "  echo '" << message << "' >&2\n"
            << "  exit 1\n"
            << "fi\n"
            << "cat > /dev/null\n"
            << "exit 0\n";
        out.close();
        chmod(binary_.c_str(), 0755);
    }

    std::vector<std::string> Calls() const {
        std::ifstream in(log_);
        std::vector<std::string> calls;
        std::string line;
        while (std::getline(in, line)) {
            calls.push_back(line);
        }
        return calls;
    }

    fs::path dir_;
    fs::path log_;
    fs::path binary_;
};

} // namespace

TEST(DockerRuntime, CreateArgsCarryLimits) {
    runtime::DockerRuntime docker;
    auto spec = SampleSpec();
    spec.limits.cpu_cores = 1.5;
    spec.limits.cpuset = "0-3";

    const std::vector<std::string> expected = {
        "docker", "create",
        "--name", "warden-abc",
        "--user", "2042:2042",
        "--pids-limit", "64",
        "--memory", "536870912",
        "--memory-swap", "536870912",
        "--oom-kill-disable",
        "--cpus", "1.5",
        "--cpuset-cpus", "0-3",
        "--net", "none",
        "-e", "HOME=/home/warden",
        "--entrypoint", "", "eecsautograder/ubuntu22:latest",
        "/usr/local/bin/warden-cmd-runner", "--hold",
    };
    EXPECT_EQ(docker.BuildCreateArgs(spec), expected);
}

TEST(DockerRuntime, NetworkAllowedOmitsNetNone) {
    runtime::DockerRuntime docker;
    auto spec = SampleSpec();
    spec.limits.allow_network = true;

    auto args = docker.BuildCreateArgs(spec);
    EXPECT_EQ(std::find(args.begin(), args.end(), "--net"), args.end());
}

TEST(DockerRuntime, ExecArgs) {
    runtime::DockerRuntime docker("/opt/docker");

    runtime::ExecRequest request;
    request.argv = {"runner", "--cmd-id", "x"};
    request.user = 0;
    request.env = {{"HOME", "/root"}};
    EXPECT_EQ(docker.BuildExecArgs("warden-abc", request),
              (std::vector<std::string>{"/opt/docker", "exec", "-i", "--user", "0", "--env",
                                        "HOME=/root", "warden-abc", "runner", "--cmd-id", "x"}));

    request.pipe_stdin = false;
    request.user.reset();
    request.env.clear();
    EXPECT_THAT(docker.BuildExecArgs("warden-abc", request),
                ElementsAre("/opt/docker", "exec", "warden-abc", "runner", "--cmd-id", "x"));
}

TEST_F(StubDockerTest, CreateCopiesArchiveThenStarts) {
    WriteStub();
    auto archive = dir_ / "provision.tar";
    std::ofstream(archive) << "tar";

    runtime::DockerRuntime docker(binary_.string());
    docker.Create(SampleSpec(), archive, std::chrono::seconds(10), {});

    auto calls = Calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_THAT(calls[0], HasSubstr("create --name warden-abc --user 2042:2042"));
    EXPECT_EQ(calls[1], "cp --archive - warden-abc:/");
    EXPECT_EQ(calls[2], "start warden-abc");
}

TEST_F(StubDockerTest, CreateFailureIsRuntimeError) {
    WriteStub("create", "Error: No such image");
    runtime::DockerRuntime docker(binary_.string());

    try {
        docker.Create(SampleSpec(), dir_ / "unused.tar", std::chrono::seconds(10), {});
        FAIL() << "expected RuntimeError";
    } catch (const runtime::RuntimeError& e) {
        EXPECT_THAT(e.what(), HasSubstr("No such image"));
    }
    EXPECT_EQ(Calls().size(), 1u);
}

TEST_F(StubDockerTest, DestroyToleratesMissingContainer) {
    WriteStub("rm", "Error: No such container: warden-abc");
    runtime::DockerRuntime docker(binary_.string());
    EXPECT_NO_THROW(docker.Destroy("warden-abc"));

    auto calls = Calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "stop --time 1 warden-abc");
    EXPECT_EQ(calls[1], "rm -f warden-abc");
}

TEST_F(StubDockerTest, DestroyReportsRemovalFailure) {
    WriteStub("rm", "Error: device or resource busy");
    runtime::DockerRuntime docker(binary_.string());
    EXPECT_THROW(docker.Destroy("warden-abc"), runtime::RuntimeError);
}

TEST_F(StubDockerTest, Availability) {
    WriteStub();
    EXPECT_TRUE(runtime::DockerRuntime::IsAvailable(binary_.string()));
    EXPECT_FALSE(runtime::DockerRuntime::IsAvailable((dir_ / "no-such-docker").string()));
}

// ============================================================================
// END-TO-END (real Docker)
// ============================================================================

namespace {

class DockerSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* flag = std::getenv("WARDEN_DOCKER_TESTS");
        if (flag == nullptr || *flag == '\0') {
            GTEST_SKIP() << "WARDEN_DOCKER_TESTS not set";
        }
        if (std::string(flag) != "1") {
            settings_.docker_image = flag;
        }
        settings_.host_runner_path = WARDEN_TEST_CMD_RUNNER;
        settings_.container_create_timeout = std::chrono::seconds(120);

        core::UidPoolConfig config;
        config.key = "warden-test:docker-uids";
        config.first_uid = 60000;
        config.pool_size = 4;
        pool_ = std::make_unique<core::UidPool>(store_, config);
        pool_->Initialize();
    }

    core::SandboxSettings settings_;
    coordination::InMemoryCoordinationStore store_;
    std::unique_ptr<core::UidPool> pool_;
    runtime::DockerRuntime docker_;
};

} // namespace

TEST_F(DockerSandboxTest, RunsAsLeasedUser) {
    core::Sandbox sandbox(settings_, *pool_, docker_);

    core::CommandSpec spec;
    spec.argv = {"id", "-u"};
    spec.timeout = std::chrono::seconds(30);
    auto result = sandbox.RunCommand(spec);

    ASSERT_EQ(result.return_code, 0);
    EXPECT_EQ(result.Stdout(), std::to_string(sandbox.Uid()) + "\n");
}

TEST_F(DockerSandboxTest, AddedFilesHaveRequestedOwnership) {
    auto source = fs::temp_directory_path() / ("warden-docker-file-" + std::to_string(getpid()));
    std::ofstream(source) << "data\n";

    core::Sandbox sandbox(settings_, *pool_, docker_);
    auto paths = sandbox.AddFiles({{source, std::string("input.txt")}},
                                  core::FileOwner::kSandboxUser, true);
    fs::remove(source);
    ASSERT_EQ(paths.size(), 1u);

    core::CommandSpec spec;
    spec.argv = {"stat", "-c", "%u %a", paths[0]};
    auto result = sandbox.RunCommand(spec);
    EXPECT_EQ(result.Stdout(), std::to_string(sandbox.Uid()) + " 444\n");
}

TEST_F(DockerSandboxTest, ReadOnlyFileRejectsWrites) {
    auto source = fs::temp_directory_path() / ("warden-docker-ro-" + std::to_string(getpid()));
    std::ofstream(source) << "data\n";

    core::Sandbox sandbox(settings_, *pool_, docker_);
    sandbox.AddFiles({{source, std::string("input.txt")}}, core::FileOwner::kSandboxUser, true);
    fs::remove(source);

    core::CommandSpec spec;
    spec.argv = {"sh", "-c", "echo x > input.txt"};
    spec.timeout = std::chrono::seconds(30);
    auto result = sandbox.RunCommand(spec);

    ASSERT_TRUE(result.return_code.has_value());
    EXPECT_NE(*result.return_code, 0);
    EXPECT_FALSE(result.timed_out);
    EXPECT_THAT(result.Stderr(), HasSubstr("Permission denied"));

    spec.argv = {"cat", "input.txt"};
    EXPECT_EQ(sandbox.RunCommand(spec).Stdout(), "data\n");
}

TEST_F(DockerSandboxTest, CommandCannotForgeStatusThroughRunner) {
    core::Sandbox sandbox(settings_, *pool_, docker_);

    core::CommandSpec spec;
    spec.argv = {"sh", "-c",
                 R"(printf '\003\0\0\0\0\0\0\021{"return_code":0}' > /proc/$PPID/fd/1;)"
                 R"( kill -9 $PPID; echo after; exit 1)"};
    spec.timeout = std::chrono::seconds(30);
    spec.check = true;
    try {
        sandbox.RunCommand(spec);
        FAIL() << "expected NonZeroExit";
    } catch (const core::NonZeroExit& e) {
        EXPECT_EQ(e.Result().return_code, 1);
        EXPECT_EQ(e.Result().Stdout(), "after\n");
    }
}

TEST_F(DockerSandboxTest, TimeoutKillsProcessTree) {
    core::Sandbox sandbox(settings_, *pool_, docker_);

    core::CommandSpec spec;
    spec.argv = {"sh", "-c", "sleep 100 & sleep 100"};
    spec.block_process_spawn = false;
    spec.timeout = std::chrono::seconds(1);
    auto result = sandbox.RunCommand(spec);
    EXPECT_TRUE(result.timed_out);

    core::CommandSpec ps;
    ps.argv = {"sh", "-c", "grep -lx sleep /proc/[0-9]*/comm 2>/dev/null | wc -l"};
    ps.block_process_spawn = false;
    EXPECT_EQ(sandbox.RunCommand(ps).Stdout(), "0\n");
}

TEST_F(DockerSandboxTest, BlockedProcessSpawn) {
    core::Sandbox sandbox(settings_, *pool_, docker_);

    core::CommandSpec spec;
    spec.argv = {"sh", "-c", "listing=$(ls /); echo done"};
    spec.block_process_spawn = true;
    auto result = sandbox.RunCommand(spec);
    EXPECT_NE(result.return_code, 0);
}
