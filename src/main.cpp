/**
 * @file main.cpp
 * @brief Warden sandbox engine - Command-line interface
 *
 * Runs one command in a freshly provisioned sandbox and prints the result as
 * JSON, and administers the shared UID pool.
 *
 * **Examples**:
 * ```
 * warden run --timeout 10 --add solution.py --read-only -- python3 solution.py
 * warden pool init
 * warden pool status
 * warden pool release 2042
 * ```
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "warden/coordination/coordination_store.hpp"
#include "warden/coordination/redis_store.hpp"
#include "warden/core/errors.hpp"
#include "warden/core/sandbox.hpp"
#include "warden/core/settings.hpp"
#include "warden/core/uid_pool.hpp"
#include "warden/runtime/docker_runtime.hpp"
#include "warden/utils/cancellation.hpp"
#include "warden/utils/string_utils.hpp"

#include <signal.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;
using namespace warden;

namespace {

/*******************************************************************************
 * Option Holders
 ******************************************************************************/

struct RunOptions {
    std::string image;
    double timeout_seconds{0};
    long long truncate_stdout{-1};
    long long truncate_stderr{-1};
    std::string stdin_file;
    std::vector<std::string> add_files;
    bool read_only{false};
    bool as_root{false};
    bool block_process_spawn{false};
    bool allow_spawn{false};
    std::string encoding;
    std::string errors{"strict"};
    bool check{false};
    std::string memory_limit;
    int pids_limit{0};
    bool allow_network{false};
    std::vector<std::string> command;
};

struct PoolOptions {
    bool force{false};
    int uid{0};
};

/*******************************************************************************
 * Helpers
 ******************************************************************************/

std::unique_ptr<coordination::CoordinationStore> MakeStore(const core::SandboxSettings& settings,
                                                           bool local_pool) {
    if (local_pool) {
        spdlog::debug("Using a process-local UID pool");
        return std::make_unique<coordination::InMemoryCoordinationStore>();
    }
    spdlog::debug("Using Redis at {}:{}", settings.redis_host, settings.redis_port);
    return std::make_unique<coordination::RedisCoordinationStore>(settings.redis_host,
                                                                  settings.redis_port);
}

core::UidPoolConfig PoolConfig(const core::SandboxSettings& settings) {
    core::UidPoolConfig config;
    config.key = settings.uid_pool_key;
    config.first_uid = settings.uid_pool_first;
    config.pool_size = settings.uid_pool_size;
    config.acquire_timeout = settings.uid_acquire_timeout;
    return config;
}

// SIGINT/SIGTERM cancel the running operation instead of killing the process,
// so the container is still torn down and the UID returned.
void InstallCancelHandler(utils::CancellationSource source) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::thread([signals, source]() mutable {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            spdlog::warn("Received signal {}, cancelling", sig);
            source.Cancel();
        }
    }).detach();
}

core::CommandSpec BuildCommandSpec(const RunOptions& options) {
    core::CommandSpec spec;
    spec.argv = options.command;
    if (!options.stdin_file.empty()) {
        spec.stdin_file = options.stdin_file;
    }
    if (options.timeout_seconds > 0) {
        spec.timeout = std::chrono::milliseconds(
            static_cast<long long>(options.timeout_seconds * 1000));
    }
    if (options.truncate_stdout >= 0) {
        spec.truncate_stdout = static_cast<std::size_t>(options.truncate_stdout);
    }
    if (options.truncate_stderr >= 0) {
        spec.truncate_stderr = static_cast<std::size_t>(options.truncate_stderr);
    }
    if (!options.encoding.empty()) {
        spec.decode = core::DecodePolicy{options.encoding,
                                         utils::StringUtils::ParseDecodeErrors(options.errors)};
    }
    if (options.block_process_spawn) {
        spec.block_process_spawn = true;
    } else if (options.allow_spawn) {
        spec.block_process_spawn = false;
    }
    spec.as_root = options.as_root;
    spec.check = options.check;
    return spec;
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

int Run(const core::SandboxSettings& settings, const RunOptions& options, bool local_pool) {
    utils::CancellationSource cancel;
    InstallCancelHandler(cancel);

    auto store = MakeStore(settings, local_pool);
    core::UidPool pool(*store, PoolConfig(settings));
    if (local_pool) {
        pool.Initialize();
    }
    runtime::DockerRuntime docker(settings.docker_binary);

    core::SandboxBuilder builder(settings);
    if (!options.image.empty()) {
        builder.WithImage(options.image);
    }
    if (!options.memory_limit.empty()) {
        builder.WithMemoryLimit(utils::StringUtils::ParseByteSize(options.memory_limit));
    }
    if (options.pids_limit > 0) {
        builder.WithPidsLimit(options.pids_limit);
    }
    builder.AllowNetwork(options.allow_network);

    auto spec = BuildCommandSpec(options);

    core::Sandbox sandbox(settings, pool, docker, builder.Build(), cancel.Token());
    spdlog::info("Sandbox {} ready (uid {})", sandbox.Name(), sandbox.Uid());

    if (!options.add_files.empty()) {
        std::vector<core::FileToAdd> files;
        for (const auto& path : options.add_files) {
            files.push_back({path, std::nullopt});
        }
        sandbox.AddFiles(files, core::FileOwner::kSandboxUser, options.read_only);
    }

    try {
        auto result = sandbox.RunCommand(spec, cancel.Token());
        std::cout << core::ToJson(result).dump(2) << std::endl;
        return 0;
    } catch (const core::CommandCheckFailed& e) {
        std::cout << core::ToJson(e.Result()).dump(2) << std::endl;
        spdlog::error("{}", e.what());
        return 1;
    }
}

int PoolInit(const core::SandboxSettings& settings, const PoolOptions& options) {
    auto store = MakeStore(settings, false);
    core::UidPool pool(*store, PoolConfig(settings));
    if (pool.Initialize(options.force)) {
        spdlog::info("Seeded {} with uids {}..{}", settings.uid_pool_key, settings.uid_pool_first,
                     settings.uid_pool_first + settings.uid_pool_size - 1);
    } else {
        spdlog::info("Pool {} already initialized (use --force to re-seed)", settings.uid_pool_key);
    }
    return 0;
}

int PoolStatus(const core::SandboxSettings& settings) {
    auto store = MakeStore(settings, false);
    core::UidPool pool(*store, PoolConfig(settings));

    json status;
    status["key"] = settings.uid_pool_key;
    status["first_uid"] = settings.uid_pool_first;
    status["size"] = settings.uid_pool_size;
    status["available"] = pool.Available();
    std::cout << status.dump(2) << std::endl;
    return 0;
}

int PoolRelease(const core::SandboxSettings& settings, const PoolOptions& options) {
    auto store = MakeStore(settings, false);
    core::UidPool pool(*store, PoolConfig(settings));
    pool.ForceRelease(options.uid);
    spdlog::info("Returned uid {} to {}", options.uid, settings.uid_pool_key);
    return 0;
}

} // anonymous namespace

/*******************************************************************************
 * Main Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Warden - run untrusted commands in disposable containers"};
    app.require_subcommand(0, 1);

    std::string config_file;
    bool verbose = false;
    bool print_settings = false;
    app.add_option("--config", config_file, "JSON settings file (default: WARDEN_* environment)")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--print-settings", print_settings, "Print the effective settings and exit");

    // run
    RunOptions run;
    bool local_pool = false;
    auto* run_cmd = app.add_subcommand("run", "Run one command in a fresh sandbox");
    run_cmd->add_option("--image", run.image, "Container image");
    run_cmd->add_option("--timeout", run.timeout_seconds, "Wall-clock limit in seconds")
        ->check(CLI::PositiveNumber);
    run_cmd->add_option("--truncate-stdout", run.truncate_stdout, "Keep at most N bytes of stdout")
        ->check(CLI::NonNegativeNumber);
    run_cmd->add_option("--truncate-stderr", run.truncate_stderr, "Keep at most N bytes of stderr")
        ->check(CLI::NonNegativeNumber);
    run_cmd->add_option("--stdin", run.stdin_file, "Host file streamed to the command's stdin")
        ->check(CLI::ExistingFile);
    run_cmd->add_option("--add", run.add_files, "Host file or directory copied to the working dir")
        ->check(CLI::ExistingPath);
    run_cmd->add_flag("--read-only", run.read_only, "Make added files read-only");
    run_cmd->add_flag("--as-root", run.as_root, "Run the command as root");
    auto* block_flag = run_cmd->add_flag("--block-process-spawn", run.block_process_spawn,
                                         "Forbid the command from creating processes");
    run_cmd->add_flag("--allow-process-spawn", run.allow_spawn,
                      "Allow the command to create processes")
        ->excludes(block_flag);
    run_cmd->add_option("--encoding", run.encoding, "Decode output (utf-8, ascii, latin-1)");
    run_cmd->add_option("--errors", run.errors, "Decoding error policy")
        ->check(CLI::IsMember({"strict", "replace", "ignore", "backslashreplace"}));
    run_cmd->add_flag("--check", run.check, "Fail on timeout or non-zero exit");
    run_cmd->add_option("--memory", run.memory_limit, "Memory limit (e.g. 512m, 4g)");
    run_cmd->add_option("--pids", run.pids_limit, "Process limit")->check(CLI::PositiveNumber);
    run_cmd->add_flag("--network", run.allow_network, "Give the container a network stack");
    run_cmd->add_flag("--local-pool", local_pool, "Use a process-local UID pool instead of Redis");
    run_cmd->add_option("command", run.command, "Command and arguments (after --)")->required();

    // pool
    PoolOptions pool;
    auto* pool_cmd = app.add_subcommand("pool", "Administer the shared UID pool");
    pool_cmd->require_subcommand(1);
    auto* pool_init = pool_cmd->add_subcommand("init", "Seed the pool (once per domain)");
    pool_init->add_flag("--force", pool.force, "Wipe and re-seed an initialized pool");
    auto* pool_status = pool_cmd->add_subcommand("status", "Show available UIDs");
    auto* pool_release = pool_cmd->add_subcommand("release", "Return a leaked UID to the pool");
    pool_release->add_option("uid", pool.uid, "UID to return")->required();

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        auto settings = config_file.empty() ? core::SandboxSettings::FromEnvironment()
                                            : core::SandboxSettings::FromJsonFile(config_file);
        if (print_settings) {
            std::cout << settings.ToJson().dump(2) << std::endl;
            return 0;
        }

        if (*run_cmd) {
            if (!runtime::DockerRuntime::IsAvailable(settings.docker_binary)) {
                spdlog::error("Docker is not available via '{}'", settings.docker_binary);
                return 1;
            }
            return Run(settings, run, local_pool);
        }
        if (*pool_init) {
            return PoolInit(settings, pool);
        }
        if (*pool_status) {
            return PoolStatus(settings);
        }
        if (*pool_release) {
            return PoolRelease(settings, pool);
        }
        std::cout << app.help() << std::endl;
        return 2;

    } catch (const core::PoolExhausted& e) {
        spdlog::error("No UID available: {}", e.what());
        return 3;
    } catch (const core::OperationCancelled& e) {
        spdlog::warn("Cancelled: {}", e.what());
        return 130;
    } catch (const core::SandboxError& e) {
        spdlog::error("Sandbox error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
