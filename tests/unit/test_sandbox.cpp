#include <gtest/gtest.h>
#include "sandbox.h"
#include "../helpers/fake_runtime.h"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace neurax {
namespace {

using testing::DirectRuntime;
using testing::have_tool;

class SandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create test directory
        scratch = std::filesystem::temp_directory_path() /
                  ("neurax_sandbox_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(scratch);
        config.scratch_dir = scratch.string();
        config.timeout = std::chrono::seconds(5);
        config.grace = std::chrono::seconds(1);
    }

    void TearDown() override {
        // Cleanup test directory
        std::filesystem::remove_all(scratch);
    }

    static Task python(const std::string& code) {
        Task task;
        task.code = code;
        return task;
    }

    bool scratch_is_empty() const {
        return std::filesystem::is_empty(scratch);
    }

    std::filesystem::path scratch;
    SandboxConfig config;
};

// ============================================================================
// Configuration
// ============================================================================

TEST_F(SandboxTest, ProfilesSetTimeoutAndMemory) {
    SandboxConfig standard = SandboxConfig::for_profile(SandboxProfile::STANDARD);
    EXPECT_EQ(standard.timeout, std::chrono::seconds(30));
    EXPECT_EQ(standard.memory_limit_bytes, 1024ULL * 1024 * 1024);

    SandboxConfig extended = SandboxConfig::for_profile(SandboxProfile::EXTENDED);
    EXPECT_EQ(extended.timeout, std::chrono::seconds(300));
    EXPECT_EQ(extended.memory_limit_bytes, 2048ULL * 1024 * 1024);
    EXPECT_EQ(extended.grace, std::chrono::seconds(5));
    EXPECT_EQ(extended.max_open_files, 1024);
    EXPECT_EQ(extended.cpu_limit, 1);
}

TEST_F(SandboxTest, ContainerCommandCarriesIsolationFlags) {
    // Given: A docker runtime and a python layout
    ContainerRuntime docker("docker");
    TaskLayout layout;
    ASSERT_TRUE(task_layout(TASK_KIND_PYTHON, config, layout));

    // When: The command is built
    auto argv = docker.command("/tmp/x", layout, "neurax-task-1", config);
    auto has = [&argv](const std::string& a, const std::string& b) {
        for (size_t i = 0; i + 1 < argv.size(); ++i) {
            if (argv[i] == a && argv[i + 1] == b) return true;
        }
        return false;
    };

    // Then: No network, one CPU, memory ceiling, read-only root, fd limit
    EXPECT_EQ(argv[0], "docker");
    EXPECT_TRUE(has("--network", "none"));
    EXPECT_TRUE(has("--cpus", "1"));
    EXPECT_TRUE(has("--memory", std::to_string(config.memory_limit_bytes)));
    EXPECT_TRUE(has("--ulimit", "nofile=1024:1024"));
    EXPECT_TRUE(has("--name", "neurax-task-1"));
    EXPECT_TRUE(has("-v", "/tmp/x:/task:ro"));
    EXPECT_NE(std::find(argv.begin(), argv.end(), "--read-only"), argv.end());
    EXPECT_EQ(argv.back(), "/task/task.py");
}

TEST_F(SandboxTest, UnknownTaskKindIsNotExecuted) {
    SandboxExecutor executor(config, std::make_shared<DirectRuntime>());
    Task task;
    task.code = "x";
    task.kind = "blender_render";

    ExecutionResult result = executor.execute(task);

    EXPECT_EQ(result.exit_code, EXIT_CODE_NOT_EXECUTED);
    EXPECT_NE(result.stderr_output.find("blender_render"), std::string::npos);
}

// ============================================================================
// Runtime availability
// ============================================================================

TEST_F(SandboxTest, UnavailableRuntimeRefusesToRun) {
    // Given: No isolation runtime and no fallback override
    SandboxExecutor executor(config, std::make_shared<DirectRuntime>(false));

    // When: A task is submitted
    ExecutionResult result = executor.execute(python("print('should not run')"));

    // Then: Degraded result, no output, explanation on stderr
    EXPECT_EQ(result.exit_code, EXIT_CODE_NOT_EXECUTED);
    EXPECT_EQ(result.stdout_output, "");
    EXPECT_NE(result.stderr_output.find("Sandbox unavailable"), std::string::npos);
    EXPECT_FALSE(result.isolated);
}

TEST_F(SandboxTest, FallbackIsReportedAsUnisolated) {
    if (!have_tool("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }

    // Given: No runtime but the un-isolated fallback explicitly allowed
    config.allow_unisolated = true;
    SandboxExecutor executor(config, std::make_shared<DirectRuntime>(false));

    // When: A task runs
    ExecutionResult result = executor.execute(python("print('hi')"));

    // Then: It ran, but says so loudly
    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "hi\n");
    EXPECT_NE(result.stderr_output.find("WITHOUT isolation"), std::string::npos);
    EXPECT_FALSE(result.isolated);
}

TEST_F(SandboxTest, FallbackBlocksNetworkSockets) {
    if (!have_tool("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    config.allow_unisolated = true;
    SandboxExecutor executor(config, std::make_shared<DirectRuntime>(false));

    ExecutionResult result = executor.execute(python(
        "import socket\n"
        "try:\n"
        "    socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
        "    print('open')\n"
        "except OSError:\n"
        "    print('blocked')\n"));

    EXPECT_EQ(result.stdout_output, "blocked\n") << result.stderr_output;
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(SandboxTest, CapturesStdoutAndExitCode) {
    if (!have_tool("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    SandboxExecutor executor(config, std::make_shared<DirectRuntime>());

    ExecutionResult result = executor.execute(python("print(1+1)"));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "2\n");
    EXPECT_EQ(result.stderr_output, "");
    EXPECT_TRUE(result.isolated);
    EXPECT_GT(result.execution_time, 0.0);
}

TEST_F(SandboxTest, UncaughtErrorIsNonZeroWithTraceback) {
    if (!have_tool("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    SandboxExecutor executor(config, std::make_shared<DirectRuntime>());

    ExecutionResult result = executor.execute(python(
        "print('Before error')\nraise ValueError('Test error')\nprint('After error')"));

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.stdout_output, "Before error\n");
    EXPECT_NE(result.stderr_output.find("ValueError: Test error"), std::string::npos);
}

TEST_F(SandboxTest, ShellCommandTask) {
    if (!have_tool("sh")) {
        GTEST_SKIP() << "sh not installed";
    }
    SandboxExecutor executor(config, std::make_shared<DirectRuntime>());
    Task task;
    task.code = "echo hello; exit 3";
    task.kind = TASK_KIND_SHELL;

    ExecutionResult result = executor.execute(task);

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_output, "hello\n");
}

TEST_F(SandboxTest, TimeoutKillsWithinBudget) {
    if (!have_tool("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    // Given: A 1s budget with 1s grace
    config.timeout = std::chrono::seconds(1);
    config.grace = std::chrono::seconds(1);
    auto runtime = std::make_shared<DirectRuntime>();
    SandboxExecutor executor(config, runtime);

    // When: The task never ends
    auto start = std::chrono::steady_clock::now();
    ExecutionResult result = executor.execute(python("while True:\n    pass\n"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Then: Killed by the supervisor inside timeout + grace (plus slack)
    EXPECT_EQ(result.exit_code, EXIT_CODE_NOT_EXECUTED);
    EXPECT_TRUE(result.timeout_occurred);
    EXPECT_NE(result.stderr_output.find("timeout"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(4));
    EXPECT_EQ(runtime->terminations(), 1);
}

TEST_F(SandboxTest, CancellationStopsTask) {
    if (!have_tool("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    config.timeout = std::chrono::seconds(30);
    SandboxExecutor executor(config, std::make_shared<DirectRuntime>());
    std::atomic<bool> cancelled{false};

    std::thread canceller([&cancelled]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        cancelled = true;
    });
    auto start = std::chrono::steady_clock::now();
    ExecutionResult result = executor.execute(python("import time\ntime.sleep(60)\n"), &cancelled);
    canceller.join();

    EXPECT_EQ(result.exit_code, EXIT_CODE_NOT_EXECUTED);
    EXPECT_NE(result.stderr_output.find("cancelled"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST_F(SandboxTest, TaskFileIsRemovedOnEveryPath) {
    if (!have_tool("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    config.timeout = std::chrono::seconds(1);
    config.grace = std::chrono::seconds(1);
    SandboxExecutor executor(config, std::make_shared<DirectRuntime>());

    executor.execute(python("print('ok')"));
    EXPECT_TRUE(scratch_is_empty());

    executor.execute(python("raise SystemExit(4)"));
    EXPECT_TRUE(scratch_is_empty());

    executor.execute(python("while True:\n    pass\n"));
    EXPECT_TRUE(scratch_is_empty());
}

TEST_F(SandboxTest, OutputIsCappedAndNoted) {
    if (!have_tool("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    config.max_output_bytes = 1000;
    SandboxExecutor executor(config, std::make_shared<DirectRuntime>());

    ExecutionResult result = executor.execute(python("import sys\nsys.stdout.write('x' * 5000)\n"));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output.size(), 1000u);
    EXPECT_NE(result.stderr_output.find("truncated"), std::string::npos);
}

TEST_F(SandboxTest, ConcurrentInvocationsAreIndependent) {
    if (!have_tool("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    SandboxExecutor executor(config, std::make_shared<DirectRuntime>());
    ExecutionResult results[4];

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&executor, &results, i]() {
            results[i] = executor.execute(python("print(" + std::to_string(i) + ")"));
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(results[i].stdout_output, std::to_string(i) + "\n");
    }
}

} // namespace
} // namespace neurax
