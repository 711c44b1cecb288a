/*
 * test_process_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_process_runner.cpp
 * @brief End-to-end tests for the process backend using /bin/sh as interpreter
 */

#include <gtest/gtest.h>
#include "isolated/isolated_runner.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <unistd.h>

using namespace sandrun::isolated;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

// Zombies reparented to init count as gone
bool processAlive(int pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) {
        return fs::exists("/proc/self") ? false : ::kill(pid, 0) == 0;
    }
    std::string content((std::istreambuf_iterator<char>(stat)),
                        std::istreambuf_iterator<char>());
    auto paren = content.rfind(')');
    if (paren == std::string::npos || paren + 2 >= content.size()) {
        return false;
    }
    char state = content[paren + 2];
    return state != 'Z' && state != 'X';
}

}  // namespace

class ProcessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_ = std::make_unique<ProcessRunner>(InterpreterConfig{"/bin/sh", {}});
    }

    Result<RawExecution> run(const std::string& script,
                             std::optional<std::string> stdinData = std::nullopt,
                             ResourceLimitProfile limits = ResourceLimitProfile::defaults()) {
        ExecutionRequest request;
        request.sourceText = script;
        request.stdinData = std::move(stdinData);
        return runner_->run(request, limits);
    }

    static ResourceLimitProfile withTimeout(std::uint64_t seconds) {
        return ResourceLimitProfile::defaults().withWallClockTimeoutSeconds(seconds).value();
    }

    std::unique_ptr<ProcessRunner> runner_;
};

// =============================================================================
// Normal Completion
// =============================================================================

TEST_F(ProcessRunnerTest, BackendName) {
    EXPECT_EQ(runner_->name(), "process");
    EXPECT_EQ(runner_->interpreter().path, fs::path("/bin/sh"));
}

TEST_F(ProcessRunnerTest, EchoSucceeds) {
    auto raw = run("echo hi\n");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->exitCode, 0);
    EXPECT_EQ(raw->stdoutBytes, "hi\n");
    EXPECT_EQ(raw->stderrBytes, "");
    EXPECT_FALSE(raw->timedOut);
    EXPECT_EQ(raw->timeoutSeconds, 5);
}

TEST_F(ProcessRunnerTest, NonZeroExitAndStderr) {
    auto raw = run("echo 'ValueError: bad input' 1>&2\nexit 1\n");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->exitCode, 1);
    EXPECT_EQ(raw->stderrBytes, "ValueError: bad input\n");
}

TEST_F(ProcessRunnerTest, StdinPassthrough) {
    auto raw = run("read line\necho \"got $line\"\n", std::string("value\n"));
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->stdoutBytes, "got value\n");
}

TEST_F(ProcessRunnerTest, NoStdinReadsEof) {
    auto raw = run("if read line; then echo data; else echo eof; fi\n");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->stdoutBytes, "eof\n");
}

TEST_F(ProcessRunnerTest, MinimalEnvironment) {
    auto raw = run("echo \"$PYTHONIOENCODING|$HOME\"\n");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->stdoutBytes, "utf-8|\n");
}

TEST_F(ProcessRunnerTest, ExtraEnvironmentIsPassed) {
    ProcessRunner runner(InterpreterConfig{"/bin/sh", {}}, {{"SANDRUN_MODE", "test"}});
    ExecutionRequest request;
    request.sourceText = "echo $SANDRUN_MODE\n";
    auto raw = runner.run(request, ResourceLimitProfile::defaults());
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->stdoutBytes, "test\n");
}

// =============================================================================
// Descriptor Isolation
// =============================================================================

TEST_F(ProcessRunnerTest, ParentDescriptorsAreNotInherited) {
    int low = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(low, 3);

    auto raw = run("if [ -e /proc/self/fd/" + std::to_string(low) +
                   " ]; then echo leaked; else echo closed; fi\n");
    ::close(low);
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->stdoutBytes, "closed\n");
}

TEST_F(ProcessRunnerTest, HighNumberedDescriptorsAreNotInherited) {
    constexpr int highFd = 70000;
    struct rlimit original{};
    ASSERT_EQ(::getrlimit(RLIMIT_NOFILE, &original), 0);
    if (original.rlim_max != RLIM_INFINITY &&
        original.rlim_max <= static_cast<rlim_t>(highFd)) {
        GTEST_SKIP() << "RLIMIT_NOFILE hard limit too low for fd " << highFd;
    }
    struct rlimit raised = original;
    raised.rlim_cur = static_cast<rlim_t>(highFd) + 1;
    if (original.rlim_cur < raised.rlim_cur &&
        ::setrlimit(RLIMIT_NOFILE, &raised) != 0) {
        GTEST_SKIP() << "cannot raise RLIMIT_NOFILE";
    }

    int source = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(source, 0);
    int high = ::dup2(source, highFd);
    ::close(source);
    if (high != highFd) {
        ::setrlimit(RLIMIT_NOFILE, &original);
        GTEST_SKIP() << "cannot place a descriptor at " << highFd;
    }

    auto raw = run("if [ -e /proc/self/fd/70000 ]; then echo leaked; else echo closed; fi\n");
    ::close(high);
    ::setrlimit(RLIMIT_NOFILE, &original);

    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->stdoutBytes, "closed\n");
}

// =============================================================================
// Artifact Handling
// =============================================================================

TEST_F(ProcessRunnerTest, RunsInsideArtifactDirectory) {
    auto raw = run("pwd\nls\n");
    ASSERT_TRUE(raw.has_value());
    auto newline = raw->stdoutBytes.find('\n');
    ASSERT_NE(newline, std::string::npos);
    fs::path directory = raw->stdoutBytes.substr(0, newline);
    EXPECT_NE(directory.filename().string().find("sandrun-"), std::string::npos);
    EXPECT_NE(raw->stdoutBytes.find("snippet.py"), std::string::npos);
    EXPECT_FALSE(fs::exists(directory));
}

TEST_F(ProcessRunnerTest, ArtifactRemovedAfterTimeout) {
    auto raw = run("pwd\nwhile :; do :; done\n", std::nullopt, withTimeout(1));
    ASSERT_TRUE(raw.has_value());
    ASSERT_TRUE(raw->timedOut);
    auto directory = raw->stdoutBytes.substr(0, raw->stdoutBytes.find('\n'));
    ASSERT_FALSE(directory.empty());
    EXPECT_FALSE(fs::exists(directory));
}

// =============================================================================
// Limits
// =============================================================================

TEST_F(ProcessRunnerTest, TimeoutWithinMargin) {
    auto start = std::chrono::steady_clock::now();
    auto raw = run("echo before\nwhile :; do :; done\n", std::nullopt, withTimeout(1));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(raw.has_value());
    EXPECT_TRUE(raw->timedOut);
    EXPECT_FALSE(raw->exitCode.has_value());
    EXPECT_EQ(raw->stdoutBytes, "before\n");
    EXPECT_EQ(raw->timeoutSeconds, 1);
    EXPECT_GE(elapsed, 1s);
    EXPECT_LT(elapsed, 3s);
}

TEST_F(ProcessRunnerTest, BackgroundChildrenAreKilledOnTimeout) {
    auto raw = run("sleep 60 &\necho $!\nwait\n", std::nullopt, withTimeout(1));
    ASSERT_TRUE(raw.has_value());
    EXPECT_TRUE(raw->timedOut);

    int background = std::stoi(raw->stdoutBytes);
    ASSERT_GT(background, 0);
    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(processAlive(background));
}

TEST_F(ProcessRunnerTest, BackgroundChildrenAreKilledOnExit) {
    auto raw = run("sleep 60 &\necho $!\n");
    ASSERT_TRUE(raw.has_value());
    EXPECT_FALSE(raw->timedOut);
    EXPECT_EQ(raw->exitCode, 0);

    int background = std::stoi(raw->stdoutBytes);
    ASSERT_GT(background, 0);
    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(processAlive(background));
}

TEST_F(ProcessRunnerTest, OutputCeilingTruncates) {
    auto limits = ResourceLimitProfile::defaults().withMaxOutputBytes(64).value();
    auto raw = run("i=0\nwhile [ $i -lt 100 ]; do echo 0123456789; i=$((i+1)); done\n",
                   std::nullopt, limits);
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->exitCode, 0);
    EXPECT_EQ(raw->stdoutBytes.size(), 64u);
    EXPECT_TRUE(raw->stdoutTruncated);
}

TEST_F(ProcessRunnerTest, ConcurrentRunsAreIndependent) {
    Result<RawExecution> slow;
    Result<RawExecution> fast;
    std::thread worker([&] {
        slow = run("while :; do :; done\n", std::nullopt, withTimeout(1));
    });
    fast = run("echo sibling\n");
    worker.join();

    ASSERT_TRUE(fast.has_value());
    EXPECT_EQ(fast->stdoutBytes, "sibling\n");
    EXPECT_EQ(fast->exitCode, 0);
    ASSERT_TRUE(slow.has_value());
    EXPECT_TRUE(slow->timedOut);
}

// =============================================================================
// Launch Failures
// =============================================================================

TEST_F(ProcessRunnerTest, MissingInterpreter) {
    ProcessRunner runner(InterpreterConfig{"/nonexistent/sandrun/python3", {}});
    auto raw = runner.run(ExecutionRequest{"print(1)\n"}, ResourceLimitProfile::defaults());
    ASSERT_FALSE(raw.has_value());
    EXPECT_EQ(raw.error(), RunnerError::InterpreterNotFound);
}

TEST_F(ProcessRunnerTest, RequestOverridesInterpreter) {
    ExecutionRequest request;
    request.sourceText = "echo override\n";
    request.interpreterPath = "/nonexistent/sandrun/python3";
    auto raw = runner_->run(request, ResourceLimitProfile::defaults());
    ASSERT_FALSE(raw.has_value());
    EXPECT_EQ(raw.error(), RunnerError::InterpreterNotFound);
}
