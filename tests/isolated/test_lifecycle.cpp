/*
 * test_lifecycle.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "isolated/lifecycle.hpp"

#include <filesystem>

#include <signal.h>

using namespace sandrun::isolated;

class ProcessLifecycleTest : public ::testing::Test {
protected:
    static ChildProcess spawnShell(const std::string& script) {
        SpawnOptions options;
        options.executable = "/bin/sh";
        options.arguments = {"-c", script};
        options.environment = buildChildEnvironment();
        options.workingDirectory = std::filesystem::temp_directory_path();
        auto child = ProcessSpawner::spawn(options);
        EXPECT_TRUE(child.has_value());
        return child.value_or(ChildProcess{});
    }

    static bool processExists(int pid) {
        return ::kill(pid, 0) == 0;
    }
};

TEST_F(ProcessLifecycleTest, ReapReportsExitCode) {
    ProcessLifecycle lifecycle(spawnShell("exit 3"));
    EXPECT_TRUE(lifecycle.isRunning());
    EXPECT_GT(lifecycle.getProcessId(), 0);

    auto status = lifecycle.reap();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exitCode, 3);
    EXPECT_FALSE(status->termSignal.has_value());
    EXPECT_FALSE(lifecycle.isRunning());
}

TEST_F(ProcessLifecycleTest, SecondReapFails) {
    ProcessLifecycle lifecycle(spawnShell("exit 0"));
    ASSERT_TRUE(lifecycle.reap().has_value());
    auto again = lifecycle.reap();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), RunnerError::CommunicationError);
}

TEST_F(ProcessLifecycleTest, KillReportsSignal) {
    ProcessLifecycle lifecycle(spawnShell("sleep 30"));
    EXPECT_TRUE(lifecycle.kill());

    auto status = lifecycle.reap();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->termSignal, SIGKILL);
    EXPECT_FALSE(status->exitCode.has_value());
    EXPECT_FALSE(lifecycle.kill());
}

TEST_F(ProcessLifecycleTest, DestructorKillsAndReaps) {
    int pid = -1;
    {
        ProcessLifecycle lifecycle(spawnShell("sleep 30"));
        pid = lifecycle.getProcessId();
        ASSERT_TRUE(processExists(pid));
    }
    EXPECT_FALSE(processExists(pid));
}

TEST_F(ProcessLifecycleTest, MoveTransfersOwnership) {
    ProcessLifecycle first(spawnShell("exit 7"));
    int pid = first.getProcessId();

    ProcessLifecycle second(std::move(first));
    EXPECT_FALSE(first.isRunning());
    EXPECT_EQ(second.getProcessId(), pid);

    auto status = second.reap();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exitCode, 7);
}
