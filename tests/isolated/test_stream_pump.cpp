/*
 * test_stream_pump.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_stream_pump.cpp
 * @brief Tests for bounded capture and the child I/O pump
 */

#include <gtest/gtest.h>
#include "isolated/lifecycle.hpp"
#include "isolated/stream_pump.hpp"

#include <chrono>
#include <filesystem>

using namespace sandrun::isolated;
using namespace std::chrono_literals;

// =============================================================================
// BoundedBuffer
// =============================================================================

TEST(BoundedBufferTest, KeepsDataUnderCapacity) {
    BoundedBuffer buffer(16);
    buffer.append("hello ");
    buffer.append("world");
    EXPECT_EQ(buffer.data(), "hello world");
    EXPECT_FALSE(buffer.truncated());
}

TEST(BoundedBufferTest, ExactCapacityIsNotTruncated) {
    BoundedBuffer buffer(4);
    buffer.append("abcd");
    EXPECT_EQ(buffer.data(), "abcd");
    EXPECT_FALSE(buffer.truncated());
}

TEST(BoundedBufferTest, DropsBytesPastCapacity) {
    BoundedBuffer buffer(4);
    buffer.append("abc");
    buffer.append("def");
    buffer.append("ghi");
    EXPECT_EQ(buffer.data(), "abcd");
    EXPECT_TRUE(buffer.truncated());
}

TEST(BoundedBufferTest, EmptyAppendIsNoop) {
    BoundedBuffer buffer(0);
    buffer.append("");
    EXPECT_FALSE(buffer.truncated());
    buffer.append("x");
    EXPECT_TRUE(buffer.truncated());
    EXPECT_TRUE(buffer.data().empty());
}

TEST(BoundedBufferTest, ReleaseMovesContent) {
    BoundedBuffer buffer(8);
    buffer.append("data");
    EXPECT_EQ(buffer.release(), "data");
    EXPECT_EQ(buffer.capacity(), 8u);
}

// =============================================================================
// Pump
// =============================================================================

class StreamPumpTest : public ::testing::Test {
protected:
    static SpawnOptions shell(const std::string& script, bool pipeStdin = false) {
        SpawnOptions options;
        options.executable = "/bin/sh";
        options.arguments = {"-c", script};
        options.environment = buildChildEnvironment();
        options.workingDirectory = std::filesystem::temp_directory_path();
        options.pipeStdin = pipeStdin;
        return options;
    }
};

TEST_F(StreamPumpTest, CapturesBothStreams) {
    auto child = ProcessSpawner::spawn(shell("echo out; echo err 1>&2"));
    ASSERT_TRUE(child.has_value());
    ProcessLifecycle lifecycle(*child);

    auto captured = StreamPump::pump(lifecycle.child(), std::nullopt, 5s, 1024);
    ASSERT_TRUE(captured.has_value());
    EXPECT_EQ(captured->stdoutBytes, "out\n");
    EXPECT_EQ(captured->stderrBytes, "err\n");
    EXPECT_FALSE(captured->timedOut);

    auto status = lifecycle.reap();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->exitCode, 0);
}

TEST_F(StreamPumpTest, FeedsStdin) {
    auto child = ProcessSpawner::spawn(shell("cat", true));
    ASSERT_TRUE(child.has_value());
    ProcessLifecycle lifecycle(*child);

    std::optional<std::string> input = std::string("line one\nline two\n");
    auto captured = StreamPump::pump(lifecycle.child(), input, 5s, 1024);
    ASSERT_TRUE(captured.has_value());
    EXPECT_EQ(captured->stdoutBytes, *input);
}

TEST_F(StreamPumpTest, LargeStdinDoesNotDeadlock) {
    auto child = ProcessSpawner::spawn(shell("cat", true));
    ASSERT_TRUE(child.has_value());
    ProcessLifecycle lifecycle(*child);

    std::optional<std::string> input = std::string(1024 * 1024, 'x');
    auto captured = StreamPump::pump(lifecycle.child(), input, 10s, 4 * 1024 * 1024);
    ASSERT_TRUE(captured.has_value());
    EXPECT_EQ(captured->stdoutBytes.size(), input->size());
    EXPECT_FALSE(captured->timedOut);
}

TEST_F(StreamPumpTest, EmptyStdinGivesEof) {
    auto child = ProcessSpawner::spawn(shell("cat; echo done", true));
    ASSERT_TRUE(child.has_value());
    ProcessLifecycle lifecycle(*child);

    auto captured = StreamPump::pump(lifecycle.child(), std::string(), 5s, 1024);
    ASSERT_TRUE(captured.has_value());
    EXPECT_EQ(captured->stdoutBytes, "done\n");
}

TEST_F(StreamPumpTest, TruncatesAtCeiling) {
    auto child = ProcessSpawner::spawn(
        shell("i=0; while [ $i -lt 200 ]; do echo 0123456789; i=$((i+1)); done"));
    ASSERT_TRUE(child.has_value());
    ProcessLifecycle lifecycle(*child);

    auto captured = StreamPump::pump(lifecycle.child(), std::nullopt, 5s, 100);
    ASSERT_TRUE(captured.has_value());
    EXPECT_EQ(captured->stdoutBytes.size(), 100u);
    EXPECT_TRUE(captured->stdoutTruncated);
    EXPECT_FALSE(captured->stderrTruncated);
}

TEST_F(StreamPumpTest, TimeoutKeepsPartialOutput) {
    auto child = ProcessSpawner::spawn(shell("echo started; while :; do :; done"));
    ASSERT_TRUE(child.has_value());
    ProcessLifecycle lifecycle(*child);

    auto start = std::chrono::steady_clock::now();
    auto captured = StreamPump::pump(lifecycle.child(), std::nullopt, 500ms, 1024);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(captured.has_value());
    EXPECT_TRUE(captured->timedOut);
    EXPECT_EQ(captured->stdoutBytes, "started\n");
    EXPECT_LT(elapsed, 3s);

    auto status = lifecycle.reap();
    ASSERT_TRUE(status.has_value());
    EXPECT_FALSE(status->exitCode.has_value());
    EXPECT_EQ(status->termSignal, 9);
}
