/*
 * test_cli_options.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_cli_options.cpp
 * @brief Tests for command-line parsing and outcome rendering
 */

#include <gtest/gtest.h>
#include "app/cli_options.hpp"

#include <initializer_list>
#include <sstream>
#include <vector>

using namespace sandrun::app;
using sandrun::config::SandboxConfig;
using sandrun::isolated::ExecutionOutcome;
using sandrun::isolated::ExecutionStatus;

namespace {

std::expected<CliOptions, std::string> parse(std::initializer_list<const char*> args) {
    std::vector<const char*> argv{"sandrun"};
    argv.insert(argv.end(), args.begin(), args.end());
    return parseArguments(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

// =============================================================================
// Argument Parsing
// =============================================================================

TEST(ParseArgumentsTest, NoArguments) {
    auto options = parse({});
    ASSERT_TRUE(options.has_value());
    EXPECT_FALSE(options->file.has_value());
    EXPECT_FALSE(options->json);
    EXPECT_FALSE(options->showHelp);
}

TEST(ParseArgumentsTest, AllValueOptions) {
    auto options = parse({"--file", "script.py", "--stdin-data", "1 2", "--timeout", "3",
                          "--cpu-seconds", "4", "--mem-mb", "64", "--python-exe",
                          "/usr/bin/python3", "--config", "cfg.json", "--log-level",
                          "debug", "--json"});
    ASSERT_TRUE(options.has_value()) << options.error();
    EXPECT_EQ(options->file, "script.py");
    EXPECT_EQ(options->stdinData, "1 2");
    EXPECT_EQ(options->timeoutSeconds, 3u);
    EXPECT_EQ(options->cpuSeconds, 4u);
    EXPECT_EQ(options->memoryMB, 64u);
    EXPECT_EQ(options->pythonExe, "/usr/bin/python3");
    EXPECT_EQ(options->configPath, "cfg.json");
    EXPECT_EQ(options->logLevel, "debug");
    EXPECT_TRUE(options->json);
}

TEST(ParseArgumentsTest, InlineValuesAndShortFlags) {
    auto options = parse({"-f", "a.py", "--timeout=10", "--stdin-data="});
    ASSERT_TRUE(options.has_value()) << options.error();
    EXPECT_EQ(options->file, "a.py");
    EXPECT_EQ(options->timeoutSeconds, 10u);
    EXPECT_EQ(options->stdinData, "");
}

TEST(ParseArgumentsTest, HelpAndVersion) {
    EXPECT_TRUE(parse({"-h"})->showHelp);
    EXPECT_TRUE(parse({"--help"})->showHelp);
    EXPECT_TRUE(parse({"--version"})->showVersion);
}

TEST(ParseArgumentsTest, Errors) {
    EXPECT_FALSE(parse({"--bogus"}).has_value());
    EXPECT_FALSE(parse({"script.py"}).has_value());
    EXPECT_FALSE(parse({"--file"}).has_value());
    EXPECT_FALSE(parse({"--timeout", "0"}).has_value());
    EXPECT_FALSE(parse({"--timeout", "-1"}).has_value());
    EXPECT_FALSE(parse({"--timeout", "5s"}).has_value());
    EXPECT_FALSE(parse({"--mem-mb", ""}).has_value());
    EXPECT_FALSE(parse({"--log-level", "chatty"}).has_value());
}

TEST(ParseArgumentsTest, ErrorMessagesNameTheFlag) {
    auto missing = parse({"--python-exe"});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), "--python-exe requires a value");

    auto bad = parse({"--cpu-seconds=abc"});
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error(), "--cpu-seconds expects a positive integer, got 'abc'");
}

// =============================================================================
// Overrides
// =============================================================================

TEST(ApplyOverridesTest, FlagsWinOverConfig) {
    SandboxConfig config;
    config.interpreter.path = "python3";
    config.logging.level = "error";

    CliOptions options;
    options.timeoutSeconds = 9;
    options.cpuSeconds = 8;
    options.memoryMB = 32;
    options.pythonExe = "/opt/py/bin/python3";
    options.logLevel = "trace";

    ASSERT_TRUE(applyOverrides(config, options).has_value());
    EXPECT_EQ(config.limits.wallClockTimeoutSeconds(), 9u);
    EXPECT_EQ(config.limits.cpuSeconds(), 8u);
    EXPECT_EQ(config.limits.memoryBytes(), 32ULL * 1024 * 1024);
    EXPECT_EQ(config.interpreter.path, "/opt/py/bin/python3");
    EXPECT_EQ(config.logging.level, "trace");
}

TEST(ApplyOverridesTest, UnsetFlagsKeepConfig) {
    SandboxConfig config;
    config.limits = sandrun::isolated::ResourceLimitProfile::quick();
    config.interpreter.path = "python3";

    ASSERT_TRUE(applyOverrides(config, CliOptions{}).has_value());
    EXPECT_EQ(config.limits, sandrun::isolated::ResourceLimitProfile::quick());
    EXPECT_EQ(config.interpreter.path, "python3");
}

TEST(ApplyOverridesTest, ZeroIsRejected) {
    SandboxConfig config;
    CliOptions options;
    options.memoryMB = 0;
    EXPECT_FALSE(applyOverrides(config, options).has_value());
    EXPECT_EQ(config.limits, sandrun::isolated::ResourceLimitProfile::defaults());
}

TEST(ApplyOverridesTest, OverflowingMemoryIsRejected) {
    auto options = parse({"--mem-mb", "17592186044417"});
    ASSERT_TRUE(options.has_value());

    SandboxConfig config;
    auto applied = applyOverrides(config, *options);
    ASSERT_FALSE(applied.has_value());
    EXPECT_EQ(applied.error(), "Invalid --mem-mb");
    EXPECT_EQ(config.limits, sandrun::isolated::ResourceLimitProfile::defaults());
}

// =============================================================================
// Rendering
// =============================================================================

class RenderTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(RenderTest, SuccessPrintsOnlyStreams) {
    ExecutionOutcome outcome;
    outcome.output = "hi\n";
    outcome.exitCode = 0;

    renderPlain(outcome, out_, err_);
    EXPECT_EQ(out_.str(), "hi\n");
    EXPECT_EQ(err_.str(), "");
    EXPECT_EQ(exitCodeFor(outcome), ExitCode::Success);
}

TEST_F(RenderTest, RuntimeErrorSummary) {
    ExecutionOutcome outcome;
    outcome.status = ExecutionStatus::RuntimeError;
    outcome.output = "partial";
    outcome.errorOutput = "Traceback...\nZeroDivisionError: division by zero\n";
    outcome.errorKind = "ZeroDivisionError";
    outcome.errorMessage = "division by zero";
    outcome.exitCode = 1;

    renderPlain(outcome, out_, err_);
    EXPECT_EQ(out_.str(),
              "partial\n"
              "Status: runtime_error\n"
              "Error Type: ZeroDivisionError\n"
              "Error Category: runtime\n"
              "Error Message: division by zero\n");
    EXPECT_EQ(err_.str(), outcome.errorOutput);
    EXPECT_EQ(exitCodeFor(outcome), ExitCode::RuntimeError);
}

TEST_F(RenderTest, TimeoutSummary) {
    ExecutionOutcome outcome;
    outcome.status = ExecutionStatus::Timeout;
    outcome.errorKind = "TimeoutExpired";
    outcome.errorMessage = "Execution timed out after 1 seconds (wall-clock limit exceeded)";

    renderPlain(outcome, out_, err_);
    EXPECT_NE(out_.str().find("Status: timeout\n"), std::string::npos);
    EXPECT_NE(out_.str().find("Error Type: TimeoutExpired\n"), std::string::npos);
    EXPECT_NE(out_.str().find("Error Category: timeout\n"), std::string::npos);
    EXPECT_EQ(exitCodeFor(outcome), ExitCode::Timeout);
}

TEST_F(RenderTest, CategoryFollowsErrorKind) {
    ExecutionOutcome outcome;
    outcome.status = ExecutionStatus::RuntimeError;
    outcome.errorKind = "ModuleNotFoundError";
    outcome.errorMessage = "No module named 'numpy'";
    renderPlain(outcome, out_, err_);
    EXPECT_EQ(out_.str(),
              "Status: runtime_error\n"
              "Error Type: ModuleNotFoundError\n"
              "Error Category: environment\n"
              "Error Message: No module named 'numpy'\n");

    std::ostringstream syntax;
    outcome.errorKind = "SyntaxError";
    renderPlain(outcome, syntax, err_);
    EXPECT_NE(syntax.str().find("Error Category: syntax\n"), std::string::npos);

    std::ostringstream custom;
    outcome.errorKind = "MyAppError";
    outcome.errorMessage = "bad state";
    renderPlain(outcome, custom, err_);
    EXPECT_EQ(custom.str(),
              "Status: runtime_error\n"
              "Error Type: MyAppError\n"
              "Error Message: bad state\n");
}

TEST_F(RenderTest, UnclassifiedFailures) {
    ExecutionOutcome signalled;
    signalled.status = ExecutionStatus::RuntimeError;
    signalled.termSignal = 9;
    renderPlain(signalled, out_, err_);
    EXPECT_EQ(out_.str(), "Status: runtime_error\nTerminated by signal 9\n");

    std::ostringstream out;
    ExecutionOutcome exited;
    exited.status = ExecutionStatus::RuntimeError;
    exited.exitCode = 4;
    renderPlain(exited, out, err_);
    EXPECT_EQ(out.str(), "Status: runtime_error\nExited with code 4\n");
}

TEST_F(RenderTest, TruncationNotice) {
    ExecutionOutcome outcome;
    outcome.output = "xxxx";
    outcome.outputTruncated = true;
    renderPlain(outcome, out_, err_);
    EXPECT_EQ(err_.str(), "[output truncated]\n");
}

TEST_F(RenderTest, JsonDocument) {
    ExecutionOutcome outcome;
    outcome.output = "hi\n";
    outcome.exitCode = 0;

    auto j = nlohmann::json::parse(renderJson(outcome));
    EXPECT_EQ(j["status"], "success");
    EXPECT_EQ(j["stdout"], "hi\n");
    EXPECT_TRUE(j["error_type"].is_null());
}

TEST_F(RenderTest, UsageListsOptions) {
    printUsage(out_, "sandrun");
    auto text = out_.str();
    EXPECT_TRUE(text.starts_with("Usage: sandrun"));
    for (const char* flag : {"--file", "--stdin-data", "--timeout", "--cpu-seconds",
                             "--mem-mb", "--python-exe", "--json", "--config"}) {
        EXPECT_NE(text.find(flag), std::string::npos) << flag;
    }
}
