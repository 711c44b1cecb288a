/*
 * cli_options.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SANDRUN_APP_CLI_OPTIONS_HPP
#define SANDRUN_APP_CLI_OPTIONS_HPP

#include "config/sandbox_config.hpp"
#include "isolated/outcome.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace sandrun::app {

inline constexpr std::string_view SANDRUN_VERSION = "1.0.0";

/**
 * @brief Process exit codes of the sandrun executable
 */
enum class ExitCode : int {
    Success = 0,
    RuntimeError = 1,
    Timeout = 2,
    LaunchFailure = 3,
    UsageError = 64
};

/**
 * @brief Parsed command line
 */
struct CliOptions {
    std::optional<std::string> file;
    std::optional<std::string> stdinData;
    std::optional<std::uint64_t> timeoutSeconds;
    std::optional<std::uint64_t> cpuSeconds;
    std::optional<std::uint64_t> memoryMB;
    std::optional<std::string> pythonExe;
    std::optional<std::string> configPath;
    std::optional<std::string> logLevel;
    bool json{false};
    bool showHelp{false};
    bool showVersion{false};
};

/**
 * @brief Parse argv; accepts "--flag value" and "--flag=value"
 * @return Options, or a message describing the usage error
 */
[[nodiscard]] std::expected<CliOptions, std::string> parseArguments(
    int argc, const char* const* argv);

/**
 * @brief Apply command-line overrides on top of file configuration
 * @return Nothing, or a message describing the rejected value
 */
[[nodiscard]] std::expected<void, std::string> applyOverrides(
    config::SandboxConfig& config, const CliOptions& options);

/**
 * @brief Print the usage block
 */
void printUsage(std::ostream& out, std::string_view program);

/**
 * @brief Human-readable rendering of an outcome
 *
 * Program stdout goes to out verbatim and program stderr to err
 * verbatim; a non-success outcome is summarized on out.
 */
void renderPlain(const isolated::ExecutionOutcome& outcome, std::ostream& out,
                 std::ostream& err);

/**
 * @brief Pretty-printed JSON rendering of an outcome
 */
[[nodiscard]] std::string renderJson(const isolated::ExecutionOutcome& outcome);

/**
 * @brief Process exit code for an outcome
 */
[[nodiscard]] ExitCode exitCodeFor(const isolated::ExecutionOutcome& outcome) noexcept;

}  // namespace sandrun::app

#endif  // SANDRUN_APP_CLI_OPTIONS_HPP
