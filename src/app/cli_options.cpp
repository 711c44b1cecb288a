/*
 * cli_options.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "cli_options.hpp"

#include "isolated/error_kind.hpp"
#include "logging/core/types.hpp"

#include <charconv>
#include <format>

namespace sandrun::app {

namespace {

std::expected<std::uint64_t, std::string> parsePositive(std::string_view flag,
                                                        std::string_view text) {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return std::unexpected(
            std::format("{} expects a positive integer, got '{}'", flag, text));
    }
    return value;
}

}  // namespace

std::expected<CliOptions, std::string> parseArguments(int argc,
                                                      const char* const* argv) {
    CliOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        std::optional<std::string> inlineValue;
        if (arg.starts_with("--")) {
            if (auto eq = arg.find('='); eq != std::string::npos) {
                inlineValue = arg.substr(eq + 1);
                arg.resize(eq);
            }
        }

        auto takeValue = [&]() -> std::expected<std::string, std::string> {
            if (inlineValue) {
                return *inlineValue;
            }
            if (i + 1 < argc) {
                return std::string(argv[++i]);
            }
            return std::unexpected(std::format("{} requires a value", arg));
        };

        auto takeNumber = [&]() -> std::expected<std::uint64_t, std::string> {
            auto value = takeValue();
            if (!value) {
                return std::unexpected(value.error());
            }
            return parsePositive(arg, *value);
        };

        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--version") {
            options.showVersion = true;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--file" || arg == "-f") {
            auto value = takeValue();
            if (!value) return std::unexpected(value.error());
            options.file = *value;
        } else if (arg == "--stdin-data") {
            auto value = takeValue();
            if (!value) return std::unexpected(value.error());
            options.stdinData = *value;
        } else if (arg == "--python-exe") {
            auto value = takeValue();
            if (!value) return std::unexpected(value.error());
            options.pythonExe = *value;
        } else if (arg == "--config") {
            auto value = takeValue();
            if (!value) return std::unexpected(value.error());
            options.configPath = *value;
        } else if (arg == "--log-level") {
            auto value = takeValue();
            if (!value) return std::unexpected(value.error());
            if (!logging::isValidLevel(*value)) {
                return std::unexpected(std::format("Unknown log level '{}'", *value));
            }
            options.logLevel = *value;
        } else if (arg == "--timeout") {
            auto value = takeNumber();
            if (!value) return std::unexpected(value.error());
            options.timeoutSeconds = *value;
        } else if (arg == "--cpu-seconds") {
            auto value = takeNumber();
            if (!value) return std::unexpected(value.error());
            options.cpuSeconds = *value;
        } else if (arg == "--mem-mb") {
            auto value = takeNumber();
            if (!value) return std::unexpected(value.error());
            options.memoryMB = *value;
        } else {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
    }

    return options;
}

std::expected<void, std::string> applyOverrides(config::SandboxConfig& config,
                                                const CliOptions& options) {
    auto limits = config.limits;

    if (options.timeoutSeconds) {
        auto updated = limits.withWallClockTimeoutSeconds(*options.timeoutSeconds);
        if (!updated) return std::unexpected("Invalid --timeout");
        limits = *updated;
    }
    if (options.cpuSeconds) {
        auto updated = limits.withCpuSeconds(*options.cpuSeconds);
        if (!updated) return std::unexpected("Invalid --cpu-seconds");
        limits = *updated;
    }
    if (options.memoryMB) {
        auto updated = limits.withMemoryMB(*options.memoryMB);
        if (!updated) return std::unexpected("Invalid --mem-mb");
        limits = *updated;
    }
    config.limits = limits;

    if (options.pythonExe) {
        config.interpreter.path = *options.pythonExe;
    }
    if (options.logLevel) {
        config.logging.level = *options.logLevel;
    }
    return {};
}

void printUsage(std::ostream& out, std::string_view program) {
    out << "Usage: " << program << " [options]\n"
        << "Runs a Python snippet in a resource-limited child process.\n"
        << "The snippet is read from --file, or from standard input.\n"
        << "Options:\n"
        << "  --file, -f <path>       Source file to run\n"
        << "  --stdin-data <text>     Data passed to the snippet's stdin\n"
        << "  --timeout <seconds>     Wall-clock limit (default: 5)\n"
        << "  --cpu-seconds <n>       CPU time limit (default: 5)\n"
        << "  --mem-mb <n>            Address space limit in MiB (default: 128)\n"
        << "  --python-exe <path>     Interpreter to run the snippet\n"
        << "  --json                  Print the outcome as JSON\n"
        << "  --config <path>         JSON configuration file\n"
        << "  --log-level <level>     trace, debug, info, warn, error, off\n"
        << "  --version               Show version\n"
        << "  --help, -h              Show this help message\n"
        << "Exit codes: 0 success, 1 runtime error, 2 timeout, "
           "3 launch failure, 64 usage error\n";
}

void renderPlain(const isolated::ExecutionOutcome& outcome, std::ostream& out,
                 std::ostream& err) {
    out << outcome.output;
    if (!outcome.errorOutput.empty()) {
        err << outcome.errorOutput;
    }
    if (outcome.outputTruncated) {
        err << "[output truncated]\n";
    }
    if (outcome.succeeded()) {
        return;
    }

    if (!outcome.output.empty() && !outcome.output.ends_with('\n')) {
        out << '\n';
    }
    out << "Status: " << isolated::executionStatusToString(outcome.status) << '\n';
    if (outcome.errorKind) {
        out << "Error Type: " << *outcome.errorKind << '\n';
        auto category = isolated::categoryOf(isolated::errorKindFromString(*outcome.errorKind));
        if (category != isolated::ErrorCategory::Unknown) {
            out << "Error Category: " << isolated::errorCategoryToString(category) << '\n';
        }
        out << "Error Message: " << outcome.errorMessage.value_or("") << '\n';
    } else if (outcome.termSignal) {
        out << "Terminated by signal " << *outcome.termSignal << '\n';
    } else if (outcome.exitCode) {
        out << "Exited with code " << *outcome.exitCode << '\n';
    }
}

std::string renderJson(const isolated::ExecutionOutcome& outcome) {
    return isolated::outcomeToJson(outcome).dump(
        2, ' ', false, nlohmann::json::error_handler_t::replace);
}

ExitCode exitCodeFor(const isolated::ExecutionOutcome& outcome) noexcept {
    switch (outcome.status) {
        case isolated::ExecutionStatus::Success: return ExitCode::Success;
        case isolated::ExecutionStatus::RuntimeError: return ExitCode::RuntimeError;
        case isolated::ExecutionStatus::Timeout: return ExitCode::Timeout;
    }
    return ExitCode::RuntimeError;
}

}  // namespace sandrun::app
