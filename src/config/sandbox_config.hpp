/*
 * sandbox_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Sandbox runner configuration file (limits, interpreter,
environment, logging)

**************************************************/

#ifndef SANDRUN_CONFIG_SANDBOX_CONFIG_HPP
#define SANDRUN_CONFIG_SANDBOX_CONFIG_HPP

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "isolated/environment.hpp"
#include "isolated/limits.hpp"
#include "isolated/runner.hpp"
#include "logging/core/types.hpp"

namespace sandrun::config {

using json = nlohmann::json;

/**
 * @brief Configuration loading errors
 */
enum class ConfigError {
    FileNotFound,  ///< Path does not exist or cannot be opened
    ParseError,    ///< Not a JSON document
    InvalidValue   ///< Well-formed JSON with a bad value
};

/**
 * @brief Get string representation of ConfigError
 */
[[nodiscard]] constexpr std::string_view configErrorToString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound: return "Configuration file not found";
        case ConfigError::ParseError: return "Configuration file is not valid JSON";
        case ConfigError::InvalidValue: return "Configuration contains an invalid value";
    }
    return "Unknown configuration error";
}

/**
 * @brief Interpreter section
 */
struct InterpreterSection {
    std::string path;                                ///< Empty = auto-detect
    std::vector<std::string> arguments{"-I", "-B"};  ///< Isolation flags

    [[nodiscard]] json toJson() const {
        return {{"path", path}, {"arguments", arguments}};
    }

    /// @throws nlohmann::json::exception on a wrongly typed value
    [[nodiscard]] static InterpreterSection fromJson(const json& j) {
        InterpreterSection cfg;
        cfg.path = j.value("path", cfg.path);
        if (j.contains("arguments")) {
            cfg.arguments = j.at("arguments").get<std::vector<std::string>>();
        }
        return cfg;
    }
};

/**
 * @brief Logging section
 */
struct LoggingSection {
    std::string level{"warn"};   ///< trace, debug, info, warn, error, critical, off
    std::string file;            ///< Optional log file (rotating)
    std::string pattern;         ///< Optional stderr pattern

    [[nodiscard]] json toJson() const {
        return {{"level", level}, {"file", file}, {"pattern", pattern}};
    }

    /// @throws nlohmann::json::exception on a wrongly typed value
    [[nodiscard]] static LoggingSection fromJson(const json& j) {
        LoggingSection cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.file = j.value("file", cfg.file);
        cfg.pattern = j.value("pattern", cfg.pattern);
        return cfg;
    }
};

/**
 * @brief Complete sandbox configuration
 *
 * @example
 * ```json
 * {
 *   "limits": {"cpuSeconds": 5, "memoryMB": 128, "wallClockTimeoutSeconds": 5},
 *   "interpreter": {"path": "/usr/bin/python3", "arguments": ["-I", "-B"]},
 *   "environment": {"OMP_NUM_THREADS": "1"},
 *   "logging": {"level": "warn", "file": ""}
 * }
 * ```
 */
struct SandboxConfig {
    isolated::ResourceLimitProfile limits;
    InterpreterSection interpreter;
    isolated::EnvironmentMap environment;
    LoggingSection logging;

    [[nodiscard]] json toJson() const;

    /**
     * @brief Build a configuration from JSON, missing sections keep defaults
     */
    [[nodiscard]] static std::expected<SandboxConfig, ConfigError> fromJson(
        const json& j);

    /**
     * @brief Read and parse a configuration file
     */
    [[nodiscard]] static std::expected<SandboxConfig, ConfigError> loadFromFile(
        const std::filesystem::path& path);

    /**
     * @brief Settings for the diagnostic runner
     */
    [[nodiscard]] isolated::RunnerConfig toRunnerConfig() const;

    /**
     * @brief Settings for the logging manager
     */
    [[nodiscard]] sandrun::logging::LoggingConfig toLoggingConfig() const;
};

}  // namespace sandrun::config

#endif  // SANDRUN_CONFIG_SANDBOX_CONFIG_HPP
