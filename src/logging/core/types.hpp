/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logging system type definitions

**************************************************/

#ifndef SANDRUN_LOGGING_TYPES_HPP
#define SANDRUN_LOGGING_TYPES_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sandrun::logging {

// Forward declarations
class LoggingManager;

/**
 * @brief Sink configuration structure
 */
struct SinkConfig {
    std::string name;
    std::string type;  // "console", "stderr", "file", "rotating_file", "daily_file"
    spdlog::level::level_enum level{spdlog::level::trace};
    std::string pattern;

    // File sink options
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};  // 10MB default
    size_t max_files{5};

    // Daily file options
    int rotation_hour{0};
    int rotation_minute{0};

    /**
     * @brief Convert sink config to JSON
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Create sink config from JSON
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> SinkConfig;
};

/**
 * @brief Logging manager configuration
 */
struct LoggingConfig {
    spdlog::level::level_enum default_level{spdlog::level::info};
    std::string default_pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    std::vector<SinkConfig> sinks;

    /**
     * @brief Convert config to JSON
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Create config from JSON
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;

    /**
     * @brief Create default configuration with a single console sink
     */
    [[nodiscard]] static auto createDefault() -> LoggingConfig;

    /**
     * @brief Configuration for command-line use
     *
     * Logs go to stderr so stdout carries only program output. A file
     * sink at trace level is added when file_path is not empty.
     */
    [[nodiscard]] static auto createForCli(spdlog::level::level_enum level,
                                           const std::string& file_path = "")
        -> LoggingConfig;
};

/**
 * @brief Convert level string to spdlog enum
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

/**
 * @brief Convert spdlog level enum to string
 */
[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

/**
 * @brief Check whether a string names a known level
 */
[[nodiscard]] auto isValidLevel(const std::string& level) -> bool;

}  // namespace sandrun::logging

#endif  // SANDRUN_LOGGING_TYPES_HPP
