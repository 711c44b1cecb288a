/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Central Logging Manager - owns sinks and named loggers

**************************************************/

#ifndef SANDRUN_LOGGING_LOGGING_MANAGER_HPP
#define SANDRUN_LOGGING_LOGGING_MANAGER_HPP

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "../sinks/sink_factory.hpp"
#include "types.hpp"

namespace sandrun::logging {

/**
 * @brief Central logging manager with spdlog integration
 *
 * Builds the configured sinks, installs them on spdlog's default logger
 * and hands out named loggers sharing the same sinks. Library code keeps
 * logging through spdlog::info() and friends.
 */
class LoggingManager {
public:
    /**
     * @brief Get singleton instance
     */
    static auto getInstance() -> LoggingManager&;

    /**
     * @brief Initialize logging system with configuration
     * @param config Logging configuration
     * @return Number of sinks that were created
     */
    auto initialize(const LoggingConfig& config) -> size_t;

    /**
     * @brief Shutdown logging system gracefully
     */
    void shutdown();

    /**
     * @brief Check if manager is initialized
     */
    [[nodiscard]] auto isInitialized() const -> bool;

    // ========== Logger Management ==========

    /**
     * @brief Get or create a named logger
     * @param name Logger name
     * @return Shared pointer to logger
     */
    auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Names of the loggers created so far
     */
    [[nodiscard]] auto listLoggers() const -> std::vector<std::string>;

    /**
     * @brief Set log level for all loggers
     * @param level New level
     */
    void setGlobalLevel(spdlog::level::level_enum level);

    // ========== Utility ==========

    /**
     * @brief Flush all loggers
     */
    void flush();

    /**
     * @brief Get current configuration
     */
    [[nodiscard]] auto getConfig() const -> LoggingConfig;

private:
    LoggingManager() = default;
    ~LoggingManager();

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    void setupDefaultLogger();
    void resetLocked();

    mutable std::shared_mutex mutex_;
    LoggingConfig config_;
    bool initialized_{false};

    std::vector<spdlog::sink_ptr> sinks_;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
};

}  // namespace sandrun::logging

#endif  // SANDRUN_LOGGING_LOGGING_MANAGER_HPP
