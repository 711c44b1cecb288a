/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include <spdlog/sinks/sink.h>

namespace sandrun::logging {

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::~LoggingManager() {
    if (initialized_) {
        shutdown();
    }
}

auto LoggingManager::initialize(const LoggingConfig& config) -> size_t {
    std::unique_lock lock(mutex_);

    if (initialized_) {
        // Don't call shutdown() here to avoid deadlock, just clean up
        resetLocked();
    }

    config_ = config;

    for (const auto& sink_config : config.sinks) {
        auto sink = SinkFactory::createSink(sink_config);
        if (sink) {
            if (sink_config.pattern.empty()) {
                sink->set_pattern(config.default_pattern);
            }
            sinks_.push_back(sink);
        }
    }

    setupDefaultLogger();

    initialized_ = true;
    spdlog::debug("LoggingManager initialized with {} of {} sinks", sinks_.size(),
                  config.sinks.size());
    return sinks_.size();
}

void LoggingManager::shutdown() {
    std::unique_lock lock(mutex_);

    if (!initialized_) {
        return;
    }

    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
    spdlog::default_logger()->flush();

    resetLocked();

    // Messages logged after shutdown are dropped
    spdlog::set_default_logger(
        std::make_shared<spdlog::logger>("", spdlog::sinks_init_list{}));
    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::shared_lock lock(mutex_);
    return initialized_;
}

auto LoggingManager::getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    std::unique_lock lock(mutex_);

    if (auto it = loggers_.find(name); it != loggers_.end()) {
        return it->second;
    }

    auto logger =
        std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(config_.default_level);
    loggers_[name] = logger;
    return logger;
}

auto LoggingManager::listLoggers() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);

    std::vector<std::string> names;
    names.reserve(loggers_.size());
    for (const auto& [name, logger] : loggers_) {
        names.push_back(name);
    }
    return names;
}

void LoggingManager::setGlobalLevel(spdlog::level::level_enum level) {
    std::unique_lock lock(mutex_);

    for (const auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
    spdlog::set_level(level);
    config_.default_level = level;
    spdlog::debug("Global log level set to {}", levelToString(level));
}

void LoggingManager::flush() {
    std::shared_lock lock(mutex_);
    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

auto LoggingManager::getConfig() const -> LoggingConfig {
    std::shared_lock lock(mutex_);
    return config_;
}

void LoggingManager::setupDefaultLogger() {
    auto default_logger = std::make_shared<spdlog::logger>(
        "sandrun", sinks_.begin(), sinks_.end());

    default_logger->set_level(config_.default_level);

    spdlog::set_default_logger(default_logger);
}

void LoggingManager::resetLocked() {
    loggers_.clear();
    sinks_.clear();
}

}  // namespace sandrun::logging
