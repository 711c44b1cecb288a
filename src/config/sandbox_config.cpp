/*
 * sandbox_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sandbox_config.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

namespace sandrun::config {

json SandboxConfig::toJson() const {
    return {{"limits", limits.toJson()},
            {"interpreter", interpreter.toJson()},
            {"environment", environment},
            {"logging", logging.toJson()}};
}

std::expected<SandboxConfig, ConfigError> SandboxConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        spdlog::error("Configuration root must be a JSON object");
        return std::unexpected(ConfigError::InvalidValue);
    }

    SandboxConfig cfg;
    try {
        if (j.contains("limits")) {
            auto limits = isolated::ResourceLimitProfile::fromJson(j.at("limits"));
            if (!limits) {
                spdlog::error("Invalid 'limits' section");
                return std::unexpected(ConfigError::InvalidValue);
            }
            cfg.limits = *limits;
        }
        if (j.contains("interpreter")) {
            cfg.interpreter = InterpreterSection::fromJson(j.at("interpreter"));
        }
        if (j.contains("environment")) {
            cfg.environment = j.at("environment").get<isolated::EnvironmentMap>();
        }
        if (j.contains("logging")) {
            cfg.logging = LoggingSection::fromJson(j.at("logging"));
        }
    } catch (const json::exception& e) {
        spdlog::error("Invalid configuration value: {}", e.what());
        return std::unexpected(ConfigError::InvalidValue);
    }

    if (!sandrun::logging::isValidLevel(cfg.logging.level)) {
        spdlog::error("Unknown log level '{}'", cfg.logging.level);
        return std::unexpected(ConfigError::InvalidValue);
    }
    for (const auto& [name, value] : cfg.environment) {
        if (name.empty() || name.find('=') != std::string::npos) {
            spdlog::error("Invalid environment variable name '{}'", name);
            return std::unexpected(ConfigError::InvalidValue);
        }
    }

    return cfg;
}

std::expected<SandboxConfig, ConfigError> SandboxConfig::loadFromFile(
    const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open configuration file {}", path.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    json j = json::parse(file, nullptr, false, true);
    if (j.is_discarded()) {
        spdlog::error("Configuration file {} is not valid JSON", path.string());
        return std::unexpected(ConfigError::ParseError);
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return fromJson(j);
}

isolated::RunnerConfig SandboxConfig::toRunnerConfig() const {
    isolated::RunnerConfig config;
    config.limits = limits;
    config.interpreter.path = interpreter.path;
    config.interpreter.arguments = interpreter.arguments;
    config.environment = environment;
    return config;
}

sandrun::logging::LoggingConfig SandboxConfig::toLoggingConfig() const {
    auto config = sandrun::logging::LoggingConfig::createForCli(
        sandrun::logging::levelFromString(logging.level), logging.file);
    if (!logging.pattern.empty()) {
        config.sinks.front().pattern = logging.pattern;
    }
    return config;
}

}  // namespace sandrun::config
