/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>

namespace sandrun::logging {

namespace {
constexpr const char* CLI_PATTERN = "[sandrun] [%^%l%$] %v";
}  // namespace

// ============================================================================
// SinkConfig Implementation
// ============================================================================

auto SinkConfig::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"name", name},
                        {"type", type},
                        {"level", levelToString(level)},
                        {"pattern", pattern}};

    if (type == "file" || type == "rotating_file" || type == "daily_file") {
        j["file_path"] = file_path;
    }
    if (type == "rotating_file") {
        j["max_file_size"] = max_file_size;
        j["max_files"] = max_files;
    }
    if (type == "daily_file") {
        j["rotation_hour"] = rotation_hour;
        j["rotation_minute"] = rotation_minute;
    }

    return j;
}

auto SinkConfig::fromJson(const nlohmann::json& j) -> SinkConfig {
    SinkConfig config;
    config.name = j.value("name", "");
    config.type = j.value("type", "console");
    config.level = levelFromString(j.value("level", "trace"));
    config.pattern = j.value("pattern", "");
    config.file_path = j.value("file_path", "");
    config.max_file_size = j.value("max_file_size", size_t{10 * 1024 * 1024});
    config.max_files = j.value("max_files", size_t{5});
    config.rotation_hour = j.value("rotation_hour", 0);
    config.rotation_minute = j.value("rotation_minute", 0);
    return config;
}

// ============================================================================
// LoggingConfig Implementation
// ============================================================================

auto LoggingConfig::toJson() const -> nlohmann::json {
    nlohmann::json sinks_json = nlohmann::json::array();
    for (const auto& sink : sinks) {
        sinks_json.push_back(sink.toJson());
    }

    return {{"default_level", levelToString(default_level)},
            {"default_pattern", default_pattern},
            {"sinks", sinks_json}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    config.default_level = levelFromString(j.value("default_level", "info"));
    config.default_pattern = j.value("default_pattern", config.default_pattern);

    if (j.contains("sinks") && j["sinks"].is_array()) {
        for (const auto& sink_json : j["sinks"]) {
            config.sinks.push_back(SinkConfig::fromJson(sink_json));
        }
    }

    return config;
}

auto LoggingConfig::createDefault() -> LoggingConfig {
    LoggingConfig config;

    SinkConfig console_sink;
    console_sink.name = "console";
    console_sink.type = "console";
    console_sink.level = spdlog::level::info;
    config.sinks.push_back(console_sink);

    return config;
}

auto LoggingConfig::createForCli(spdlog::level::level_enum level,
                                 const std::string& file_path) -> LoggingConfig {
    LoggingConfig config;
    config.default_level = level;
    config.default_pattern = CLI_PATTERN;

    SinkConfig stderr_sink;
    stderr_sink.name = "stderr";
    stderr_sink.type = "stderr";
    stderr_sink.level = level;
    config.sinks.push_back(stderr_sink);

    if (!file_path.empty()) {
        SinkConfig file_sink;
        file_sink.name = "file";
        file_sink.type = "rotating_file";
        file_sink.level = spdlog::level::trace;
        file_sink.pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
        file_sink.file_path = file_path;
        config.sinks.push_back(file_sink);
        // The file sink filters on its own level
        config.default_level = spdlog::level::trace;
    }

    return config;
}

// ============================================================================
// Level Conversion Functions
// ============================================================================

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error" || level == "err")
        return spdlog::level::err;
    if (level == "critical" || level == "fatal")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;
    return spdlog::level::info;  // Default
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    auto sv = spdlog::level::to_string_view(level);
    return std::string(sv.data(), sv.size());
}

auto isValidLevel(const std::string& level) -> bool {
    static const std::vector<std::string> known = {
        "trace", "debug", "info",     "warn",  "warning",
        "error", "err",   "critical", "fatal", "off"};
    return std::find(known.begin(), known.end(), level) != known.end();
}

}  // namespace sandrun::logging
