/*
 * environment.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "environment.hpp"

#include <cstdlib>

namespace sandrun::isolated {

namespace {
#ifdef _WIN32
constexpr const char* FALLBACK_PATH = "C:\\Windows\\System32;C:\\Windows";
#else
constexpr const char* FALLBACK_PATH = "/usr/local/bin:/usr/bin:/bin";
#endif
}  // namespace

std::optional<std::string> hostEnvironmentValue(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

EnvironmentMap buildChildEnvironment(const EnvironmentMap& extra) {
    EnvironmentMap env;
    env["PATH"] = hostEnvironmentValue("PATH").value_or(FALLBACK_PATH);
    env["PYTHONIOENCODING"] = "utf-8";
    env["PYTHONNOUSERSITE"] = "1";
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    env["LC_ALL"] = "C.UTF-8";
    env["LANG"] = "C.UTF-8";
#ifdef _WIN32
    // CreateProcess needs SystemRoot for most interpreters to start
    if (auto root = hostEnvironmentValue("SystemRoot")) {
        env["SystemRoot"] = *root;
    }
#endif

    for (const auto& [name, value] : extra) {
        env[name] = value;
    }
    return env;
}

std::vector<std::string> toEnvironmentEntries(const EnvironmentMap& env) {
    std::vector<std::string> entries;
    entries.reserve(env.size());
    for (const auto& [name, value] : env) {
        entries.push_back(name + "=" + value);
    }
    return entries;
}

}  // namespace sandrun::isolated
