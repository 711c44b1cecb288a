/*
 * config_discovery.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_discovery.hpp"
#include "environment.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace sandrun::isolated {

namespace fs = std::filesystem;

namespace {
#ifdef _WIN32
constexpr char PATH_LIST_SEPARATOR = ';';
constexpr std::string_view EXECUTABLE_SUFFIX = ".exe";
#else
constexpr char PATH_LIST_SEPARATOR = ':';
#endif
}  // namespace

bool ConfigDiscovery::isExecutable(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return ::access(path.c_str(), X_OK) == 0;
#endif
}

std::optional<fs::path> ConfigDiscovery::searchPath(std::string_view name) {
    auto pathValue = hostEnvironmentValue("PATH");
    if (!pathValue || name.empty()) {
        return std::nullopt;
    }

    std::string_view remaining = *pathValue;
    while (true) {
        auto separator = remaining.find(PATH_LIST_SEPARATOR);
        auto entry = remaining.substr(0, separator);
        if (!entry.empty()) {
            fs::path candidate = fs::path(entry) / fs::path(name);
#ifdef _WIN32
            if (!candidate.has_extension()) {
                candidate += EXECUTABLE_SUFFIX;
            }
#endif
            if (isExecutable(candidate)) {
                return candidate;
            }
        }
        if (separator == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(separator + 1);
    }
    return std::nullopt;
}

std::optional<fs::path> ConfigDiscovery::findPythonExecutable() {
#ifdef _WIN32
    std::vector<std::string_view> names = {"python", "python3", "py"};
#else
    std::vector<std::string_view> names = {"python3", "python"};
#endif
    for (auto name : names) {
        if (auto found = searchPath(name)) {
            return found;
        }
    }

#ifdef _WIN32
    std::vector<fs::path> searchPaths = {
        "C:\\Python313\\python.exe",
        "C:\\Python312\\python.exe",
        "C:\\Python311\\python.exe",
        "C:\\Python310\\python.exe"
    };
#else
    std::vector<fs::path> searchPaths = {
        "/usr/bin/python3",
        "/usr/local/bin/python3",
        "/usr/bin/python"
    };
#endif
    for (const auto& path : searchPaths) {
        if (isExecutable(path)) {
            return path;
        }
    }
    return std::nullopt;
}

Result<fs::path> ConfigDiscovery::resolveInterpreter(const fs::path& configured) {
    if (configured.empty()) {
        auto found = findPythonExecutable();
        if (!found) {
            spdlog::error("No Python interpreter found on PATH or in standard locations");
            return std::unexpected(RunnerError::InterpreterNotFound);
        }
        return *found;
    }

    if (!configured.has_parent_path()) {
        auto found = searchPath(configured.string());
        if (!found) {
            spdlog::error("Interpreter '{}' not found on PATH", configured.string());
            return std::unexpected(RunnerError::InterpreterNotFound);
        }
        return *found;
    }

    if (!isExecutable(configured)) {
        spdlog::error("Interpreter '{}' is missing or not executable",
                      configured.string());
        return std::unexpected(RunnerError::InterpreterNotFound);
    }
    return configured;
}

std::optional<std::string> ConfigDiscovery::getInterpreterVersion(
    const fs::path& interpreterPath) {
    if (!isExecutable(interpreterPath)) {
        return std::nullopt;
    }

#ifdef _WIN32
    std::string cmd = "\"\"" + interpreterPath.string() + "\" --version 2>&1\"";
    FILE* pipe = _popen(cmd.c_str(), "r");
#else
    std::string cmd = "'" + interpreterPath.string() + "' --version 2>&1";
    FILE* pipe = popen(cmd.c_str(), "r");
#endif
    if (!pipe) return std::nullopt;

    char buffer[128];
    std::string result;
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result += buffer;
    }

#ifdef _WIN32
    int status = _pclose(pipe);
#else
    int status = pclose(pipe);
#endif
    if (status != 0) {
        spdlog::debug("'{} --version' exited with status {}",
                      interpreterPath.string(), status);
        return std::nullopt;
    }

    while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
        result.pop_back();
    }

    // Parse "Python X.Y.Z"
    constexpr std::string_view prefix = "Python ";
    if (result.starts_with(prefix)) {
        return result.substr(prefix.size());
    }
    return std::nullopt;
}

}  // namespace sandrun::isolated
