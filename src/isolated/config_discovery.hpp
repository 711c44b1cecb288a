/*
 * config_discovery.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SANDRUN_ISOLATED_CONFIG_DISCOVERY_HPP
#define SANDRUN_ISOLATED_CONFIG_DISCOVERY_HPP

#include "types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sandrun::isolated {

/**
 * @brief Interpreter discovery and validation utilities
 */
class ConfigDiscovery {
public:
    /**
     * @brief Find the host's default Python interpreter
     * @return Path to the interpreter or nullopt
     */
    [[nodiscard]] static std::optional<std::filesystem::path> findPythonExecutable();

    /**
     * @brief Search PATH for an executable name
     * @param name Bare program name such as "python3"
     * @return Full path or nullopt
     */
    [[nodiscard]] static std::optional<std::filesystem::path> searchPath(
        std::string_view name);

    /**
     * @brief Resolve a configured interpreter to an executable file
     *
     * Empty paths fall back to findPythonExecutable(); bare names are
     * searched on PATH; anything else must name an existing executable.
     * @return Resolved path or InterpreterNotFound
     */
    [[nodiscard]] static Result<std::filesystem::path> resolveInterpreter(
        const std::filesystem::path& configured);

    /**
     * @brief Check whether a path names an executable regular file
     */
    [[nodiscard]] static bool isExecutable(const std::filesystem::path& path);

    /**
     * @brief Get the interpreter version string
     * @param interpreterPath Path to the interpreter
     * @return Version string such as "3.12.1" or nullopt
     */
    [[nodiscard]] static std::optional<std::string> getInterpreterVersion(
        const std::filesystem::path& interpreterPath);
};

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_CONFIG_DISCOVERY_HPP
