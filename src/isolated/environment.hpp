/*
 * environment.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file environment.hpp
 * @brief Explicit child environment construction
 */

#ifndef SANDRUN_ISOLATED_ENVIRONMENT_HPP
#define SANDRUN_ISOLATED_ENVIRONMENT_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sandrun::isolated {

/**
 * @brief Environment variables passed to a child, ordered by name
 */
using EnvironmentMap = std::map<std::string, std::string>;

/**
 * @brief Builds the minimal environment for one run
 *
 * Only PATH (taken from the host, or a fixed fallback) and the encoding
 * variables are set; nothing else is inherited from the caller.
 * @param extra Additional variables, applied last
 */
[[nodiscard]] EnvironmentMap buildChildEnvironment(const EnvironmentMap& extra = {});

/**
 * @brief Flattens a map into "NAME=value" entries
 */
[[nodiscard]] std::vector<std::string> toEnvironmentEntries(const EnvironmentMap& env);

/**
 * @brief Reads one variable from the host environment
 */
[[nodiscard]] std::optional<std::string> hostEnvironmentValue(const char* name);

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_ENVIRONMENT_HPP
