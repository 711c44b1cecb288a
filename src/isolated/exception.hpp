/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SANDRUN_ISOLATED_EXCEPTION_HPP
#define SANDRUN_ISOLATED_EXCEPTION_HPP

#include "types.hpp"

#include <format>
#include <stdexcept>
#include <string>

namespace sandrun::isolated {

/**
 * @brief Thrown when a run could not be started at all
 *
 * Failures of the code under test never raise; they are reported in the
 * ExecutionOutcome.
 */
class LaunchError : public std::runtime_error {
public:
    explicit LaunchError(RunnerError code)
        : std::runtime_error(std::format("Launch failed: {}", runnerErrorToString(code))),
          code_(code) {}

    LaunchError(RunnerError code, const std::string& detail)
        : std::runtime_error(std::format("Launch failed: {} ({})",
                                         runnerErrorToString(code), detail)),
          code_(code) {}

    [[nodiscard]] RunnerError code() const noexcept { return code_; }

private:
    RunnerError code_;
};

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_EXCEPTION_HPP
