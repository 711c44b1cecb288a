/*
 * isolated_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file isolated_runner.hpp
 * @brief Backend interface that turns a request into raw process data
 * @date 2024
 * @version 1.0.0
 */

#ifndef SANDRUN_ISOLATED_ISOLATED_RUNNER_HPP
#define SANDRUN_ISOLATED_ISOLATED_RUNNER_HPP

#include "environment.hpp"
#include "limits.hpp"
#include "outcome.hpp"
#include "types.hpp"

#include <string_view>

namespace sandrun::isolated {

/**
 * @brief Execution backend
 *
 * Implementations must be safe to call concurrently: every call owns
 * its own artifact, child and pipes.
 */
class IsolatedRunner {
public:
    virtual ~IsolatedRunner() = default;

    /**
     * @brief Run one request to completion or timeout
     * @param request Source and optional stdin/interpreter override
     * @param limits Resolved limits for this run
     * @return Raw data for the classifier, or a launch error
     */
    [[nodiscard]] virtual Result<RawExecution> run(
        const ExecutionRequest& request, const ResourceLimitProfile& limits) const = 0;

    /**
     * @brief Short backend name for logs
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Backend that runs each request in a bounded child process
 */
class ProcessRunner : public IsolatedRunner {
public:
    explicit ProcessRunner(InterpreterConfig interpreter = {},
                           EnvironmentMap extraEnvironment = {});

    [[nodiscard]] Result<RawExecution> run(
        const ExecutionRequest& request,
        const ResourceLimitProfile& limits) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "process"; }

    [[nodiscard]] const InterpreterConfig& interpreter() const noexcept {
        return interpreter_;
    }

    [[nodiscard]] const EnvironmentMap& extraEnvironment() const noexcept {
        return extraEnvironment_;
    }

private:
    InterpreterConfig interpreter_;
    EnvironmentMap extraEnvironment_;
};

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_ISOLATED_RUNNER_HPP
