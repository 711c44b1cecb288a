/*
 * runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file runner.hpp
 * @brief Sandboxed Diagnostic Runner - Public API
 * @date 2024
 * @version 1.0.0
 *
 * This is the main public interface for sandboxed code execution.
 * It provides a clean facade over the runner backend and the outcome
 * classifier.
 */

#ifndef SANDRUN_ISOLATED_RUNNER_HPP
#define SANDRUN_ISOLATED_RUNNER_HPP

#include "environment.hpp"
#include "exception.hpp"
#include "isolated_runner.hpp"
#include "limits.hpp"
#include "outcome.hpp"
#include "types.hpp"

#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace sandrun::isolated {

/**
 * @brief Settings shared by every run of one DiagnosticRunner
 */
struct RunnerConfig {
    ResourceLimitProfile limits;        ///< Applied when a request has none
    InterpreterConfig interpreter;
    EnvironmentMap environment;         ///< Extra child variables
};

/**
 * @brief Diagnostic Runner
 *
 * Runs untrusted source text in a bounded child and classifies what
 * happened. Calls are independent and may run concurrently.
 */
class DiagnosticRunner {
public:
    /**
     * @brief Constructs a runner with default configuration
     */
    DiagnosticRunner();

    /**
     * @brief Constructs a runner with the process backend
     */
    explicit DiagnosticRunner(RunnerConfig config);

    /**
     * @brief Constructs a runner with a custom backend
     */
    DiagnosticRunner(RunnerConfig config, std::unique_ptr<IsolatedRunner> backend);

    ~DiagnosticRunner();

    // Disable copy
    DiagnosticRunner(const DiagnosticRunner&) = delete;
    DiagnosticRunner& operator=(const DiagnosticRunner&) = delete;

    // Enable move
    DiagnosticRunner(DiagnosticRunner&&) noexcept;
    DiagnosticRunner& operator=(DiagnosticRunner&&) noexcept;

    // =========================================================================
    // Configuration
    // =========================================================================

    /**
     * @brief Gets the current configuration
     */
    [[nodiscard]] const RunnerConfig& getConfig() const;

    /**
     * @brief Gets the backend in use
     */
    [[nodiscard]] const IsolatedRunner& backend() const;

    // =========================================================================
    // Execution
    // =========================================================================

    /**
     * @brief Runs one request synchronously
     * @param request Source, optional stdin, interpreter and limits
     * @return Classified outcome
     * @throws LaunchError if the child could not be started
     */
    [[nodiscard]] ExecutionOutcome execute(const ExecutionRequest& request) const;

    /**
     * @brief Runs the contents of a source file
     * @throws LaunchError with SourceNotReadable if the file cannot be read
     */
    [[nodiscard]] ExecutionOutcome executeFile(
        const std::filesystem::path& sourcePath,
        std::optional<std::string> stdinData = std::nullopt,
        std::optional<ResourceLimitProfile> limits = std::nullopt) const;

    /**
     * @brief Runs one request on a separate thread
     *
     * A LaunchError is delivered through the future.
     */
    [[nodiscard]] std::future<ExecutionOutcome> executeAsync(
        ExecutionRequest request) const;

    // =========================================================================
    // Utility
    // =========================================================================

    /**
     * @brief Validates the configuration
     * @return Success, or InterpreterNotFound / InvalidConfiguration
     */
    [[nodiscard]] Result<void> validateConfig() const;

    /**
     * @brief Finds the host's default interpreter
     */
    [[nodiscard]] static std::optional<std::filesystem::path> findInterpreter();

    /**
     * @brief Gets the version of the configured interpreter
     */
    [[nodiscard]] std::optional<std::string> getInterpreterVersion() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

/**
 * @brief Factory for creating diagnostic runners
 */
class RunnerFactory {
public:
    /**
     * @brief Creates a runner with default limits
     */
    [[nodiscard]] static std::unique_ptr<DiagnosticRunner> create();

    /**
     * @brief Creates a runner with tight limits for quick checks
     */
    [[nodiscard]] static std::unique_ptr<DiagnosticRunner> createQuick();

    /**
     * @brief Creates a runner with relaxed limits for heavier snippets
     */
    [[nodiscard]] static std::unique_ptr<DiagnosticRunner> createGenerous();

    /**
     * @brief Creates a runner with custom configuration
     */
    [[nodiscard]] static std::unique_ptr<DiagnosticRunner> create(
        const RunnerConfig& config);
};

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_RUNNER_HPP
