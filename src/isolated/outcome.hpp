/*
 * outcome.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file outcome.hpp
 * @brief Execution request and classified execution outcome
 * @date 2024
 * @version 1.0.0
 */

#ifndef SANDRUN_ISOLATED_OUTCOME_HPP
#define SANDRUN_ISOLATED_OUTCOME_HPP

#include "limits.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sandrun::isolated {

/**
 * @brief Final status of one isolated run
 */
enum class ExecutionStatus {
    Success,        ///< Exit code zero
    RuntimeError,   ///< Non-zero exit, crash or signal death
    Timeout         ///< Wall-clock limit exceeded
};

/**
 * @brief Get the wire name of an ExecutionStatus
 */
[[nodiscard]] constexpr std::string_view executionStatusToString(
    ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Success: return "success";
        case ExecutionStatus::RuntimeError: return "runtime_error";
        case ExecutionStatus::Timeout: return "timeout";
    }
    return "runtime_error";
}

/**
 * @brief Parse a wire name back into an ExecutionStatus
 */
[[nodiscard]] std::optional<ExecutionStatus> executionStatusFromString(
    std::string_view name) noexcept;

/**
 * @brief One execution request, owned by a single invocation
 */
struct ExecutionRequest {
    std::string sourceText;                          ///< Code to run
    std::optional<std::string> stdinData;            ///< Bytes for the child's stdin
    std::optional<std::filesystem::path> interpreterPath;  ///< Override interpreter
    std::optional<ResourceLimitProfile> limits;      ///< Defaults applied when absent
};

/**
 * @brief Classified result of one execution request
 */
struct ExecutionOutcome {
    ExecutionStatus status{ExecutionStatus::Success};
    std::string output;                     ///< Captured stdout
    std::string errorOutput;                ///< Captured stderr
    std::optional<std::string> errorKind;   ///< e.g. "TypeError", "TimeoutExpired"
    std::optional<std::string> errorMessage;

    std::optional<int> exitCode;            ///< Unset on timeout and signal death
    std::optional<int> termSignal;          ///< Terminating signal, if any
    std::chrono::milliseconds executionTime{0};
    bool outputTruncated{false};            ///< A stream hit the output ceiling

    [[nodiscard]] bool succeeded() const noexcept {
        return status == ExecutionStatus::Success;
    }
};

/**
 * @brief Serialize an outcome for CLI/JSON consumers
 *
 * Absent fields are emitted as null, never omitted.
 */
[[nodiscard]] nlohmann::json outcomeToJson(const ExecutionOutcome& outcome);

/**
 * @brief Parse an outcome produced by outcomeToJson
 * @return Outcome, or CommunicationError on a malformed document
 */
[[nodiscard]] Result<ExecutionOutcome> outcomeFromJson(const nlohmann::json& j);

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_OUTCOME_HPP
