/*
 * outcome.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "outcome.hpp"

#include <spdlog/spdlog.h>

namespace sandrun::isolated {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

template <typename T>
std::optional<T> optionalFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

}  // namespace

std::optional<ExecutionStatus> executionStatusFromString(
    std::string_view name) noexcept {
    if (name == "success") return ExecutionStatus::Success;
    if (name == "runtime_error" || name == "error") return ExecutionStatus::RuntimeError;
    if (name == "timeout") return ExecutionStatus::Timeout;
    return std::nullopt;
}

nlohmann::json outcomeToJson(const ExecutionOutcome& outcome) {
    return {
        {"status", std::string(executionStatusToString(outcome.status))},
        {"stdout", outcome.output},
        {"stderr", outcome.errorOutput},
        {"error_type", optionalToJson(outcome.errorKind)},
        {"error_message", optionalToJson(outcome.errorMessage)},
        {"exit_code", optionalToJson(outcome.exitCode)},
        {"signal", optionalToJson(outcome.termSignal)},
        {"duration_ms", outcome.executionTime.count()},
        {"output_truncated", outcome.outputTruncated}
    };
}

Result<ExecutionOutcome> outcomeFromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("status") || !j["status"].is_string()) {
        return std::unexpected(RunnerError::CommunicationError);
    }

    auto status = executionStatusFromString(j["status"].get<std::string>());
    if (!status) {
        spdlog::debug("Unknown outcome status '{}'", j["status"].get<std::string>());
        return std::unexpected(RunnerError::CommunicationError);
    }

    try {
        ExecutionOutcome outcome;
        outcome.status = *status;
        outcome.output = j.value("stdout", "");
        outcome.errorOutput = j.value("stderr", "");
        outcome.errorKind = optionalFromJson<std::string>(j, "error_type");
        outcome.errorMessage = optionalFromJson<std::string>(j, "error_message");
        outcome.exitCode = optionalFromJson<int>(j, "exit_code");
        outcome.termSignal = optionalFromJson<int>(j, "signal");
        outcome.executionTime =
            std::chrono::milliseconds{j.value("duration_ms", std::int64_t{0})};
        outcome.outputTruncated = j.value("output_truncated", false);
        return outcome;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Malformed outcome document: {}", e.what());
        return std::unexpected(RunnerError::CommunicationError);
    }
}

}  // namespace sandrun::isolated
