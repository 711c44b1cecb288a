/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Sandboxed execution core type definitions
 * @date 2024
 * @version 1.0.0
 */

#ifndef SANDRUN_ISOLATED_TYPES_HPP
#define SANDRUN_ISOLATED_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandrun::isolated {

/**
 * @brief Error codes for the isolated runner
 */
enum class RunnerError {
    Success = 0,
    InterpreterNotFound,
    ProcessSpawnFailed,
    PipeCreationFailed,
    ArtifactCreationFailed,
    SourceNotReadable,
    CommunicationError,
    InvalidConfiguration,
    UnknownError
};

/**
 * @brief Get string representation of RunnerError
 */
[[nodiscard]] constexpr std::string_view runnerErrorToString(RunnerError error) noexcept {
    switch (error) {
        case RunnerError::Success: return "Success";
        case RunnerError::InterpreterNotFound: return "Interpreter not found";
        case RunnerError::ProcessSpawnFailed: return "Process spawn failed";
        case RunnerError::PipeCreationFailed: return "Pipe creation failed";
        case RunnerError::ArtifactCreationFailed: return "Temporary artifact creation failed";
        case RunnerError::SourceNotReadable: return "Source file not readable";
        case RunnerError::CommunicationError: return "Communication error";
        case RunnerError::InvalidConfiguration: return "Invalid configuration";
        case RunnerError::UnknownError: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for isolated runner operations
 */
template<typename T>
using Result = std::expected<T, RunnerError>;

/**
 * @brief Raw process data handed from the runner to the classifier
 */
struct RawExecution {
    std::optional<int> exitCode;        ///< Exit code (unset on timeout or signal death)
    std::optional<int> termSignal;      ///< Terminating signal, if any
    std::string stdoutBytes;            ///< Captured stdout (bounded)
    std::string stderrBytes;            ///< Captured stderr (bounded)
    bool timedOut{false};               ///< Wall-clock timer fired
    bool stdoutTruncated{false};        ///< stdout exceeded the capture ceiling
    bool stderrTruncated{false};        ///< stderr exceeded the capture ceiling
    std::chrono::milliseconds elapsed{0};  ///< Wall time from spawn to reap
    std::int64_t timeoutSeconds{0};     ///< Configured wall-clock limit
};

/**
 * @brief Interpreter invocation settings
 */
struct InterpreterConfig {
    std::filesystem::path path;         ///< Interpreter binary (empty = auto-detect)
    std::vector<std::string> arguments{"-I", "-B"};  ///< Isolation flags
};

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_TYPES_HPP
