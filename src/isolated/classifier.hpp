/*
 * classifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file classifier.hpp
 * @brief Maps raw process data to a classified ExecutionOutcome
 * @date 2024
 * @version 1.0.0
 */

#ifndef SANDRUN_ISOLATED_CLASSIFIER_HPP
#define SANDRUN_ISOLATED_CLASSIFIER_HPP

#include "outcome.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sandrun::isolated {

/**
 * @brief Outcome classification
 *
 * - timed out: Timeout / "TimeoutExpired" with the configured limit
 * - exit code zero: Success, no error fields
 * - otherwise: RuntimeError, kind and message taken from the last
 *   "Identifier: text" line of stderr, or left absent when none matches
 */
class OutcomeClassifier {
public:
    static constexpr std::string_view TIMEOUT_KIND = "TimeoutExpired";

    /**
     * @brief Classify one raw execution
     */
    [[nodiscard]] static ExecutionOutcome classify(RawExecution raw);

    /**
     * @brief Scan stderr backward for the most specific error line
     * @return (kind, message) of the first match from the end, if any
     */
    [[nodiscard]] static std::optional<std::pair<std::string, std::string>>
    parseErrorLine(std::string_view errorOutput);

    /**
     * @brief Human-readable timeout description
     */
    [[nodiscard]] static std::string timeoutMessage(std::int64_t timeoutSeconds);
};

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_CLASSIFIER_HPP
