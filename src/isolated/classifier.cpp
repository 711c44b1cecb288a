/*
 * classifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "classifier.hpp"
#include "encoding.hpp"

#include <spdlog/spdlog.h>

#include <format>

namespace sandrun::isolated {

namespace {

constexpr std::string_view whitespace = " \t\r\n\f\v";

bool isKindStart(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool isKindChar(char c) noexcept {
    return isKindStart(c) || (c >= '0' && c <= '9') || c == '.';
}

std::string_view trim(std::string_view text) {
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

}  // namespace

std::optional<std::pair<std::string, std::string>>
OutcomeClassifier::parseErrorLine(std::string_view errorOutput) {
    auto text = trim(errorOutput);

    while (!text.empty()) {
        auto newline = text.rfind('\n');
        std::string_view line = newline == std::string_view::npos
                                    ? text
                                    : text.substr(newline + 1);
        text = newline == std::string_view::npos ? std::string_view{}
                                                 : text.substr(0, newline);

        // Kind: [A-Za-z_][A-Za-z0-9_.]* then ':', the rest is the message.
        // Linear scan; stderr lines can be megabytes long.
        auto candidate = trim(line);
        if (candidate.empty() || !isKindStart(candidate.front())) {
            continue;
        }
        std::size_t colon = 1;
        while (colon < candidate.size() && isKindChar(candidate[colon])) {
            ++colon;
        }
        if (colon == candidate.size() || candidate[colon] != ':') {
            continue;
        }
        auto message = candidate.substr(colon + 1);
        auto start = message.find_first_not_of(whitespace);
        message = start == std::string_view::npos ? std::string_view{}
                                                  : message.substr(start);
        return std::make_pair(std::string(candidate.substr(0, colon)),
                              std::string(message));
    }
    return std::nullopt;
}

std::string OutcomeClassifier::timeoutMessage(std::int64_t timeoutSeconds) {
    return std::format(
        "Execution timed out after {} seconds (wall-clock limit exceeded)",
        timeoutSeconds);
}

ExecutionOutcome OutcomeClassifier::classify(RawExecution raw) {
    ExecutionOutcome outcome;
    outcome.output = sanitizeUtf8(raw.stdoutBytes);
    outcome.errorOutput = sanitizeUtf8(raw.stderrBytes);
    outcome.exitCode = raw.exitCode;
    outcome.termSignal = raw.termSignal;
    outcome.executionTime = raw.elapsed;
    outcome.outputTruncated = raw.stdoutTruncated || raw.stderrTruncated;

    if (raw.timedOut) {
        outcome.status = ExecutionStatus::Timeout;
        outcome.exitCode.reset();
        outcome.errorKind = std::string(TIMEOUT_KIND);
        outcome.errorMessage = timeoutMessage(raw.timeoutSeconds);
        return outcome;
    }

    if (raw.exitCode && *raw.exitCode == 0) {
        outcome.status = ExecutionStatus::Success;
        return outcome;
    }

    outcome.status = ExecutionStatus::RuntimeError;
    if (auto parsed = parseErrorLine(outcome.errorOutput)) {
        outcome.errorKind = std::move(parsed->first);
        outcome.errorMessage = std::move(parsed->second);
    } else {
        spdlog::debug("No error line found in stderr (exit code {}, signal {})",
                      raw.exitCode.value_or(-1), raw.termSignal.value_or(0));
    }
    return outcome;
}

}  // namespace sandrun::isolated
