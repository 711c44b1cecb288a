/*
 * error_kind.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file error_kind.hpp
 * @brief Catalog of known error kinds reported by the classifier
 * @date 2024
 * @version 1.0.0
 */

#ifndef SANDRUN_ISOLATED_ERROR_KIND_HPP
#define SANDRUN_ISOLATED_ERROR_KIND_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandrun::isolated {

/**
 * @brief Known error kinds
 *
 * The classifier reports error kinds as free strings; this enum tags the
 * ones downstream tooling knows about. Anything else maps to Unknown.
 * The plain CLI output prints the category of known kinds.
 */
enum class ErrorKind {
    SyntaxError,
    IndentationError,
    NameError,
    TypeError,
    AttributeError,
    ValueError,
    KeyError,
    IndexError,
    ZeroDivisionError,
    FileNotFoundError,
    MemoryError,
    RecursionError,
    OSError,
    ImportError,
    ModuleNotFoundError,
    TimeoutExpired,
    Unknown
};

/**
 * @brief Coarse grouping of error kinds
 */
enum class ErrorCategory {
    Syntax,         ///< Rejected before any user code ran
    Runtime,        ///< Raised by user code
    Resource,       ///< Memory or recursion exhaustion
    Environment,    ///< Missing files or modules, OS failures
    Timeout,        ///< Wall-clock limit
    Unknown
};

[[nodiscard]] constexpr std::string_view errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::SyntaxError: return "SyntaxError";
        case ErrorKind::IndentationError: return "IndentationError";
        case ErrorKind::NameError: return "NameError";
        case ErrorKind::TypeError: return "TypeError";
        case ErrorKind::AttributeError: return "AttributeError";
        case ErrorKind::ValueError: return "ValueError";
        case ErrorKind::KeyError: return "KeyError";
        case ErrorKind::IndexError: return "IndexError";
        case ErrorKind::ZeroDivisionError: return "ZeroDivisionError";
        case ErrorKind::FileNotFoundError: return "FileNotFoundError";
        case ErrorKind::MemoryError: return "MemoryError";
        case ErrorKind::RecursionError: return "RecursionError";
        case ErrorKind::OSError: return "OSError";
        case ErrorKind::ImportError: return "ImportError";
        case ErrorKind::ModuleNotFoundError: return "ModuleNotFoundError";
        case ErrorKind::TimeoutExpired: return "TimeoutExpired";
        case ErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view errorCategoryToString(
    ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::Syntax: return "syntax";
        case ErrorCategory::Runtime: return "runtime";
        case ErrorCategory::Resource: return "resource";
        case ErrorCategory::Environment: return "environment";
        case ErrorCategory::Timeout: return "timeout";
        case ErrorCategory::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * @brief Map a reported kind label to the catalog
 *
 * Dotted labels are matched on their last component, so
 * "builtins.ValueError" resolves to ValueError.
 */
[[nodiscard]] ErrorKind errorKindFromString(std::string_view label) noexcept;

/**
 * @brief Map an optional kind label, absent labels are Unknown
 */
[[nodiscard]] ErrorKind errorKindFromLabel(
    const std::optional<std::string>& label) noexcept;

/**
 * @brief Category of a known kind
 */
[[nodiscard]] ErrorCategory categoryOf(ErrorKind kind) noexcept;

/**
 * @brief All known kinds, Unknown excluded
 */
[[nodiscard]] const std::vector<ErrorKind>& knownErrorKinds();

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_ERROR_KIND_HPP
