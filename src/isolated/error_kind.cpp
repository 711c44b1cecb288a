/*
 * error_kind.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "error_kind.hpp"

namespace sandrun::isolated {

const std::vector<ErrorKind>& knownErrorKinds() {
    static const std::vector<ErrorKind> kinds = {
        ErrorKind::SyntaxError,       ErrorKind::IndentationError,
        ErrorKind::NameError,         ErrorKind::TypeError,
        ErrorKind::AttributeError,    ErrorKind::ValueError,
        ErrorKind::KeyError,          ErrorKind::IndexError,
        ErrorKind::ZeroDivisionError, ErrorKind::FileNotFoundError,
        ErrorKind::MemoryError,       ErrorKind::RecursionError,
        ErrorKind::OSError,           ErrorKind::ImportError,
        ErrorKind::ModuleNotFoundError, ErrorKind::TimeoutExpired};
    return kinds;
}

ErrorKind errorKindFromString(std::string_view label) noexcept {
    if (auto dot = label.rfind('.'); dot != std::string_view::npos) {
        label.remove_prefix(dot + 1);
    }
    if (label.empty()) {
        return ErrorKind::Unknown;
    }

    for (auto kind : knownErrorKinds()) {
        if (errorKindToString(kind) == label) {
            return kind;
        }
    }
    return ErrorKind::Unknown;
}

ErrorKind errorKindFromLabel(const std::optional<std::string>& label) noexcept {
    if (!label) {
        return ErrorKind::Unknown;
    }
    return errorKindFromString(*label);
}

ErrorCategory categoryOf(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::SyntaxError:
        case ErrorKind::IndentationError:
            return ErrorCategory::Syntax;
        case ErrorKind::NameError:
        case ErrorKind::TypeError:
        case ErrorKind::AttributeError:
        case ErrorKind::ValueError:
        case ErrorKind::KeyError:
        case ErrorKind::IndexError:
        case ErrorKind::ZeroDivisionError:
            return ErrorCategory::Runtime;
        case ErrorKind::MemoryError:
        case ErrorKind::RecursionError:
            return ErrorCategory::Resource;
        case ErrorKind::FileNotFoundError:
        case ErrorKind::OSError:
        case ErrorKind::ImportError:
        case ErrorKind::ModuleNotFoundError:
            return ErrorCategory::Environment;
        case ErrorKind::TimeoutExpired:
            return ErrorCategory::Timeout;
        case ErrorKind::Unknown:
            return ErrorCategory::Unknown;
    }
    return ErrorCategory::Unknown;
}

}  // namespace sandrun::isolated
