/*
 * test_error_kind.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "isolated/error_kind.hpp"

#include <set>

using namespace sandrun::isolated;

TEST(ErrorKindTest, KnownNamesRoundTrip) {
    for (auto kind : knownErrorKinds()) {
        EXPECT_EQ(errorKindFromString(errorKindToString(kind)), kind)
            << errorKindToString(kind);
    }
}

TEST(ErrorKindTest, CatalogHasSixteenDistinctKinds) {
    const auto& kinds = knownErrorKinds();
    std::set<ErrorKind> unique(kinds.begin(), kinds.end());
    EXPECT_EQ(kinds.size(), 16u);
    EXPECT_EQ(unique.size(), kinds.size());
    EXPECT_EQ(unique.count(ErrorKind::Unknown), 0u);
}

TEST(ErrorKindTest, DottedNamesUseLastComponent) {
    EXPECT_EQ(errorKindFromString("builtins.ValueError"), ErrorKind::ValueError);
    EXPECT_EQ(errorKindFromString("json.decoder.JSONDecodeError"), ErrorKind::Unknown);
    EXPECT_EQ(errorKindFromString("a.b."), ErrorKind::Unknown);
}

TEST(ErrorKindTest, UnknownLabels) {
    EXPECT_EQ(errorKindFromString(""), ErrorKind::Unknown);
    EXPECT_EQ(errorKindFromString("Traceback"), ErrorKind::Unknown);
    EXPECT_EQ(errorKindFromString("valueerror"), ErrorKind::Unknown);
    EXPECT_EQ(errorKindFromLabel(std::nullopt), ErrorKind::Unknown);
    EXPECT_EQ(errorKindFromLabel(std::string("KeyError")), ErrorKind::KeyError);
}

TEST(ErrorKindTest, Categories) {
    EXPECT_EQ(categoryOf(ErrorKind::SyntaxError), ErrorCategory::Syntax);
    EXPECT_EQ(categoryOf(ErrorKind::IndentationError), ErrorCategory::Syntax);
    EXPECT_EQ(categoryOf(ErrorKind::ZeroDivisionError), ErrorCategory::Runtime);
    EXPECT_EQ(categoryOf(ErrorKind::MemoryError), ErrorCategory::Resource);
    EXPECT_EQ(categoryOf(ErrorKind::RecursionError), ErrorCategory::Resource);
    EXPECT_EQ(categoryOf(ErrorKind::ModuleNotFoundError), ErrorCategory::Environment);
    EXPECT_EQ(categoryOf(ErrorKind::TimeoutExpired), ErrorCategory::Timeout);
    EXPECT_EQ(categoryOf(ErrorKind::Unknown), ErrorCategory::Unknown);
}

TEST(ErrorKindTest, EveryKnownKindHasACategory) {
    for (auto kind : knownErrorKinds()) {
        EXPECT_NE(categoryOf(kind), ErrorCategory::Unknown) << errorKindToString(kind);
    }
}

TEST(ErrorKindTest, CategoryNames) {
    EXPECT_EQ(errorCategoryToString(ErrorCategory::Syntax), "syntax");
    EXPECT_EQ(errorCategoryToString(ErrorCategory::Timeout), "timeout");
}
