// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types raised by keydiff.
///
/// Diffing itself cannot fail. The two exceptions below report programming or
/// configuration errors:
/// - UnsupportedStrategy: a runtime-selected strategy does not exist for the
///   collection's value type (raised before any comparison runs)
/// - InvariantViolation: a key of the key union was found in neither input

#pragma once

#include <keydiff/api.h>

#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace keydiff {

class KEYDIFF_API UnsupportedStrategy : public std::runtime_error {
public:
    /// @param strategy   The requested strategy name
    /// @param value_type The collection type it was requested for, or empty
    ///                   when the name itself is unknown
    UnsupportedStrategy(std::string strategy, std::string value_type);

    [[nodiscard]] const std::string& strategy() const noexcept { return strategy_; }
    [[nodiscard]] const std::string& value_type() const noexcept { return value_type_; }

private:
    std::string strategy_;
    std::string value_type_;
};

class KEYDIFF_API InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

namespace detail {

/// Log and throw InvariantViolation for a key classified as (absent, absent).
[[noreturn]] KEYDIFF_API void unreachable_classification(
    std::string_view func,
    std::source_location loc = std::source_location::current());

} // namespace detail

} // namespace keydiff
