// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file strategy.cpp
/// @brief Parsing and naming of runtime strategy kinds.

#include <keydiff/strategy.h>
#include <keydiff/errors.h>
#include <keydiff/log.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace keydiff {

namespace {

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

} // anonymous namespace

std::string_view to_string(StrategyKind kind) noexcept
{
    switch (kind) {
        case StrategyKind::Simple:    return "simple";
        case StrategyKind::Recursive: return "recursive";
    }
    return "unknown";
}

StrategyKind parse_strategy_kind(std::string_view name)
{
    if (iequals(name, "simple") || iequals(name, "leaf")) {
        return StrategyKind::Simple;
    }
    if (iequals(name, "recursive") || iequals(name, "arbitrary")) {
        return StrategyKind::Recursive;
    }

    detail::log_strategy_error("keydiff::parse_strategy_kind", name, "");
    throw UnsupportedStrategy(std::string(name), "");
}

namespace detail {

void throw_unsupported_strategy(StrategyKind kind, std::string_view value_type, std::source_location loc)
{
    log_strategy_error("keydiff::with_strategy", to_string(kind), value_type, loc);
    throw UnsupportedStrategy(std::string(to_string(kind)), std::string(value_type));
}

} // namespace detail

} // namespace keydiff
