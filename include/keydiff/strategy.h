// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file strategy.h
/// @brief Runtime selection of a diff strategy.
///
/// The static path (diff_with<Scope>) rejects an unsupported scope at compile
/// time. When the strategy comes from a command line or a config file, the
/// choice is a StrategyKind instead, resolved here to the scope tag that fits
/// the collection family:
///
///   kind       map                           set               other
///   Simple     map_value_diff::Simply        scope::Arbitrary  scope::Simple
///   Recursive  map_value_diff::Arbitrarily   scope::Arbitrary  scope::Arbitrary
///
/// A set has no values to compare, so both kinds diff its membership.
///
/// Usage:
/// @code
///   auto kind = keydiff::parse_strategy_kind(argv[1]);      // may throw
///   keydiff::with_strategy<Catalog>(kind, [&](auto scope) {  // may throw
///       using Scope = decltype(scope);
///       keydiff::print_changes(std::cout, keydiff::diff_with<Scope>(before, after));
///   });
/// @endcode

#pragma once

#include <keydiff/api.h>
#include <keydiff/concepts.h>
#include <keydiff/diff_traits.h>
#include <keydiff/scopes.h>

#include <cstdint>
#include <functional>
#include <source_location>
#include <string_view>
#include <typeinfo>
#include <utility>

namespace keydiff {

enum class StrategyKind : std::uint8_t {
    Simple,    ///< compare values by equality
    Recursive  ///< descend into nested maps and sets
};

/// "simple" or "recursive"
[[nodiscard]] KEYDIFF_API std::string_view to_string(StrategyKind kind) noexcept;

/// Parse a strategy name. Accepts "simple", "leaf", "recursive" and
/// "arbitrary", case-insensitively.
/// @throws UnsupportedStrategy for any other name
[[nodiscard]] KEYDIFF_API StrategyKind parse_strategy_kind(std::string_view name);

namespace detail {

/// Scope tags a StrategyKind resolves to, per collection family
template<typename Collection>
struct StrategyScopes {
    using simple = scope::Simple;
    using recursive = scope::Arbitrary;
};

template<MapLike Map>
struct StrategyScopes<Map> {
    using simple = map_value_diff::Simply;
    using recursive = map_value_diff::Arbitrarily;
};

template<SetLike Set>
struct StrategyScopes<Set> {
    using simple = scope::Arbitrary;
    using recursive = scope::Arbitrary;
};

/// Log and throw UnsupportedStrategy(kind, value_type)
[[noreturn]] KEYDIFF_API void throw_unsupported_strategy(
    StrategyKind kind,
    std::string_view value_type,
    std::source_location loc = std::source_location::current());

} // namespace detail

/// Whether Collection can be diffed under kind
template<typename Collection>
[[nodiscard]] constexpr bool supports(StrategyKind kind) noexcept
{
    using scopes = detail::StrategyScopes<Collection>;
    return kind == StrategyKind::Simple ? ArbitraryDiff<Collection, typename scopes::simple>
                                        : ArbitraryDiff<Collection, typename scopes::recursive>;
}

/// Resolve kind to a scope tag for Collection and call fn(scope).
/// @throws UnsupportedStrategy if Collection has no diff under kind; fn is
///         not called in that case
template<typename Collection, typename Result = void, typename Fn>
Result with_strategy(StrategyKind kind, Fn&& fn)
{
    using simple = typename detail::StrategyScopes<Collection>::simple;
    using recursive = typename detail::StrategyScopes<Collection>::recursive;

    if (kind == StrategyKind::Simple) {
        if constexpr (ArbitraryDiff<Collection, simple>) {
            return static_cast<Result>(std::invoke(std::forward<Fn>(fn), simple{}));
        } else {
            detail::throw_unsupported_strategy(kind, typeid(Collection).name());
        }
    } else {
        if constexpr (ArbitraryDiff<Collection, recursive>) {
            return static_cast<Result>(std::invoke(std::forward<Fn>(fn), recursive{}));
        } else {
            detail::throw_unsupported_strategy(kind, typeid(Collection).name());
        }
    }
}

} // namespace keydiff
