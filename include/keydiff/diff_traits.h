// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_traits.h
/// @brief The diff-strategy abstraction.
///
/// DiffTraits<T, Scope> is the customisation point that ties a value type and
/// a scope tag to a comparison:
///
///   - change_type         the shape of the result        (the Diff capability)
///   - diff(source, target) the comparison itself          (the ArbitraryDiff capability)
///   - shape               Leaf / Map / Set, for diagnostics
///
/// The primary template is left undefined: asking for a scope that a type
/// does not support fails to compile (the concepts below report it) instead
/// of failing at run time.
///
/// Specializations provided by keydiff:
///   - <T, scope::Simple>                any equality-comparable T  (this file)
///   - <T, scope::Arbitrary>             non-collections fall back to Simple (this file)
///   - <Map, scope::Arbitrary>           see map_diff.h
///   - <Map, map_value_diff::Arbitrarily / Simply>  see map_diff.h
///   - <Set, scope::Arbitrary>           see set_diff.h
///
/// Users may add their own specializations for their own types.

#pragma once

#include <keydiff/api.h>
#include <keydiff/concepts.h>
#include <keydiff/modification.h>
#include <keydiff/scopes.h>

#include <concepts>
#include <cstdint>
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace keydiff {

enum class ChangeShape : std::uint8_t { Leaf, Map, Set };

/// "leaf", "map" or "set"
[[nodiscard]] KEYDIFF_API std::string_view to_string(ChangeShape shape) noexcept;

template<typename T, typename Scope>
struct DiffTraits;

// ============================================================
// Capability concepts
// ============================================================

/// T has a result shape for Scope
template<typename T, typename Scope>
concept Diff = requires {
    typename DiffTraits<T, Scope>::change_type;
} && HasChanges<typename DiffTraits<T, Scope>::change_type>;

template<typename T, typename Scope>
using change_type_t = typename DiffTraits<T, Scope>::change_type;

/// T can be compared under Scope
template<typename T, typename Scope>
concept ArbitraryDiff = Diff<T, Scope> && requires(const T& source, const T& target) {
    { DiffTraits<T, Scope>::diff(source, target) } -> std::same_as<change_type_t<T, Scope>>;
};

/// T can be compared by equality
template<typename T>
concept SimpleDiff = ArbitraryDiff<T, scope::Simple>;

// ============================================================
// Leaf strategies
// ============================================================

template<std::equality_comparable T>
struct DiffTraits<T, scope::Simple> {
    using change_type = Modification<T>;
    static constexpr ChangeShape shape = ChangeShape::Leaf;

    static change_type diff(const T& source, const T& target)
    {
        return Modification<T>::compare(source, target);
    }
};

/// Types with no structure to recurse into bottom out at Simple
template<std::equality_comparable T>
    requires(!MapLike<T> && !SetLike<T>)
struct DiffTraits<T, scope::Arbitrary> : DiffTraits<T, scope::Simple> {};

// ============================================================
// Entry point
// ============================================================

/// Diff two instances of T under Scope (recursive by default).
/// The result borrows from both arguments.
template<typename Scope = scope::Arbitrary, typename T>
    requires ArbitraryDiff<T, Scope>
[[nodiscard]] change_type_t<T, Scope> diff_with(const T& source, const T& target)
{
    return DiffTraits<T, Scope>::diff(source, target);
}

template<typename T, typename Scope>
    requires Diff<T, Scope>
[[nodiscard]] constexpr std::string_view describe_shape() noexcept
{
    return DiffTraits<T, Scope>::shape == ChangeShape::Leaf  ? std::string_view{"leaf"}
         : DiffTraits<T, Scope>::shape == ChangeShape::Map   ? std::string_view{"map"}
                                                             : std::string_view{"set"};
}

// ============================================================
// Value strategies
//
// The map differ is parameterised by a value strategy: an object with a
// result_type and compare(source, target). The scoped strategy forwards to
// DiffTraits; the custom strategy wraps any callable returning a HasChanges
// result.
// ============================================================

template<typename S, typename Value>
concept ValueStrategy = requires { typename S::result_type; } &&
    HasChanges<typename S::result_type> &&
    requires(const S& strategy, const Value& source, const Value& target) {
        { strategy.compare(source, target) } -> std::same_as<typename S::result_type>;
    };

template<typename Value, typename Scope>
    requires ArbitraryDiff<Value, Scope>
struct ScopedStrategy {
    using value_type = Value;
    using scope_type = Scope;
    using result_type = change_type_t<Value, Scope>;

    result_type compare(const Value& source, const Value& target) const
    {
        return DiffTraits<Value, Scope>::diff(source, target);
    }
};

template<typename Value, typename Fn>
    requires std::invocable<const Fn&, const Value&, const Value&> &&
             HasChanges<std::invoke_result_t<const Fn&, const Value&, const Value&>>
class CustomStrategy {
public:
    using value_type = Value;
    using result_type = std::invoke_result_t<const Fn&, const Value&, const Value&>;

    explicit CustomStrategy(Fn fn) : fn_(std::move(fn)) {}

    result_type compare(const Value& source, const Value& target) const
    {
        return std::invoke(fn_, source, target);
    }

private:
    Fn fn_;
};

/// Build a strategy for values of type Value from a callable
template<typename Value, typename Fn>
[[nodiscard]] CustomStrategy<Value, std::decay_t<Fn>> make_strategy(Fn&& fn)
{
    return CustomStrategy<Value, std::decay_t<Fn>>{std::forward<Fn>(fn)};
}

} // namespace keydiff
