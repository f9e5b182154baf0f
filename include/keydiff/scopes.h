// scopes.h - Strategy scope tags

#pragma once

#include <string_view>
#include <type_traits>

namespace keydiff {

// ============================================================
// Scope tags
//
// A scope selects, per call site, which DiffTraits specialization produces
// the result for a value type. The same std::map<K, std::set<int>> can be
// diffed with its values compared recursively or by equality, depending on
// the scope the caller names.
// ============================================================

namespace scope {

/// Leaf comparison: Equal or Different, never recurses.
struct Simple {};

/// Recursive comparison: maps and sets produce nested changesets, every other
/// equality-comparable type bottoms out at Simple.
struct Arbitrary {};

} // namespace scope

/// Scopes that apply to a map and describe how its *values* are compared.
namespace map_value_diff {

/// Values are diffed with scope::Arbitrary (nested changesets).
struct Arbitrarily {};

/// Values are compared with scope::Simple (leaf Equal/Different).
struct Simply {};

} // namespace map_value_diff

template<typename S>
concept ScopeTag = std::is_same_v<S, scope::Simple> ||
                   std::is_same_v<S, scope::Arbitrary> ||
                   std::is_same_v<S, map_value_diff::Arbitrarily> ||
                   std::is_same_v<S, map_value_diff::Simply>;

/// Diagnostic name of a scope tag
template<ScopeTag S>
constexpr std::string_view scope_name() noexcept
{
    if constexpr (std::is_same_v<S, scope::Simple>) {
        return "simple";
    } else if constexpr (std::is_same_v<S, scope::Arbitrary>) {
        return "arbitrary";
    } else if constexpr (std::is_same_v<S, map_value_diff::Arbitrarily>) {
        return "map_value_diff::arbitrarily";
    } else {
        return "map_value_diff::simply";
    }
}

} // namespace keydiff
