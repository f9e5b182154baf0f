// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for the collections and results keydiff works with.
///
/// keydiff never names a concrete container in its algorithms. Maps and sets
/// are recognised structurally, so std::, tsl:: and immer:: containers all
/// go through the same differs:
/// - MapLike:  key_type + mapped_type, lookup by key, iteration over pairs
/// - SetLike:  value_type, membership by count(), iteration over elements
/// - SortedContainer: iteration is ordered by key_compare (merge walks apply)
///
/// Multi-key containers are neither maps nor sets here: one key may name
/// several entries, so a key cannot identify a change.
///
/// @note Requires C++20 or later.

#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <type_traits>

namespace keydiff {

// ============================================================
// Result Concepts
// ============================================================

/// Every per-value diff result reports whether it represents a difference.
template<typename T>
concept HasChanges = requires(const T& t) {
    { t.has_changes() } -> std::convertible_to<bool>;
};

// ============================================================
// Container Concepts
// ============================================================

/// Concept for containers with size() and const iteration
template<typename T>
concept SizedIterable = requires(const T& t) {
    { t.size() } -> std::convertible_to<std::size_t>;
    { t.begin() };
    { t.end() };
};

/// Containers that may hold one key more than once (std::multimap and
/// friends): their insert(value) returns an iterator instead of a
/// pair<iterator, bool> (std, tsl) or a new container (immer).
template<typename T>
concept MultiKeyContainer = requires(T& t, const typename T::value_type& v) {
    { t.insert(v) } -> std::same_as<typename T::iterator>;
};

/// Every key occurs at most once, so a key identifies one entry
template<typename T>
concept UniqueKeyContainer = !MultiKeyContainer<T>;

/// Concept for map-like containers.
/// immer::map::find returns a pointer to the mapped value, the std/tsl maps
/// return an iterator; both are accepted (see detail::find_value).
template<typename T>
concept MapLike = SizedIterable<T> && UniqueKeyContainer<T> &&
    requires {
        typename T::key_type;
        typename T::mapped_type;
    } &&
    requires(const T& t, const typename T::key_type& k) {
        { t.count(k) } -> std::convertible_to<std::size_t>;
        { t.find(k) };
        { (*t.begin()).first } -> std::convertible_to<const typename T::key_type&>;
        { (*t.begin()).second } -> std::convertible_to<const typename T::mapped_type&>;
    };

/// Concept for set-like containers (membership only, no mapped value)
template<typename T>
concept SetLike = SizedIterable<T> && UniqueKeyContainer<T> &&
    !requires { typename T::mapped_type; } &&
    requires { typename T::value_type; } &&
    requires(const T& t, const typename T::value_type& v) {
        { t.count(v) } -> std::convertible_to<std::size_t>;
        { *t.begin() } -> std::convertible_to<const typename T::value_type&>;
    };

/// Keyed collections whose iteration order follows key_compare
template<typename T>
concept SortedContainer = requires(const T& t) {
    typename T::key_compare;
    { t.key_comp() } -> std::convertible_to<typename T::key_compare>;
};

// ============================================================
// Hashing helpers for keyed containers
// ============================================================

namespace detail {

/// The container's own hasher when it declares one, std::hash otherwise
template<typename C, typename Key>
struct key_hasher {
    using type = std::hash<Key>;
};

template<typename C, typename Key>
    requires requires { typename C::hasher; }
struct key_hasher<C, Key> {
    using type = typename C::hasher;
};

/// The container's own key equality when it declares one, std::equal_to otherwise
template<typename C, typename Key>
struct key_equality {
    using type = std::equal_to<Key>;
};

template<typename C, typename Key>
    requires requires { typename C::key_equal; }
struct key_equality<C, Key> {
    using type = typename C::key_equal;
};

template<typename C, typename Key>
using key_hasher_t = typename key_hasher<C, Key>::type;

template<typename C, typename Key>
using key_equality_t = typename key_equality<C, Key>::type;

} // namespace detail

} // namespace keydiff
