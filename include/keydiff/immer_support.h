// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file immer_support.h
/// @brief immer::map / immer::set walks built on immer::diff.
///
/// immer containers are MapLike/SetLike already, so the generic differs accept
/// them. This header only swaps the key walk: immer::diff compares the two
/// HAMTs node by node and skips any subtree the two versions share, which
/// makes diffing successive versions of one persistent container proportional
/// to the edit, not to the container.
///
/// Keys whose entries immer::diff reports as retained are forwarded to the
/// value strategy like any other common key; keys living in a shared subtree
/// are identical by construction and never reach the strategy.
///
/// key_walk.h includes this header at its end, so every translation unit
/// that can instantiate a differ also sees these specializations.
/// KEYDIFF_ENABLE_IMMER must therefore have the same value in every
/// translation unit of a program.

#pragma once

#include <keydiff/keydiff_config.h>
#include <keydiff/key_walk.h>

#include <immer/algorithm.hpp>
#include <immer/map.hpp>
#include <immer/set.hpp>

#include <type_traits>

namespace keydiff {

template<typename T>
struct is_immer_map : std::false_type {};

template<typename K, typename T, typename Hash, typename Equal, typename MemoryPolicy, auto B>
struct is_immer_map<immer::map<K, T, Hash, Equal, MemoryPolicy, B>> : std::true_type {};

template<typename T>
struct is_immer_set : std::false_type {};

template<typename T, typename Hash, typename Equal, typename MemoryPolicy, auto B>
struct is_immer_set<immer::set<T, Hash, Equal, MemoryPolicy, B>> : std::true_type {};

namespace detail {

template<typename Map>
    requires is_immer_map<Map>::value
struct MapWalk<Map> {
    template<typename Visitor>
    static void walk(const Map& source, const Map& target, Visitor& visitor)
    {
        // Generic lambdas bind straight to the stored pairs; a lambda taking
        // std::pair<const K, T> would bind to a converted temporary.
        auto differ = immer::make_differ(
            // added
            [&](const auto& added_kv) {
                visitor.on_added(added_kv.first, added_kv.second);
            },
            // removed
            [&](const auto& removed_kv) {
                visitor.on_removed(removed_kv.first, removed_kv.second);
            },
            // changed (retained key)
            [&](const auto& old_kv, const auto& new_kv) {
                if (&old_kv.second == &new_kv.second) {
                    return;
                }
                visitor.on_common(old_kv.first, old_kv.second, new_kv.second);
            });

        immer::diff(source, target, differ);
    }
};

template<typename Set>
    requires is_immer_set<Set>::value
struct SetWalk<Set> {
    template<typename Visitor>
    static void walk(const Set& source, const Set& target, Visitor& visitor)
    {
        auto differ = immer::make_differ(
            [&](const auto& added) { visitor.on_added(added); },
            [&](const auto& removed) { visitor.on_removed(removed); },
            [](const auto&, const auto&) {});

        immer::diff(source, target, differ);
    }
};

} // namespace detail
} // namespace keydiff
