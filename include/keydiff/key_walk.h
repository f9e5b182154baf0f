// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file key_walk.h
/// @brief Key-space partition walks shared by the differs.
///
/// A walk visits every key of keys(source) ∪ keys(target) exactly once and
/// reports it to a visitor as one of:
///   visitor.on_removed(key, source_value)          - source only
///   visitor.on_added(key, target_value)            - target only
///   visitor.on_common(key, source_value, target_value)
///
/// Walks provided here:
///   - sorted merge walk for SortedContainer maps/sets (deterministic order)
///   - hashed union walk for everything else: the key union is collected in
///     insertion order (source keys, then target-only keys) into a
///     tsl::robin_set of key pointers, then each key is classified by lookup.
///
/// MapWalk / SetWalk pick the walk for a container type. immer containers get
/// their own specializations in immer_support.h, included at the end of this
/// header whenever KEYDIFF_ENABLE_IMMER is set.

#pragma once

#include <keydiff/keydiff_config.h>
#include <keydiff/concepts.h>
#include <keydiff/errors.h>

#include <tsl/robin_set.h>

#include <cstddef>
#include <type_traits>
#include <vector>

namespace keydiff {
namespace detail {

// ============================================================
// Lookup helpers
// ============================================================

/// Pointer to the mapped value for key, or nullptr.
/// immer::map::find already returns a pointer; std/tsl maps return iterators.
template<MapLike Map>
[[nodiscard]] const typename Map::mapped_type* find_value(const Map& map, const typename Map::key_type& key)
{
    if constexpr (std::is_pointer_v<decltype(map.find(key))>) {
        return map.find(key);
    } else {
        auto it = map.find(key);
        return it == map.end() ? nullptr : &it->second;
    }
}

/// Hash a key through a pointer to it
template<typename Hasher>
struct DerefHash {
    template<typename Key>
    std::size_t operator()(const Key* key) const
    {
        return Hasher{}(*key);
    }
};

/// Compare keys through pointers to them
template<typename KeyEqual>
struct DerefEqual {
    template<typename Key>
    bool operator()(const Key* lhs, const Key* rhs) const
    {
        return KeyEqual{}(*lhs, *rhs);
    }
};

template<typename Container, typename Key>
using KeyPointerSet = tsl::robin_set<const Key*,
                                     DerefHash<key_hasher_t<Container, Key>>,
                                     DerefEqual<key_equality_t<Container, Key>>>;

/// Trim a bucket that ended up much smaller than its reservation
template<typename Bucket>
void trim_bucket(Bucket& bucket)
{
#if KEYDIFF_SHRINK_FACTOR > 0
    if (bucket.capacity() > bucket.size() * KEYDIFF_SHRINK_FACTOR) {
        bucket.shrink_to_fit();
    }
#else
    (void)bucket;
#endif
}

// ============================================================
// Map walks
// ============================================================

/// Merged walk over two maps iterated in key_compare order.
template<MapLike Map, typename Visitor>
    requires SortedContainer<Map>
void sorted_map_walk(const Map& source, const Map& target, Visitor& visitor)
{
    const auto less = source.key_comp();
    auto s = source.begin();
    auto t = target.begin();

    while (s != source.end() || t != target.end()) {
        if (t == target.end() || (s != source.end() && less(s->first, t->first))) {
            visitor.on_removed(s->first, s->second);
            ++s;
        } else if (s == source.end() || less(t->first, s->first)) {
            visitor.on_added(t->first, t->second);
            ++t;
        } else {
            visitor.on_common(s->first, s->second, t->second);
            ++s;
            ++t;
        }
    }
}

/// Walk over the hashed union of both key sets.
template<MapLike Map, typename Visitor>
void union_map_walk(const Map& source, const Map& target, Visitor& visitor)
{
    using key_type = typename Map::key_type;

    KeyPointerSet<Map, key_type> seen;
    std::vector<const key_type*> keys;
    seen.reserve(source.size() + target.size());
    keys.reserve(source.size() + target.size());

    auto collect = [&](const Map& map) {
        for (const auto& entry : map) {
            const key_type* key = &entry.first;
            if (seen.insert(key).second) {
                keys.push_back(key);
            }
        }
    };
    collect(source);
    collect(target);

    for (const key_type* key : keys) {
        const auto* source_value = find_value(source, *key);
        const auto* target_value = find_value(target, *key);

        if (source_value && target_value) {
            visitor.on_common(*key, *source_value, *target_value);
        } else if (source_value) {
            visitor.on_removed(*key, *source_value);
        } else if (target_value) {
            visitor.on_added(*key, *target_value);
        } else {
            // The union only holds keys read out of the two inputs; a key that
            // neither input can find means the key equality is not reflexive.
            unreachable_classification("keydiff::detail::union_map_walk");
        }
    }
}

/// Full partition walk: reports every key, including those with identical values.
template<MapLike Map, typename Visitor>
void classify_keys(const Map& source, const Map& target, Visitor& visitor)
{
    if constexpr (SortedContainer<Map>) {
        sorted_map_walk(source, target, visitor);
    } else {
        union_map_walk(source, target, visitor);
    }
}

/// Walk used by the map differ. Specializations may skip keys whose values
/// are known to be identical (immer structural sharing).
template<typename Map>
struct MapWalk {
    template<typename Visitor>
    static void walk(const Map& source, const Map& target, Visitor& visitor)
    {
        classify_keys(source, target, visitor);
    }
};

// ============================================================
// Set walks
//
// Visitor receives on_added(element) / on_removed(element).
// ============================================================

template<SetLike Set, typename Visitor>
    requires SortedContainer<Set>
void sorted_set_walk(const Set& source, const Set& target, Visitor& visitor)
{
    const auto less = source.key_comp();
    auto s = source.begin();
    auto t = target.begin();

    while (s != source.end() || t != target.end()) {
        if (t == target.end() || (s != source.end() && less(*s, *t))) {
            visitor.on_removed(*s);
            ++s;
        } else if (s == source.end() || less(*t, *s)) {
            visitor.on_added(*t);
            ++t;
        } else {
            ++s;
            ++t;
        }
    }
}

/// added = target − source, removed = source − target, by membership lookup.
/// An element its own set cannot find has an irreflexive equality.
template<SetLike Set, typename Visitor>
void hashed_set_walk(const Set& source, const Set& target, Visitor& visitor)
{
    for (const auto& element : target) {
        if (source.count(element) == 0) {
            if (target.count(element) == 0) {
                unreachable_classification("keydiff::detail::hashed_set_walk");
            }
            visitor.on_added(element);
        }
    }
    for (const auto& element : source) {
        if (target.count(element) == 0) {
            if (source.count(element) == 0) {
                unreachable_classification("keydiff::detail::hashed_set_walk");
            }
            visitor.on_removed(element);
        }
    }
}

template<typename Set>
struct SetWalk {
    template<typename Visitor>
    static void walk(const Set& source, const Set& target, Visitor& visitor)
    {
        if constexpr (SortedContainer<Set>) {
            sorted_set_walk(source, target, visitor);
        } else {
            hashed_set_walk(source, target, visitor);
        }
    }
};

} // namespace detail
} // namespace keydiff

#if KEYDIFF_ENABLE_IMMER
#include <keydiff/immer_support.h>
#endif
