// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file key_partition.h
/// @brief Three-way split of two maps' key spaces.
///
/// partition_keys() reports, without comparing any values, which keys exist
/// only in the source, only in the target, or in both. Useful to decide what
/// to diff before paying for the value comparison:
///
/// @code
///   auto parts = keydiff::partition_keys(before, after);
///   for (const auto* name : parts.common) {
///       auto nested = keydiff::diff_with(before.at(*name), after.at(*name));
///   }
/// @endcode
///
/// Every key of keys(source) ∪ keys(target) lands in exactly one list. The
/// key pointers borrow from the inputs.

#pragma once

#include <keydiff/keydiff_config.h>
#include <keydiff/concepts.h>
#include <keydiff/key_walk.h>

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace keydiff {

template<typename Key>
struct KeyPartition {
    std::vector<const Key*> source_only;
    std::vector<const Key*> target_only;
    std::vector<const Key*> common;

    [[nodiscard]] std::size_t size() const noexcept
    {
        return source_only.size() + target_only.size() + common.size();
    }

    [[nodiscard]] bool identical_keys() const noexcept
    {
        return source_only.empty() && target_only.empty();
    }
};

namespace detail {

template<typename Key, typename Value>
struct PartitionCollector {
    KeyPartition<Key> result;

    void on_added(const Key& key, const Value&) { result.target_only.push_back(&key); }
    void on_removed(const Key& key, const Value&) { result.source_only.push_back(&key); }
    void on_common(const Key& key, const Value&, const Value&) { result.common.push_back(&key); }
};

} // namespace detail

/// Split the keys of two maps. Sorted maps come back in key order; hashed
/// maps in source iteration order followed by target-only keys.
template<MapLike Map>
[[nodiscard]] KeyPartition<typename Map::key_type> partition_keys(const Map& source, const Map& target)
{
    detail::PartitionCollector<typename Map::key_type, typename Map::mapped_type> collector;
    collector.result.common.reserve(std::min(source.size(), target.size()));

    // Full walk: the immer walk would skip keys whose values are shared.
    detail::classify_keys(source, target, collector);

    detail::trim_bucket(collector.result.common);
    return std::move(collector.result);
}

} // namespace keydiff
