// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file map_diff.h
/// @brief Diff of map-like collections.
///
/// One differ, parameterised by a value strategy:
///   - keys only in the target  -> Add(key, target_value)
///   - keys only in the source  -> Remove(key, source_value)
///   - keys in both             -> strategy.compare(source_value, target_value),
///                                 kept as Modify only if it has changes
///
/// The scopes pick the value strategy:
///   - map_value_diff::Arbitrarily (and scope::Arbitrary): values diffed with
///     scope::Arbitrary, so a map of maps yields nested MapChangesets
///   - map_value_diff::Simply: values compared for equality (Modification<V>)
///
/// Example:
/// @code
///   std::map<int, std::set<int>> a = ..., b = ...;
///   auto nested = keydiff::diff_with(a, b);                               // Modify carries SetChangeset
///   auto leaf   = keydiff::diff_with<keydiff::map_value_diff::Simply>(a, b); // Modify carries Modification
///   auto custom = keydiff::diff_with(a, b, keydiff::make_strategy<std::set<int>>(
///       [](const auto& x, const auto& y) { return keydiff::Modification<std::set<int>>::compare(x, y); }));
/// @endcode

#pragma once

#include <keydiff/keydiff_config.h>
#include <keydiff/changeset.h>
#include <keydiff/concepts.h>
#include <keydiff/diff_traits.h>
#include <keydiff/key_walk.h>
#include <keydiff/set_diff.h>

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace keydiff {

// ============================================================
// MapDiffer
// ============================================================

template<MapLike Map, typename Strategy>
    requires ValueStrategy<Strategy, typename Map::mapped_type>
class MapDiffer {
public:
    using key_type = typename Map::key_type;
    using mapped_type = typename Map::mapped_type;
    using result_type = typename Strategy::result_type;
    using changeset_type = MapChangeset<key_type, mapped_type, result_type>;

    MapDiffer() = default;

    explicit MapDiffer(Strategy strategy) : strategy_(std::move(strategy)) {}

    /// The changeset borrows keys and values from both maps.
    [[nodiscard]] changeset_type diff(const Map& source, const Map& target) const
    {
        Collector collector{strategy_};

        // Bucket upper bounds: every target key may be new, every source key
        // may be gone, and only keys in both can be modified.
        collector.added.reserve(target.size());
        collector.removed.reserve(source.size());
        collector.modified.reserve(std::min(source.size(), target.size()));

        detail::MapWalk<Map>::walk(source, target, collector);

        detail::trim_bucket(collector.added);
        detail::trim_bucket(collector.removed);
        detail::trim_bucket(collector.modified);

        return changeset_type{std::move(collector.added),
                              std::move(collector.removed),
                              std::move(collector.modified)};
    }

    [[nodiscard]] const Strategy& strategy() const noexcept { return strategy_; }

private:
    struct Collector {
        const Strategy& strategy;
        std::vector<typename changeset_type::add_type> added;
        std::vector<typename changeset_type::remove_type> removed;
        std::vector<typename changeset_type::modify_type> modified;

        void on_added(const key_type& key, const mapped_type& value)
        {
            added.push_back({&key, &value});
        }

        void on_removed(const key_type& key, const mapped_type& value)
        {
            removed.push_back({&key, &value});
        }

        void on_common(const key_type& key, const mapped_type& source, const mapped_type& target)
        {
            auto delta = strategy.compare(source, target);
            if (delta.has_changes()) {
                modified.push_back({&key, std::move(delta)});
            }
        }
    };

    Strategy strategy_{};
};

// ============================================================
// Scope specializations for maps
// ============================================================

template<MapLike Map>
    requires ArbitraryDiff<typename Map::mapped_type, scope::Arbitrary>
struct DiffTraits<Map, map_value_diff::Arbitrarily> {
    using strategy_type = ScopedStrategy<typename Map::mapped_type, scope::Arbitrary>;
    using change_type = typename MapDiffer<Map, strategy_type>::changeset_type;
    static constexpr ChangeShape shape = ChangeShape::Map;

    static change_type diff(const Map& source, const Map& target)
    {
        return MapDiffer<Map, strategy_type>{}.diff(source, target);
    }
};

template<MapLike Map>
    requires SimpleDiff<typename Map::mapped_type>
struct DiffTraits<Map, map_value_diff::Simply> {
    using strategy_type = ScopedStrategy<typename Map::mapped_type, scope::Simple>;
    using change_type = typename MapDiffer<Map, strategy_type>::changeset_type;
    static constexpr ChangeShape shape = ChangeShape::Map;

    static change_type diff(const Map& source, const Map& target)
    {
        return MapDiffer<Map, strategy_type>{}.diff(source, target);
    }
};

/// The recursive scope diffs a map's values recursively
template<MapLike Map>
    requires ArbitraryDiff<typename Map::mapped_type, scope::Arbitrary>
struct DiffTraits<Map, scope::Arbitrary> : DiffTraits<Map, map_value_diff::Arbitrarily> {};

// ============================================================
// Injected strategy entry point
// ============================================================

/// Diff two maps comparing common values with an explicit strategy object
template<MapLike Map, typename Strategy>
    requires ValueStrategy<std::decay_t<Strategy>, typename Map::mapped_type>
[[nodiscard]] auto diff_with(const Map& source, const Map& target, Strategy&& strategy)
{
    return MapDiffer<Map, std::decay_t<Strategy>>{std::forward<Strategy>(strategy)}.diff(source, target);
}

} // namespace keydiff
