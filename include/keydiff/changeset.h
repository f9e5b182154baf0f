// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file changeset.h
/// @brief Per-diff result aggregates.
///
/// A changeset owns the precomputed buckets of one diff invocation and hands
/// out lazy adapters over them (see iterators.h). It is immutable once built:
/// every accessor call returns a fresh adapter, so iterating twice yields the
/// same elements twice.
///
/// Lifetime: the buckets hold pointers into the source and target
/// collections. A changeset must not outlive either input. Use
/// diff_owned() (owned_changeset.h) when the inputs cannot be kept alive.

#pragma once

#include <keydiff/change.h>
#include <keydiff/iterators.h>

#include <concepts>
#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace keydiff {

namespace detail {

// ============================================================
// PureBuckets - the added/removed half shared by map and set changesets
// ============================================================

template<typename Key, typename Value>
class PureBuckets {
public:
    using key_type = Key;
    using value_type = Value;
    using add_type = Add<Key, Value>;
    using remove_type = Remove<Key, Value>;

    PureBuckets() = default;

    PureBuckets(std::vector<add_type> added, std::vector<remove_type> removed) noexcept
        : added_(std::move(added)), removed_(std::move(removed))
    {
    }

    [[nodiscard]] const std::vector<add_type>& added() const noexcept { return added_; }
    [[nodiscard]] const std::vector<remove_type>& removed() const noexcept { return removed_; }

    /// Values present in the target but not in the source
    [[nodiscard]] Additions<add_type> additions() const noexcept
    {
        return Additions<add_type>{std::span<const add_type>{added_}};
    }

    /// Values present in the source but not in the target
    [[nodiscard]] Removals<remove_type> removals() const noexcept
    {
        return Removals<remove_type>{std::span<const remove_type>{removed_}};
    }

    /// Additions followed by removals
    [[nodiscard]] PureChanges<Key, Value> pure_changes() const noexcept
    {
        return PureChanges<Key, Value>{additions(), removals()};
    }

protected:
    [[nodiscard]] bool pure_empty() const noexcept { return added_.empty() && removed_.empty(); }
    [[nodiscard]] std::size_t pure_size() const noexcept { return added_.size() + removed_.size(); }

private:
    std::vector<add_type> added_;
    std::vector<remove_type> removed_;
};

} // namespace detail

// ============================================================
// MapChangeset
//
// Result of diffing two maps. Delta is the value strategy's result type:
// Modification<V> for leaf comparison, or another changeset when the values
// are diffed recursively.
// ============================================================

template<typename Key, typename Value, typename Delta>
class MapChangeset : public detail::PureBuckets<Key, Value> {
    using base = detail::PureBuckets<Key, Value>;

public:
    using modification_type = Delta;
    using modify_type = Modify<Key, Delta>;
    using change_type = Change<Key, Value, Delta>;

    static constexpr bool can_modify = true;

    MapChangeset() = default;

    MapChangeset(std::vector<typename base::add_type> added,
                 std::vector<typename base::remove_type> removed,
                 std::vector<modify_type> modified) noexcept
        : base(std::move(added), std::move(removed)), modified_(std::move(modified))
    {
    }

    /// True iff there are no additions, removals or modifications. O(1).
    [[nodiscard]] bool is_empty() const noexcept { return this->pure_empty() && modified_.empty(); }

    /// A non-empty changeset is itself a change; lets changesets nest as deltas.
    [[nodiscard]] bool has_changes() const noexcept { return !is_empty(); }

    /// Total number of entries across the three buckets
    [[nodiscard]] std::size_t size() const noexcept { return this->pure_size() + modified_.size(); }

    [[nodiscard]] const std::vector<modify_type>& modified() const noexcept { return modified_; }

    /// Keys present in both inputs whose values differ
    [[nodiscard]] Modifications<modify_type> modifications() const noexcept
    {
        return Modifications<modify_type>{std::span<const modify_type>{modified_}};
    }

    /// Additions, then removals, then modifications
    [[nodiscard]] Changes<Key, Value, Delta> changes() const noexcept
    {
        return Changes<Key, Value, Delta>{this->additions(), this->removals(), modifications()};
    }

private:
    std::vector<modify_type> modified_;
};

// ============================================================
// SetChangeset
//
// Result of diffing two sets. An element either is or is not present, so
// there is nothing to modify: modifications() is empty by type, its element
// Modify<T, NoModification> cannot be constructed. Each Add/Remove uses the
// element as both key and value.
// ============================================================

template<typename T>
class SetChangeset : public detail::PureBuckets<T, T> {
    using base = detail::PureBuckets<T, T>;

public:
    using modification_type = NoModification;
    using modify_type = Modify<T, NoModification>;
    using change_type = Change<T, T, NoModification>;

    static constexpr bool can_modify = false;

    SetChangeset() = default;

    SetChangeset(std::vector<typename base::add_type> added,
                 std::vector<typename base::remove_type> removed) noexcept
        : base(std::move(added), std::move(removed))
    {
    }

    [[nodiscard]] bool is_empty() const noexcept { return this->pure_empty(); }
    [[nodiscard]] bool has_changes() const noexcept { return !is_empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return this->pure_size(); }

    /// Always empty
    [[nodiscard]] static Modifications<modify_type> modifications() noexcept
    {
        return Modifications<modify_type>{};
    }

    [[nodiscard]] Changes<T, T, NoModification> changes() const noexcept
    {
        return Changes<T, T, NoModification>{this->additions(), this->removals(), modifications()};
    }
};

// ============================================================
// Changeset concepts
// ============================================================

/// Exposes additions and removals
template<typename C>
concept PureChangeset = requires(const C& c) {
    typename C::key_type;
    typename C::value_type;
    { c.is_empty() } -> std::convertible_to<bool>;
    { c.additions() };
    { c.removals() };
    { c.pure_changes() };
};

/// Exposes additions, removals and modifications
template<typename C>
concept FullChangeset = PureChangeset<C> && requires(const C& c) {
    typename C::modification_type;
    { c.modifications() };
    { c.changes() };
};

template<typename T>
struct is_set_changeset : std::false_type {};

template<typename T>
struct is_set_changeset<SetChangeset<T>> : std::true_type {};

template<typename T>
struct is_map_changeset : std::false_type {};

template<typename K, typename V, typename D>
struct is_map_changeset<MapChangeset<K, V, D>> : std::true_type {};

} // namespace keydiff
