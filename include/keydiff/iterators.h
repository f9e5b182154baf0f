// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file iterators.h
/// @brief Lazy output adapters over the buckets of a changeset.
///
/// - Additions / Removals / Modifications: pull over one precomputed bucket
/// - PureChanges: additions, then removals
/// - Changes:     additions, then removals, then modifications
///
/// Every adapter is a single-pass input range. next() hands out the next
/// element and, once it has reported exhaustion, keeps reporting it: an
/// adapter is never advanced past its end and never restarts. Asking the
/// changeset for a new adapter is how iteration restarts.
///
/// Example:
/// @code
///   auto changes = changeset.changes();
///   while (auto change = changes.next()) {
///       switch (change->kind()) { ... }
///   }
///
///   for (const auto& add : changeset.additions()) {
///       use(*add.key, *add.value);
///   }
/// @endcode

#pragma once

#include <keydiff/change.h>

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>

namespace keydiff {

namespace detail {

// ============================================================
// PullIterator - input iterator over anything with next()
//
// next() may return a pointer (nullptr at the end) or a std::optional
// (nullopt at the end). The iterator compares equal to
// std::default_sentinel once the puller is exhausted.
// ============================================================

template<typename Puller>
class PullIterator {
    using pulled_type = decltype(std::declval<Puller&>().next());

public:
    using iterator_concept = std::input_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = std::remove_cvref_t<decltype(*std::declval<pulled_type&>())>;

    PullIterator() = default;

    explicit PullIterator(Puller& puller) : puller_(&puller), current_(puller.next()) {}

    const value_type& operator*() const { return *current_; }
    const value_type* operator->() const { return std::addressof(*current_); }

    PullIterator& operator++()
    {
        current_ = puller_->next();
        return *this;
    }

    void operator++(int) { ++*this; }

    friend bool operator==(const PullIterator& it, std::default_sentinel_t) noexcept
    {
        return !it.current_;
    }

private:
    Puller* puller_ = nullptr;
    pulled_type current_{};
};

/// CRTP base giving a puller begin()/end() for range-for
template<typename Derived>
class PullRange {
public:
    auto begin() { return PullIterator<Derived>{static_cast<Derived&>(*this)}; }
    std::default_sentinel_t end() const noexcept { return {}; }
};

// ============================================================
// BucketCursor
//
// Walks a span once. After the first exhausted next() the span is dropped,
// so later calls cannot touch the bucket again.
// ============================================================

template<typename Elem>
class BucketCursor {
public:
    BucketCursor() = default;

    explicit BucketCursor(std::span<const Elem> bucket) noexcept : bucket_(bucket) {}

    const Elem* next() noexcept
    {
        if (!bucket_) {
            return nullptr;
        }
        if (bucket_->empty()) {
            bucket_.reset();
            return nullptr;
        }
        const Elem* elem = bucket_->data();
        *bucket_ = bucket_->subspan(1);
        return elem;
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return bucket_ ? bucket_->size() : 0;
    }

private:
    std::optional<std::span<const Elem>> bucket_;
};

struct additions_tag {};
struct removals_tag {};
struct modifications_tag {};

/// One bucket adapter; Tag keeps Additions, Removals and Modifications
/// distinct types.
template<typename Elem, typename Tag>
class BucketAdapter : public PullRange<BucketAdapter<Elem, Tag>> {
public:
    using value_type = Elem;

    /// An adapter over nothing; exhausted on the first next().
    BucketAdapter() = default;

    explicit BucketAdapter(std::span<const Elem> bucket) noexcept : cursor_(bucket) {}

    /// The next element, or nullptr once the bucket is exhausted
    const Elem* next() noexcept { return cursor_.next(); }

    /// Elements not yet handed out
    [[nodiscard]] std::size_t remaining() const noexcept { return cursor_.remaining(); }

private:
    BucketCursor<Elem> cursor_;
};

} // namespace detail

/// The additions needed to turn the source into the target
template<typename Elem>
using Additions = detail::BucketAdapter<Elem, detail::additions_tag>;

/// The removals needed to turn the source into the target
template<typename Elem>
using Removals = detail::BucketAdapter<Elem, detail::removals_tag>;

/// The modifications needed to turn the source into the target
template<typename Elem>
using Modifications = detail::BucketAdapter<Elem, detail::modifications_tag>;

// ============================================================
// PureChanges - additions, then removals
// ============================================================

template<typename Key, typename Value>
class PureChanges : public detail::PullRange<PureChanges<Key, Value>> {
public:
    using value_type = PureChange<Key, Value>;

    PureChanges(Additions<Add<Key, Value>> additions, Removals<Remove<Key, Value>> removals) noexcept
        : additions_(std::move(additions)), removals_(std::move(removals))
    {
    }

    std::optional<value_type> next() noexcept
    {
        if (const auto* add = additions_.next()) {
            return value_type{*add};
        }
        if (const auto* remove = removals_.next()) {
            return value_type{*remove};
        }
        return std::nullopt;
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return additions_.remaining() + removals_.remaining();
    }

private:
    Additions<Add<Key, Value>> additions_;
    Removals<Remove<Key, Value>> removals_;
};

// ============================================================
// Changes - additions, then removals, then modifications
//
// The order is part of the contract: consumers such as change-log renderers
// report presence changes before nested modifications.
// ============================================================

template<typename Key, typename Value, typename Delta>
class Changes : public detail::PullRange<Changes<Key, Value, Delta>> {
public:
    using value_type = Change<Key, Value, Delta>;

    Changes(Additions<Add<Key, Value>> additions,
            Removals<Remove<Key, Value>> removals,
            Modifications<Modify<Key, Delta>> modifications) noexcept
        : pure_(std::move(additions), std::move(removals)),
          modifications_(std::move(modifications))
    {
    }

    std::optional<value_type> next() noexcept
    {
        if (auto pure = pure_.next()) {
            return value_type{*pure};
        }
        if (const auto* modify = modifications_.next()) {
            return value_type{*modify};
        }
        return std::nullopt;
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return pure_.remaining() + modifications_.remaining();
    }

private:
    PureChanges<Key, Value> pure_;
    Modifications<Modify<Key, Delta>> modifications_;
};

} // namespace keydiff
