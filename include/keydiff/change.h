// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file change.h
/// @brief Change vocabulary produced by the differs.
///
/// - Add / Remove: a value present only in the target / only in the source
/// - Modify:       a key present in both whose value-level diff has changes
/// - PureChange:   Add | Remove
/// - Change:       Add | Remove | Modify
///
/// All of them borrow: keys and values are pointers into the two diffed
/// collections, and a Change refers to its Modify entry inside the changeset.
/// Nothing here outlives the inputs it was computed from.

#pragma once

#include <keydiff/api.h>
#include <keydiff/concepts.h>

#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace keydiff {

enum class ChangeKind : std::uint8_t { Add, Remove, Modify };

/// "add", "remove" or "modify"
[[nodiscard]] KEYDIFF_API std::string_view to_string(ChangeKind kind) noexcept;

template<typename Key, typename Value>
struct Add {
    const Key* key = nullptr;     // Where the value is added
    const Value* value = nullptr; // The value present in the target
};

template<typename Key, typename Value>
struct Remove {
    const Key* key = nullptr;     // Where the value is removed from
    const Value* value = nullptr; // The value present in the source
};

/// Only ever built for a delta whose has_changes() is true.
template<typename Key, HasChanges Delta>
struct Modify {
    const Key* key = nullptr;
    Delta modification;
};

// ============================================================
// NoModification
//
// Delta type of set changesets. It cannot be constructed, so a
// Modify<T, NoModification> can never exist.
// ============================================================
struct NoModification {
    NoModification() = delete;

    [[nodiscard]] constexpr bool has_changes() const noexcept { return false; }
};

// ============================================================
// PureChange - Add | Remove
// ============================================================

template<typename Key, typename Value>
class PureChange {
public:
    using add_type = Add<Key, Value>;
    using remove_type = Remove<Key, Value>;

    PureChange(const add_type& add) noexcept : change_(add) {}
    PureChange(const remove_type& remove) noexcept : change_(remove) {}

    [[nodiscard]] ChangeKind kind() const noexcept
    {
        return is_add() ? ChangeKind::Add : ChangeKind::Remove;
    }

    [[nodiscard]] bool is_add() const noexcept { return std::holds_alternative<add_type>(change_); }
    [[nodiscard]] bool is_remove() const noexcept { return std::holds_alternative<remove_type>(change_); }

    /// @throws std::bad_variant_access if this is not an addition
    [[nodiscard]] const add_type& add() const { return std::get<add_type>(change_); }

    /// @throws std::bad_variant_access if this is not a removal
    [[nodiscard]] const remove_type& remove() const { return std::get<remove_type>(change_); }

    [[nodiscard]] const Key& key() const noexcept
    {
        return std::visit([](const auto& c) -> const Key& { return *c.key; }, change_);
    }

    [[nodiscard]] const Value& value() const noexcept
    {
        return std::visit([](const auto& c) -> const Value& { return *c.value; }, change_);
    }

    template<typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const
    {
        return std::visit(std::forward<Visitor>(visitor), change_);
    }

private:
    std::variant<add_type, remove_type> change_;
};

// ============================================================
// Change - Add | Remove | Modify
// ============================================================

template<typename Key, typename Value, typename Delta>
class Change {
public:
    using add_type = Add<Key, Value>;
    using remove_type = Remove<Key, Value>;
    using modify_type = Modify<Key, Delta>;

    Change(const add_type& add) noexcept : change_(add) {}
    Change(const remove_type& remove) noexcept : change_(remove) {}
    Change(const modify_type& modify) noexcept : change_(&modify) {}

    Change(const PureChange<Key, Value>& pure) noexcept
        : change_(pure.is_add() ? change_type{pure.add()} : change_type{pure.remove()})
    {
    }

    [[nodiscard]] ChangeKind kind() const noexcept
    {
        return static_cast<ChangeKind>(change_.index());
    }

    [[nodiscard]] bool is_add() const noexcept { return change_.index() == 0; }
    [[nodiscard]] bool is_remove() const noexcept { return change_.index() == 1; }
    [[nodiscard]] bool is_modify() const noexcept { return change_.index() == 2; }

    /// @throws std::bad_variant_access if this is not an addition
    [[nodiscard]] const add_type& add() const { return std::get<add_type>(change_); }

    /// @throws std::bad_variant_access if this is not a removal
    [[nodiscard]] const remove_type& remove() const { return std::get<remove_type>(change_); }

    /// @throws std::bad_variant_access if this is not a modification
    [[nodiscard]] const modify_type& modify() const { return *std::get<const modify_type*>(change_); }

    [[nodiscard]] const Key& key() const noexcept
    {
        return visit([](const auto& c) -> const Key& { return *c.key; });
    }

    /// Calls the visitor with the add_type, remove_type or modify_type
    template<typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const
    {
        return std::visit(
            [&](const auto& alt) -> decltype(auto) {
                if constexpr (std::is_pointer_v<std::decay_t<decltype(alt)>>) {
                    return std::forward<Visitor>(visitor)(*alt);
                } else {
                    return std::forward<Visitor>(visitor)(alt);
                }
            },
            change_);
    }

private:
    // Alternative order matches ChangeKind
    using change_type = std::variant<add_type, remove_type, const modify_type*>;

    change_type change_;
};

} // namespace keydiff
