// report.h - Human-readable change log for changesets
//
// One line per change, in changeset order (additions, removals,
// modifications), indented two spaces per depth level:
//
//   ADD    4: {7, 8}
//   REMOVE 1: {1, 2}
//   MODIFY 3:
//     REMOVE 3
//
// Leaf modifications print "MODIFY key: source -> target"; nested changesets
// print "MODIFY key:" and recurse one level deeper. Set entries print only
// the element.

#pragma once

#include <keydiff/api.h>
#include <keydiff/change.h>
#include <keydiff/changeset.h>
#include <keydiff/modification.h>

#include <concepts>
#include <cstddef>
#include <ostream>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace keydiff {

/// "ADD   ", "REMOVE" or "MODIFY" (padded to the same width)
[[nodiscard]] KEYDIFF_API std::string_view change_label(ChangeKind kind) noexcept;

namespace detail {

KEYDIFF_API void write_indent(std::ostream& os, std::size_t depth);

template<typename T>
concept Streamable = requires(std::ostream& os, const T& value) {
    { os << value } -> std::convertible_to<std::ostream&>;
};

template<typename T>
concept PairLike = requires(const T& value) {
    value.first;
    value.second;
};

template<typename T>
struct is_modification : std::false_type {};

template<typename T>
struct is_modification<Modification<T>> : std::true_type {};

template<typename T>
void write_value(std::ostream& os, const T& value)
{
    if constexpr (Streamable<T>) {
        os << value;
    } else if constexpr (PairLike<T>) {
        write_value(os, value.first);
        os << ": ";
        write_value(os, value.second);
    } else if constexpr (std::ranges::input_range<const T>) {
        os << '{';
        bool first = true;
        for (const auto& element : value) {
            if (!first) {
                os << ", ";
            }
            first = false;
            write_value(os, element);
        }
        os << '}';
    } else {
        os << "<unprintable>";
    }
}

} // namespace detail

template<typename T>
void print_changes(std::ostream& os, const SetChangeset<T>& changeset, std::size_t depth = 1);

template<typename Key, typename Value, typename Delta>
void print_changes(std::ostream& os, const MapChangeset<Key, Value, Delta>& changeset, std::size_t depth = 1);

template<typename T>
void print_changes(std::ostream& os, const SetChangeset<T>& changeset, std::size_t depth)
{
    if (changeset.is_empty()) {
        detail::write_indent(os, depth);
        os << "(no changes)\n";
        return;
    }
    for (const auto& change : changeset.pure_changes()) {
        detail::write_indent(os, depth);
        os << change_label(change.kind()) << ' ';
        detail::write_value(os, change.key());
        os << '\n';
    }
}

template<typename Key, typename Value, typename Delta>
void print_changes(std::ostream& os, const MapChangeset<Key, Value, Delta>& changeset, std::size_t depth)
{
    if (changeset.is_empty()) {
        detail::write_indent(os, depth);
        os << "(no changes)\n";
        return;
    }

    for (const auto& change : changeset.pure_changes()) {
        detail::write_indent(os, depth);
        os << change_label(change.kind()) << ' ';
        detail::write_value(os, change.key());
        os << ": ";
        detail::write_value(os, change.value());
        os << '\n';
    }

    for (const auto& modify : changeset.modifications()) {
        detail::write_indent(os, depth);
        os << change_label(ChangeKind::Modify) << ' ';
        detail::write_value(os, *modify.key);
        os << ':';

        const Delta& delta = modify.modification;
        if constexpr (detail::is_modification<Delta>::value) {
            os << ' ';
            detail::write_value(os, delta.source());
            os << " -> ";
            detail::write_value(os, delta.target());
            os << '\n';
        } else if constexpr (is_map_changeset<Delta>::value || is_set_changeset<Delta>::value) {
            os << '\n';
            print_changes(os, delta, depth + 1);
        } else {
            os << ' ';
            detail::write_value(os, delta);
            os << '\n';
        }
    }
}

/// The print_changes() output as a string, at depth 0
template<PureChangeset Changeset>
[[nodiscard]] std::string changes_to_string(const Changeset& changeset)
{
    std::ostringstream out;
    print_changes(out, changeset, 0);
    return out.str();
}

} // namespace keydiff
