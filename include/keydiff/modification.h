// modification.h - Leaf comparison result

#pragma once

#include <utility>
#include <variant>

namespace keydiff {

/// Both sides compared equal. Borrows the (source) value.
template<typename T>
struct Equal {
    const T* value = nullptr;
};

/// The sides differ. Borrows both compared values.
template<typename T>
struct Different {
    const T* source = nullptr;
    const T* target = nullptr;
};

// ============================================================
// Modification - result of the Simple (leaf) strategy
//
// Holds either Equal{value} or Different{source, target}. It never looks into
// the structure of T; two std::set<int> are either equal or different.
// The referenced values must outlive the Modification.
// ============================================================

template<typename T>
class Modification {
public:
    [[nodiscard]] static Modification equal(const T& value) noexcept
    {
        return Modification{Equal<T>{&value}};
    }

    [[nodiscard]] static Modification different(const T& source, const T& target) noexcept
    {
        return Modification{Different<T>{&source, &target}};
    }

    /// Compare with operator== and wrap the outcome
    [[nodiscard]] static Modification compare(const T& source, const T& target)
    {
        if (source == target) {
            return equal(source);
        }
        return different(source, target);
    }

    [[nodiscard]] bool has_changes() const noexcept
    {
        return std::holds_alternative<Different<T>>(state_);
    }

    [[nodiscard]] bool is_equal() const noexcept { return !has_changes(); }

    [[nodiscard]] const Equal<T>* as_equal() const noexcept { return std::get_if<Equal<T>>(&state_); }
    [[nodiscard]] const Different<T>* as_different() const noexcept { return std::get_if<Different<T>>(&state_); }

    /// The source side (the single value for Equal)
    [[nodiscard]] const T& source() const noexcept
    {
        if (const auto* diff = as_different()) {
            return *diff->source;
        }
        return *std::get<Equal<T>>(state_).value;
    }

    /// The target side (the single value for Equal)
    [[nodiscard]] const T& target() const noexcept
    {
        if (const auto* diff = as_different()) {
            return *diff->target;
        }
        return *std::get<Equal<T>>(state_).value;
    }

    template<typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const
    {
        return std::visit(std::forward<Visitor>(visitor), state_);
    }

private:
    explicit Modification(Equal<T> eq) noexcept : state_(eq) {}
    explicit Modification(Different<T> diff) noexcept : state_(diff) {}

    std::variant<Equal<T>, Different<T>> state_;
};

} // namespace keydiff
