// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file owned_changeset.h
/// @brief A changeset that keeps its own copies of the inputs.
///
/// diff_with() borrows: the result points into source and target and must not
/// outlive them. diff_owned() is the explicit opt-in alternative. It takes
/// both inputs by value, parks them in heap storage that never moves, and
/// diffs those copies. The result can be returned, stored and moved freely;
/// its key/value pointers stay valid for as long as it lives.
///
/// For immer containers the copies share structure with the originals, so
/// taking them costs O(1).
///
/// @code
///   auto owned = keydiff::diff_owned(load_snapshot(a), load_snapshot(b));
///   for (const auto& change : owned->changes()) { ... }
/// @endcode

#pragma once

#include <keydiff/keydiff_config.h>
#include <keydiff/diff_traits.h>
#include <keydiff/scopes.h>

#include <memory>
#include <type_traits>
#include <utility>

namespace keydiff {

template<typename Collection, typename Scope = scope::Arbitrary>
    requires ArbitraryDiff<Collection, Scope>
class OwnedChangeset {
public:
    using collection_type = Collection;
    using scope_type = Scope;
    using changeset_type = change_type_t<Collection, Scope>;

    OwnedChangeset(Collection source, Collection target)
        : inputs_(std::make_unique<const Inputs>(Inputs{std::move(source), std::move(target)}))
        , changeset_(DiffTraits<Collection, Scope>::diff(inputs_->source, inputs_->target))
    {
    }

    OwnedChangeset(OwnedChangeset&&) noexcept = default;
    OwnedChangeset& operator=(OwnedChangeset&&) noexcept = default;

    // The changeset points into inputs_; a copy would point into ours.
    OwnedChangeset(const OwnedChangeset&) = delete;
    OwnedChangeset& operator=(const OwnedChangeset&) = delete;

    [[nodiscard]] const Collection& source() const noexcept { return inputs_->source; }
    [[nodiscard]] const Collection& target() const noexcept { return inputs_->target; }

    [[nodiscard]] const changeset_type& changeset() const noexcept { return changeset_; }
    [[nodiscard]] const changeset_type& operator*() const noexcept { return changeset_; }
    [[nodiscard]] const changeset_type* operator->() const noexcept { return &changeset_; }

private:
    struct Inputs {
        Collection source;
        Collection target;
    };

    // Declared before changeset_: the diff reads the stored inputs.
    std::unique_ptr<const Inputs> inputs_;
    changeset_type changeset_;
};

/// Diff copies of source and target that the result owns
template<typename Scope = scope::Arbitrary, typename Collection>
    requires ArbitraryDiff<Collection, Scope>
[[nodiscard]] OwnedChangeset<Collection, Scope> diff_owned(Collection source, Collection target)
{
    return OwnedChangeset<Collection, Scope>{std::move(source), std::move(target)};
}

} // namespace keydiff
