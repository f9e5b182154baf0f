// set_diff.h - Diff of set-like collections
//
// added   = target − source
// removed = source − target
//
// There is no modify case: an element either is or isn't present, and there
// is no sub-structure to recurse into. Sorted sets are walked in order,
// hashed sets by membership lookup, immer sets through immer::diff.

#pragma once

#include <keydiff/keydiff_config.h>
#include <keydiff/changeset.h>
#include <keydiff/concepts.h>
#include <keydiff/diff_traits.h>
#include <keydiff/key_walk.h>

#include <utility>
#include <vector>

namespace keydiff {

template<SetLike Set>
class SetDiffer {
public:
    using element_type = typename Set::value_type;
    using changeset_type = SetChangeset<element_type>;

    [[nodiscard]] changeset_type diff(const Set& source, const Set& target) const
    {
        Collector collector;
        collector.added.reserve(target.size());
        collector.removed.reserve(source.size());

        detail::SetWalk<Set>::walk(source, target, collector);

        detail::trim_bucket(collector.added);
        detail::trim_bucket(collector.removed);

        return changeset_type{std::move(collector.added), std::move(collector.removed)};
    }

private:
    struct Collector {
        std::vector<typename changeset_type::add_type> added;
        std::vector<typename changeset_type::remove_type> removed;

        void on_added(const element_type& element) { added.push_back({&element, &element}); }
        void on_removed(const element_type& element) { removed.push_back({&element, &element}); }
    };
};

template<SetLike Set>
struct DiffTraits<Set, scope::Arbitrary> {
    using change_type = typename SetDiffer<Set>::changeset_type;
    static constexpr ChangeShape shape = ChangeShape::Set;

    static change_type diff(const Set& source, const Set& target)
    {
        return SetDiffer<Set>{}.diff(source, target);
    }
};

} // namespace keydiff
