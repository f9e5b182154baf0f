// test_set_diff.cpp - Tests for the set differ
// Scenario B, hashed sets, the empty modifications bucket

#include <catch2/catch_all.hpp>
#include <keydiff/keydiff.h>

#include <algorithm>
#include <set>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>

using namespace keydiff;

namespace {

template<typename Bucket>
std::vector<int> elements_of(const Bucket& bucket)
{
    std::vector<int> out;
    for (const auto& entry : bucket) {
        out.push_back(*entry.key);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

TEST_CASE("Scenario B: set diff", "[set_diff][scenario]") {
    const std::set<int> source{1, 2, 3};
    const std::set<int> target{2, 3, 4};

    const auto changeset = diff_with(source, target);
    STATIC_REQUIRE(std::is_same_v<std::decay_t<decltype(changeset)>, SetChangeset<int>>);

    REQUIRE(elements_of(changeset.added()) == std::vector<int>{4});
    REQUIRE(elements_of(changeset.removed()) == std::vector<int>{1});
    REQUIRE(changeset.size() == 2);
}

TEST_CASE("Set entries use the element as key and value", "[set_diff]") {
    const std::set<std::string> source{"red", "green"};
    const std::set<std::string> target{"green", "blue"};

    const auto changeset = diff_with(source, target);
    REQUIRE(changeset.added().size() == 1);

    const auto& add = changeset.added()[0];
    REQUIRE(add.key == add.value);
    REQUIRE(add.key == &*target.find("blue"));

    const auto& remove = changeset.removed()[0];
    REQUIRE(remove.key == &*source.find("red"));
}

TEST_CASE("Set changesets never modify", "[set_diff]") {
    const std::set<int> source{1, 2, 3};
    const std::set<int> target{3, 4, 5};
    const auto changeset = diff_with(source, target);

    STATIC_REQUIRE_FALSE(SetChangeset<int>::can_modify);
    STATIC_REQUIRE(std::is_same_v<SetChangeset<int>::modification_type, NoModification>);

    auto modifications = changeset.modifications();
    REQUIRE(modifications.remaining() == 0);
    REQUIRE(modifications.next() == nullptr);

    for (const auto& change : changeset.changes()) {
        REQUIRE_FALSE(change.is_modify());
    }
}

TEST_CASE("Set diff over unordered_set", "[set_diff][hashed]") {
    const std::unordered_set<int> source{10, 20, 30, 40};
    const std::unordered_set<int> target{30, 40, 50};

    const auto changeset = diff_with(source, target);
    REQUIRE(elements_of(changeset.added()) == std::vector<int>{50});
    REQUIRE(elements_of(changeset.removed()) == std::vector<int>{10, 20});
}

TEST_CASE("Set diff edge cases", "[set_diff][edge]") {
    const std::set<int> empty;
    const std::set<int> some{1, 2};

    REQUIRE(diff_with(empty, empty).is_empty());
    REQUIRE(diff_with(some, some).is_empty());
    REQUIRE(elements_of(diff_with(empty, some).added()) == std::vector<int>{1, 2});
    REQUIRE(elements_of(diff_with(some, empty).removed()) == std::vector<int>{1, 2});
}
