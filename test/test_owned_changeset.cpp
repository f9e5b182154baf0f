// test_owned_changeset.cpp - Tests for diff_owned

#include <catch2/catch_all.hpp>
#include <keydiff/keydiff.h>

#include <immer/map.hpp>

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace keydiff;

namespace {

using Table = std::map<std::string, int>;

OwnedChangeset<Table> make_owned()
{
    Table before{{"a", 1}, {"b", 2}};
    Table after{{"b", 3}, {"c", 4}};
    // Both temporaries die here; the result keeps its own copies
    return diff_owned(std::move(before), std::move(after));
}

} // namespace

TEST_CASE("diff_owned outlives its arguments", "[owned]") {
    const auto owned = make_owned();

    REQUIRE(owned->size() == 3);
    REQUIRE(*owned->added()[0].key == "c");
    REQUIRE(*owned->removed()[0].key == "a");
    REQUIRE(owned->modified()[0].modification.target() == 3);

    // Pointers refer into the stored copies
    REQUIRE(owned->added()[0].value == &owned.target().at("c"));
    REQUIRE(owned->removed()[0].value == &owned.source().at("a"));
}

TEST_CASE("diff_owned pointers survive a move", "[owned]") {
    auto owned = make_owned();
    const auto* key_before = owned->added()[0].key;
    const auto* source_before = &owned.source();

    auto moved = std::move(owned);
    REQUIRE(moved->added()[0].key == key_before);
    REQUIRE(&moved.source() == source_before);
    REQUIRE(*moved->added()[0].key == "c");

    std::vector<OwnedChangeset<Table>> kept;
    kept.push_back(std::move(moved));
    kept.push_back(make_owned());
    kept.push_back(make_owned());
    REQUIRE(*kept[0]->added()[0].key == "c");
    REQUIRE(kept[0]->added()[0].key == key_before);
}

TEST_CASE("diff_owned honours the scope", "[owned][scope]") {
    std::map<int, std::set<int>> before{{1, {1, 2}}};
    std::map<int, std::set<int>> after{{1, {1}}};

    auto leaf = diff_owned<map_value_diff::Simply>(before, after);
    REQUIRE(leaf->modified()[0].modification.target() == std::set<int>{1});

    auto nested = diff_owned(before, after);
    REQUIRE(*nested->modified()[0].modification.removed()[0].key == 2);

    // The caller's collections were copied, not borrowed
    REQUIRE(&leaf.source() != &before);
}

TEST_CASE("diff_owned over immer maps", "[owned][immer]") {
    const auto before = immer::map<int, std::string>{}.set(1, "x").set(2, "y");
    const auto after = before.set(2, "z");

    auto owned = diff_owned(before, after);
    REQUIRE(owned->modified().size() == 1);
    REQUIRE(*owned->modified()[0].key == 2);
    REQUIRE(owned.target() == after);
}
