// test_immer_walk.cpp - immer walks without the umbrella header
// Only map_diff.h is included: the immer::diff walk must still be chosen.

#include <catch2/catch_all.hpp>
#include <keydiff/map_diff.h>

#include <immer/map.hpp>
#include <immer/set.hpp>

using namespace keydiff;

TEST_CASE("immer walk is used when only map_diff.h is included", "[immer][sharing]") {
    auto source = immer::map<int, int>{};
    for (int i = 0; i < 1000; ++i) {
        source = source.set(i, i);
    }
    const auto target = source.set(10, -10);

    int compared = 0;
    auto counting = make_strategy<int>([&compared](const int& a, const int& b) {
        ++compared;
        return Modification<int>::compare(a, b);
    });

    const auto changeset = diff_with(source, target, counting);

    REQUIRE(changeset.modified().size() == 1);
    REQUIRE(*changeset.modified()[0].key == 10);
    REQUIRE(compared < 100);
}

TEST_CASE("immer set walk is used when only map_diff.h is included", "[immer][sharing]") {
    auto source = immer::set<int>{};
    for (int i = 0; i < 1000; ++i) {
        source = source.insert(i);
    }
    const auto target = source.erase(7).insert(2000);

    const auto changeset = diff_with(source, target);

    REQUIRE(changeset.added().size() == 1);
    REQUIRE(*changeset.added()[0].key == 2000);
    REQUIRE(changeset.removed().size() == 1);
    REQUIRE(*changeset.removed()[0].key == 7);
}

TEST_CASE("keydiff settings reach immer when keydiff is included first", "[immer][config]") {
    STATIC_REQUIRE(KEYDIFF_ENABLE_IMMER == 1);
    STATIC_REQUIRE(IMMER_TAGGED_NODE == 0);
    STATIC_REQUIRE(IMMER_DEBUG_DEEP_CHECK == 0);
}
