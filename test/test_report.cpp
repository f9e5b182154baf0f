// test_report.cpp - Tests for the change log renderer

#include <catch2/catch_all.hpp>
#include <keydiff/keydiff.h>

#include <map>
#include <set>
#include <sstream>
#include <string>

using namespace keydiff;

TEST_CASE("change_label", "[report]") {
    REQUIRE(change_label(ChangeKind::Add) == "ADD   ");
    REQUIRE(change_label(ChangeKind::Remove) == "REMOVE");
    REQUIRE(change_label(ChangeKind::Modify) == "MODIFY");
}

TEST_CASE("Report of a flat map", "[report]") {
    const std::map<std::string, int> before{{"a", 1}, {"b", 2}, {"c", 3}};
    const std::map<std::string, int> after{{"a", 1}, {"b", 5}, {"d", 4}};

    REQUIRE(changes_to_string(diff_with(before, after)) ==
            "ADD    d: 4\n"
            "REMOVE c: 3\n"
            "MODIFY b: 2 -> 5\n");
}

TEST_CASE("Report of a set", "[report]") {
    const std::set<int> before{1, 2, 3};
    const std::set<int> after{2, 3, 4};

    REQUIRE(changes_to_string(diff_with(before, after)) ==
            "ADD    4\n"
            "REMOVE 1\n");
}

TEST_CASE("Report of nested changes", "[report]") {
    const std::map<int, std::set<int>> before{{1, {1, 2, 3}}, {2, {1, 2, 3}}, {3, {1, 2, 3}}};
    const std::map<int, std::set<int>> after{{1, {1, 2, 3}}, {2, {1, 3}}, {4, {1, 2, 3}}};

    SECTION("recursive") {
        REQUIRE(changes_to_string(diff_with(before, after)) ==
                "ADD    4: {1, 2, 3}\n"
                "REMOVE 3: {1, 2, 3}\n"
                "MODIFY 2:\n"
                "  REMOVE 2\n");
    }

    SECTION("leaf") {
        REQUIRE(changes_to_string(diff_with<map_value_diff::Simply>(before, after)) ==
                "ADD    4: {1, 2, 3}\n"
                "REMOVE 3: {1, 2, 3}\n"
                "MODIFY 2: {1, 2, 3} -> {1, 3}\n");
    }
}

TEST_CASE("Report of an empty changeset", "[report]") {
    const std::map<int, int> same{{1, 1}};
    REQUIRE(changes_to_string(diff_with(same, same)) == "(no changes)\n");

    std::ostringstream out;
    print_changes(out, diff_with(same, same));
    REQUIRE(out.str() == "  (no changes)\n");
}

namespace {

template<typename T>
concept Reportable = requires(const T& changeset) { changes_to_string(changeset); };

} // namespace

TEST_CASE("Reports accept changesets only", "[report][concepts]") {
    using Flat = MapChangeset<int, int, Modification<int>>;

    STATIC_REQUIRE(FullChangeset<SetChangeset<int>>);
    STATIC_REQUIRE(FullChangeset<Flat>);
    STATIC_REQUIRE(PureChangeset<Flat>);

    STATIC_REQUIRE_FALSE(PureChangeset<std::set<int>>);
    STATIC_REQUIRE_FALSE(PureChangeset<std::map<int, int>>);
    STATIC_REQUIRE_FALSE(PureChangeset<Modification<int>>);

    STATIC_REQUIRE_FALSE(Reportable<std::set<int>>);
    STATIC_REQUIRE(Reportable<SetChangeset<int>>);
}
