// test_iterators.cpp - Tests for the lazy changeset adapters
// Ordering contract, exhaustion, independence of accessor calls

#include <catch2/catch_all.hpp>
#include <keydiff/keydiff.h>

#include <map>
#include <set>
#include <string>
#include <vector>

using namespace keydiff;

namespace {

std::map<std::string, int> inventory_before()
{
    return {{"apple", 3}, {"banana", 5}, {"cherry", 7}, {"damson", 1}};
}

std::map<std::string, int> inventory_after()
{
    return {{"apple", 3}, {"banana", 6}, {"elder", 2}, {"fig", 4}, {"damson", 0}};
}

} // namespace

TEST_CASE("Bucket adapters", "[iterators]") {
    const auto before = inventory_before();
    const auto after = inventory_after();
    const auto changeset = diff_with(before, after);

    SECTION("next() walks the bucket in order") {
        auto additions = changeset.additions();
        REQUIRE(additions.remaining() == 2);

        const auto* first = additions.next();
        REQUIRE(first != nullptr);
        REQUIRE(*first->key == "elder");
        REQUIRE(*first->value == 2);

        const auto* second = additions.next();
        REQUIRE(second != nullptr);
        REQUIRE(*second->key == "fig");
        REQUIRE(additions.remaining() == 0);
    }

    SECTION("exhaustion is stable") {
        auto removals = changeset.removals();
        REQUIRE(removals.next() != nullptr);
        REQUIRE(removals.next() == nullptr);
        REQUIRE(removals.next() == nullptr);
        REQUIRE(removals.next() == nullptr);
        REQUIRE(removals.remaining() == 0);
    }

    SECTION("default adapter is empty") {
        Modifications<Modify<int, Modification<int>>> nothing;
        REQUIRE(nothing.next() == nullptr);
        REQUIRE(nothing.next() == nullptr);
    }

    SECTION("range-for") {
        std::vector<std::string> keys;
        for (const auto& modify : changeset.modifications()) {
            keys.push_back(*modify.key);
        }
        REQUIRE(keys == std::vector<std::string>{"banana", "damson"});
    }
}

TEST_CASE("Accessor calls are independent", "[iterators]") {
    const auto before = inventory_before();
    const auto after = inventory_after();
    const auto changeset = diff_with(before, after);

    auto first = changeset.changes();
    while (first.next()) {
    }
    REQUIRE_FALSE(first.next().has_value());

    // A fresh adapter starts from the beginning again
    auto second = changeset.changes();
    REQUIRE(second.remaining() == changeset.size());
    auto change = second.next();
    REQUIRE(change.has_value());
    REQUIRE(change->is_add());

    // Iterating did not alter the changeset
    REQUIRE(changeset.size() == 5);
    REQUIRE(changeset.added().size() == 2);
}

TEST_CASE("Changes ordering contract", "[iterators][order]") {
    const auto before = inventory_before();
    const auto after = inventory_after();
    const auto changeset = diff_with(before, after);

    std::vector<ChangeKind> kinds;
    std::vector<std::string> keys;
    for (const auto& change : changeset.changes()) {
        kinds.push_back(change.kind());
        keys.push_back(change.key());
    }

    REQUIRE(kinds == std::vector<ChangeKind>{
        ChangeKind::Add, ChangeKind::Add,
        ChangeKind::Remove,
        ChangeKind::Modify, ChangeKind::Modify});
    REQUIRE(keys == std::vector<std::string>{"elder", "fig", "cherry", "banana", "damson"});
}

TEST_CASE("PureChanges yields additions then removals", "[iterators][order]") {
    const std::set<int> source{1, 2, 3, 5};
    const std::set<int> target{2, 3, 4, 6};
    const auto changeset = diff_with(source, target);

    auto pure = changeset.pure_changes();
    REQUIRE(pure.remaining() == 4);

    std::vector<std::pair<ChangeKind, int>> seen;
    while (auto change = pure.next()) {
        seen.emplace_back(change->kind(), change->key());
    }
    REQUIRE(seen == std::vector<std::pair<ChangeKind, int>>{
        {ChangeKind::Add, 4}, {ChangeKind::Add, 6},
        {ChangeKind::Remove, 1}, {ChangeKind::Remove, 5}});
    REQUIRE_FALSE(pure.next().has_value());
}
