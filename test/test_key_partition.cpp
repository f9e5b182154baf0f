// test_key_partition.cpp - Tests for partition_keys

#include <catch2/catch_all.hpp>
#include <keydiff/keydiff.h>

#include <algorithm>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

using namespace keydiff;

namespace {

std::vector<std::string> names(const std::vector<const std::string*>& keys)
{
    std::vector<std::string> out;
    for (const auto* key : keys) {
        out.push_back(*key);
    }
    return out;
}

} // namespace

TEST_CASE("partition_keys on sorted maps", "[partition]") {
    const std::map<std::string, int> source{{"alpha", 1}, {"beta", 2}, {"delta", 4}};
    const std::map<std::string, int> target{{"beta", 2}, {"gamma", 3}, {"delta", 40}};

    const auto parts = partition_keys(source, target);

    REQUIRE(names(parts.source_only) == std::vector<std::string>{"alpha"});
    REQUIRE(names(parts.target_only) == std::vector<std::string>{"gamma"});
    // Common keys are reported whether or not their values differ
    REQUIRE(names(parts.common) == std::vector<std::string>{"beta", "delta"});
    REQUIRE(parts.size() == 4);
    REQUIRE_FALSE(parts.identical_keys());
}

TEST_CASE("partition_keys on hashed maps", "[partition][hashed]") {
    const std::unordered_map<std::string, int> source{{"a", 1}, {"b", 2}, {"c", 3}};
    const std::unordered_map<std::string, int> target{{"c", 3}, {"d", 4}};

    const auto parts = partition_keys(source, target);

    auto sorted = [](std::vector<std::string> v) {
        std::sort(v.begin(), v.end());
        return v;
    };
    REQUIRE(sorted(names(parts.source_only)) == std::vector<std::string>{"a", "b"});
    REQUIRE(names(parts.target_only) == std::vector<std::string>{"d"});
    REQUIRE(names(parts.common) == std::vector<std::string>{"c"});
}

TEST_CASE("partition_keys totality", "[partition][property]") {
    std::map<int, int> source;
    std::map<int, int> target;
    for (int i = 0; i < 50; ++i) {
        if (i % 3 != 0) {
            source[i] = i;
        }
        if (i % 2 == 0) {
            target[i] = i * 2;
        }
    }

    const auto parts = partition_keys(source, target);

    std::vector<int> all;
    for (const auto* list : {&parts.source_only, &parts.target_only, &parts.common}) {
        for (const auto* key : *list) {
            all.push_back(*key);
        }
    }
    std::sort(all.begin(), all.end());

    std::vector<int> expected;
    for (int i = 0; i < 50; ++i) {
        if (source.count(i) || target.count(i)) {
            expected.push_back(i);
        }
    }

    // Every key of the union appears exactly once
    REQUIRE(all == expected);
    REQUIRE(std::adjacent_find(all.begin(), all.end()) == all.end());
}

TEST_CASE("partition_keys with identical key sets", "[partition]") {
    const std::map<int, char> source{{1, 'a'}, {2, 'b'}};
    const std::map<int, char> target{{1, 'x'}, {2, 'b'}};

    const auto parts = partition_keys(source, target);
    REQUIRE(parts.identical_keys());
    REQUIRE(parts.common.size() == 2);
}
