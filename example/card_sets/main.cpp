// main.cpp
// Card Sets Example - Comparing two catalogs of trading card sets
//
// Two providers publish the same card sets with slightly different data.
// The example:
//   1. partitions the set names (both / first only / second only)
//   2. diffs each common set, card name -> card numbers, with a strategy
//      picked on the command line (--strategy simple|recursive)
//   3. prints the change log of every set that differs
//
// Usage: keydiff_card_sets [--strategy simple|recursive]

#include <keydiff/keydiff.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace keydiff;

// ============================================================
// Catalog data
// ============================================================

using Printings = std::set<std::string>;               // card numbers
using CardSet = std::map<std::string, Printings>;      // card name -> printings
using Catalog = std::map<std::string, CardSet>;        // set name -> cards

Catalog first_provider()
{
    return {
        {"Base", {
            {"Alakazam", {"1"}},
            {"Blastoise", {"2"}},
            {"Chansey", {"3"}},
            {"Charizard", {"4"}},
        }},
        {"Jungle", {
            {"Clefable", {"1", "17"}},
            {"Electrode", {"2"}},
            {"Flareon", {"3", "19"}},
        }},
        {"Fossil", {
            {"Aerodactyl", {"1", "16"}},
            {"Articuno", {"2"}},
        }},
        {"Base Set 2", {
            {"Alakazam", {"1"}},
        }},
    };
}

Catalog second_provider()
{
    return {
        {"Base", {
            {"Alakazam", {"1"}},
            {"Blastoise", {"2"}},
            {"Chansey", {"3"}},
            {"Charizard", {"4", "4a"}},
            {"Clefairy", {"5"}},
        }},
        {"Jungle", {
            {"Clefable", {"1", "17"}},
            {"Flareon", {"3"}},
            {"Jolteon", {"4"}},
        }},
        {"Fossil", {
            {"Aerodactyl", {"1", "16"}},
            {"Articuno", {"2"}},
        }},
        {"Team Rocket", {
            {"Dark Alakazam", {"1"}},
        }},
    };
}

// ============================================================
// Helpers
// ============================================================

void print_names(const char* title, const std::vector<const std::string*>& names)
{
    std::cout << title << " (" << names.size() << ")\n";
    for (const auto* name : names) {
        std::cout << "  " << *name << "\n";
    }
}

void print_usage(const char* program)
{
    std::cout << "Usage: " << program << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --strategy NAME, -s NAME  simple | recursive (default: recursive)\n";
    std::cout << "  --help, -h                Show this help\n";
}

// ============================================================
// Main
// ============================================================

int main(int argc, char* argv[])
{
    std::string strategy_name = "recursive";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--strategy" || arg == "-s") {
            if (i + 1 < argc) {
                strategy_name = argv[++i];
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    const Catalog first = first_provider();
    const Catalog second = second_provider();

    std::cout << "=== Set names ===\n";
    const auto parts = partition_keys(first, second);
    print_names("In both catalogs", parts.common);
    print_names("First provider only", parts.source_only);
    print_names("Second provider only", parts.target_only);

    try {
        const StrategyKind kind = parse_strategy_kind(strategy_name);
        std::cout << "\n=== Card differences (" << to_string(kind) << ") ===\n";

        for (const auto* set_name : parts.common) {
            const CardSet& before = first.at(*set_name);
            const CardSet& after = second.at(*set_name);

            with_strategy<CardSet>(kind, [&](auto scope) {
                using Scope = decltype(scope);
                const auto changeset = diff_with<Scope>(before, after);
                if (changeset.is_empty()) {
                    return;
                }
                std::cout << *set_name << " (" << changeset.size() << " changes)\n";
                print_changes(std::cout, changeset);
            });
        }
    } catch (const UnsupportedStrategy& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return 0;
}
