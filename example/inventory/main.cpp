// main.cpp
// Inventory Example - Diffing successive states of a lager store
//
// The store state holds immer containers. Every dispatch produces a new state
// that shares structure with the previous one, so diffing consecutive states
// only walks the parts an action touched.
//
// After each action the example prints what changed. At the end it builds an
// owned changeset of the first and last states and prints it after the store
// has gone out of scope.

#include <keydiff/keydiff.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <immer/map.hpp>
#include <immer/set.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

using namespace keydiff;

// ============================================================
// Application State and Actions
// ============================================================

using Stock = immer::map<std::string, int>;                   // item -> quantity
using Tags = immer::map<std::string, immer::set<std::string>>; // item -> tags

struct InventoryState
{
    Stock stock;
    Tags tags;
};

struct Receive
{
    std::string item;
    int quantity;
};

struct Ship
{
    std::string item;
    int quantity;
};

struct Discontinue
{
    std::string item;
};

struct Tag
{
    std::string item;
    std::string tag;
};

using Action = std::variant<Receive, Ship, Discontinue, Tag>;

// ============================================================
// Reducer
// ============================================================

InventoryState reducer(InventoryState state, Action action)
{
    return std::visit(
        [&](auto&& act) -> InventoryState {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, Receive>) {
                const int* current = state.stock.find(act.item);
                state.stock = state.stock.set(act.item, (current ? *current : 0) + act.quantity);
            } else if constexpr (std::is_same_v<T, Ship>) {
                const int* current = state.stock.find(act.item);
                if (current && *current >= act.quantity) {
                    state.stock = state.stock.set(act.item, *current - act.quantity);
                }
            } else if constexpr (std::is_same_v<T, Discontinue>) {
                state.stock = state.stock.erase(act.item);
                state.tags = state.tags.erase(act.item);
            } else if constexpr (std::is_same_v<T, Tag>) {
                state.tags = state.tags.update(act.item, [&](immer::set<std::string> tags) {
                    return tags.insert(act.tag);
                });
            }
            return state;
        },
        action);
}

InventoryState create_initial_state()
{
    InventoryState state;
    for (const char* item : {"bolt", "nut", "washer", "gear", "spring"}) {
        state.stock = state.stock.set(item, 100);
        state.tags = state.tags.set(item, immer::set<std::string>{}.insert("hardware"));
    }
    return state;
}

// ============================================================
// Reporting
// ============================================================

void report_step(const std::string& title, const InventoryState& before, const InventoryState& after)
{
    std::cout << "--- " << title << " ---\n";

    const auto stock_changes = diff_with(before.stock, after.stock);
    const auto tag_changes = diff_with(before.tags, after.tags);

    std::cout << " stock:\n";
    print_changes(std::cout, stock_changes, 2);
    std::cout << " tags:\n";
    print_changes(std::cout, tag_changes, 2);
}

// ============================================================
// Main Application
// ============================================================

int main()
{
    std::optional<OwnedChangeset<Stock>> overall;

    {
        auto store = lager::make_store<Action>(
            create_initial_state(),
            lager::with_manual_event_loop{},
            lager::with_reducer(reducer)
        );

        const InventoryState initial = store.get();

        const std::vector<std::pair<std::string, Action>> script{
            {"receive 50 gear", Receive{"gear", 50}},
            {"ship 30 bolt", Ship{"bolt", 30}},
            {"ship 500 nut (refused)", Ship{"nut", 500}},
            {"tag spring as fragile", Tag{"spring", "fragile"}},
            {"discontinue washer", Discontinue{"washer"}},
            {"receive 10 rivet", Receive{"rivet", 10}},
        };

        std::cout << "=== Inventory Example ===\n";
        for (const auto& [title, action] : script) {
            const InventoryState before = store.get();
            store.dispatch(action);
            report_step(title, before, store.get());
        }

        // Copies of immer maps are O(1); the result keeps them alive
        overall.emplace(diff_owned(initial.stock, store.get().stock));
    }

    std::cout << "\n=== Stock, first vs last state ===\n";
    print_changes(std::cout, overall->changeset());
    return 0;
}
