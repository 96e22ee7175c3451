// main.cpp - Optics demo: a lager store whose actions carry optics

#include <optics_ext/optics_ext.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

using namespace optics_ext;

// ============================================================
// Application State and Actions
// ============================================================

/// Replace the focus of `where` with `value`.
struct SetAt
{
    ErasedOptic where;
    Value value;
};

/// Append "!" to every string the optic focuses on.
struct Emphasize
{
    ErasedOptic where;
};

struct Undo {};

using Action = std::variant<SetAt, Emphasize, Undo>;

struct AppState
{
    Value data;
    immer::vector<Value> history;
};

AppState create_initial_state()
{
    auto task = RecordKind::make("Task", {"title", "done"});

    auto root = Value::map({
        {"owner", "chenmou"},
        {"tasks", Value::vector({
            task->make_record({"write docs", false}),
            task->make_record({"fix bug", true}),
        })},
    });
    return AppState{root, {}};
}

// ============================================================
// Reducer
// ============================================================

AppState reducer(AppState state, Action action)
{
    return std::visit(
        [&](auto&& act) -> AppState {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, Undo>) {
                if (state.history.empty())
                    return state;
                auto previous = state.history.back();
                state.history = state.history.take(state.history.size() - 1);
                state.data = previous;
                return state;
            } else {
                try {
                    Value updated;
                    if constexpr (std::is_same_v<T, SetAt>) {
                        updated = set(state.data, act.where, act.value);
                    } else {
                        updated = modify([](const Value& s) { return Value{s.as_string() + "!"}; },
                                         state.data, act.where);
                    }
                    state.history = state.history.push_back(state.data);
                    state.data = std::move(updated);
                } catch (const definition_error& e) {
                    std::cerr << "[reducer] rejected: " << e.what() << "\n";
                } catch (const std::out_of_range& e) {
                    std::cerr << "[reducer] rejected: " << e.what() << "\n";
                }
                return state;
            }
        },
        action);
}

// ============================================================
// Main Application
// ============================================================

int main()
{
    auto loop  = lager::with_manual_event_loop{};
    auto store = lager::make_store<Action>(create_initial_state(), loop, lager::with_reducer(reducer));

    auto show = [&](const char* label) {
        std::cout << label << ": " << store.get().data << "\n";
    };

    auto tasks = ErasedOptic::erase(field_optic("tasks"));
    auto first_title = tasks | ErasedOptic::erase(index_optic(0) | field_optic("title"));
    auto all_titles = tasks | ErasedOptic::erase(elements_optic() | field_optic("title"));

    show("initial");

    store.dispatch(SetAt{first_title, Value{"write better docs"}});
    show("set first title");

    store.dispatch(Emphasize{all_titles});
    show("emphasize all titles");

    store.dispatch(SetAt{tasks | ErasedOptic::erase(index_optic(5)), Value{"nope"}});
    store.dispatch(SetAt{ErasedOptic::erase(field_optic("missing")), Value{1}});
    show("after rejected actions");

    store.dispatch(Undo{});
    show("undo");

    // Same optics, other objects
    auto done = field_optic("tasks") | elements_optic() | if_optic([](const Value& t) {
                    return t.at("done").get_or<bool>(false);
                }) | field_optic("title");
    std::cout << "done titles cleared: " << set(store.get().data, done, "") << "\n";

    auto lens = to_lager_lens(field_optic("owner"));
    std::cout << "owner via lager::view: " << lager::view(lens, store.get().data) << "\n";

    return 0;
}
