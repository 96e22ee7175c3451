// test_composition.cpp - Tests for compose, opcompose, operator| and Focused

#include <catch2/catch_all.hpp>
#include <optics_ext/composed.h>
#include <optics_ext/focused.h>
#include <optics_ext/lenses.h>
#include <optics_ext/optic_style.h>
#include <optics_ext/record.h>
#include <optics_ext/shape.h>
#include <optics_ext/traversals.h>
#include <optics_ext/value.h>

#include <type_traits>
#include <vector>

using namespace optics_ext;

namespace {

Value make_state() {
    return Value::map({
        {"users", Value::vector({
            Value::map({{"name", "Alice"}, {"age", 30}}),
            Value::map({{"name", "Bob"}, {"age", 25}}),
        })},
        {"version", 1},
    });
}

} // anonymous namespace

// ============================================================
// Composition laws
// ============================================================

TEST_CASE("get through a composite applies inner then outer", "[optics][compose]") {
    auto state = make_state();
    auto a = field_optic("name");
    auto b = index_optic(1);
    auto c = field_optic("users");

    SECTION("two optics") {
        auto ab = compose(a, b);
        auto users = get(state, c);
        REQUIRE(get(users, ab) == get(get(users, b), a));
        REQUIRE(get(users, ab) == Value{"Bob"});
    }

    SECTION("compose associates left") {
        auto abc = compose(a, b, c);
        REQUIRE(get(state, abc) == Value{"Bob"});
        REQUIRE(get(state, abc) == get(state, compose(compose(a, b), c)));
    }
}

TEST_CASE("set through a composite rebuilds every level", "[optics][compose]") {
    auto state = make_state();
    auto bob_age = compose(field_optic("age"), index_optic(1), field_optic("users"));

    auto updated = set(state, bob_age, 26);
    REQUIRE(get(updated, bob_age) == Value{26});
    REQUIRE(updated.at("users").at(0) == state.at("users").at(0));
    REQUIRE(get(state, bob_age) == Value{25});
    REQUIRE(set(updated, bob_age, 25) == state);
}

TEST_CASE("identity is neutral for compose", "[optics][compose][identity]") {
    auto a = field_optic("version");
    auto state = make_state();

    STATIC_REQUIRE(std::is_same_v<decltype(compose(identity_optic(), a)), FieldOptic>);
    STATIC_REQUIRE(std::is_same_v<decltype(compose(a, identity_optic())), FieldOptic>);
    STATIC_REQUIRE(std::is_same_v<decltype(compose()), IdentityOptic>);

    REQUIRE(get(state, compose(identity_optic(), a)) == get(state, a));
    REQUIRE(set(state, compose(a, identity_optic()), 2) == set(state, a, 2));
    REQUIRE(get(state, compose()) == state);
}

// ============================================================
// Application order
// ============================================================

TEST_CASE("opcompose and operator| take optics in application order", "[optics][compose][pipe]") {
    auto state = make_state();
    auto users = field_optic("users");
    auto first = index_optic(0);
    auto name = field_optic("name");

    auto piped = users | first | name;
    auto ordered = opcompose(users, first, name);
    auto nested = compose(name, first, users);

    REQUIRE(get(state, piped) == Value{"Alice"});
    REQUIRE(get(state, ordered) == get(state, nested));
    REQUIRE(set(state, piped, "Ann") == set(state, nested, "Ann"));

    SECTION("opcompose(a, b) == compose(b, a)") {
        REQUIRE(get(state, opcompose(users, first)) == get(state, compose(first, users)));
    }

    SECTION("single and empty opcompose") {
        REQUIRE(get(state, opcompose(users)) == get(state, users));
        STATIC_REQUIRE(std::is_same_v<decltype(opcompose()), IdentityOptic>);
    }
}

// ============================================================
// Style of composites
// ============================================================

TEST_CASE("composite style is ModifyBased if either side is", "[optics][style]") {
    using Field = FieldOptic;
    using Index = IndexOptic<int>;

    STATIC_REQUIRE(std::is_same_v<optic_style_t<Field>, SetBased>);
    STATIC_REQUIRE(std::is_same_v<optic_style_t<Elements>, ModifyBased>);
    STATIC_REQUIRE(std::is_same_v<optic_style_t<ComposedOptic<Field, Index>>, SetBased>);
    STATIC_REQUIRE(std::is_same_v<optic_style_t<ComposedOptic<Field, Elements>>, ModifyBased>);
    STATIC_REQUIRE(std::is_same_v<optic_style_t<ComposedOptic<Elements, Field>>, ModifyBased>);
    STATIC_REQUIRE(std::is_same_v<optic_style_t<decltype(elements_optic() | field_optic("a"))>, ModifyBased>);
}

TEST_CASE("a modify-based composite updates every focus", "[optics][compose][traversal]") {
    auto state = make_state();
    auto ages = field_optic("users") | elements_optic() | field_optic("age");

    auto older = modify([](const Value& a) { return Value{a.as<int32_t>() + 1}; }, state, ages);
    REQUIRE(older.at("users").at(0).at("age") == Value{31});
    REQUIRE(older.at("users").at(1).at("age") == Value{26});

    auto zeroed = set(state, ages, 0);
    REQUIRE(zeroed.at("users").at(0).at("age") == Value{0});
    REQUIRE(zeroed.at("users").at(1).at("age") == Value{0});
}

TEST_CASE("composite shapes name both sides", "[optics][compose][shape]") {
    auto optic = field_optic("users") | index_optic(0);
    REQUIRE(shape_of(optic) == "compose(index(0), field(\"users\"))");
}

// ============================================================
// Focused
// ============================================================

TEST_CASE("Focused pairs an object with an optic", "[optics][focused]") {
    auto state = make_state();
    auto alice = focus(state, field_optic("users") | index_optic(0));

    REQUIRE(alice.get().at("name") == Value{"Alice"});

    SECTION("zoom refocuses") {
        auto name = alice / field_optic("name");
        REQUIRE(name.get() == Value{"Alice"});

        auto renamed = name.set("Ann");
        REQUIRE(renamed.get() == Value{"Ann"});
        REQUIRE(renamed.object().at("users").at(0).at("name") == Value{"Ann"});
        REQUIRE(name.get() == Value{"Alice"});
    }

    SECTION("modify returns a new Focused") {
        auto age = alice.zoom(field_optic("age"));
        auto older = age.modify([](const Value& a) { return Value{a.as<int32_t>() + 10}; });
        REQUIRE(older.get() == Value{40});
        REQUIRE(state.at("users").at(0).at("age") == Value{30});
    }
}
