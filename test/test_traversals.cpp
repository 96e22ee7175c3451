// test_traversals.cpp - Tests for Elements, Properties, If and Recursive optics

#include <catch2/catch_all.hpp>
#include <optics_ext/composed.h>
#include <optics_ext/errors.h>
#include <optics_ext/lenses.h>
#include <optics_ext/mutable_value.h>
#include <optics_ext/record.h>
#include <optics_ext/traversals.h>
#include <optics_ext/value.h>

#include <array>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using namespace optics_ext;

namespace {

auto times_ten = [](const Value& v) { return Value{v.as<int32_t>() * 10}; };
auto is_even = [](const Value& v) { return v.as<int32_t>() % 2 == 0; };
auto not_missing = [](const Value& v) { return !v.is_null(); };

} // anonymous namespace

// ============================================================
// Elements
// ============================================================

TEST_CASE("elements optic maps every element", "[optics][traversal][elements]") {
    SECTION("Value vector") {
        auto v = Value::vector({1, 2, 3});
        REQUIRE(modify(times_ten, v, elements_optic()) == Value::vector({10, 20, 30}));
    }

    SECTION("Value map values") {
        auto m = Value::map({{"a", 1}, {"b", 2}});
        REQUIRE(modify(times_ten, m, elements_optic()) == Value::map({{"a", 10}, {"b", 20}}));
    }

    SECTION("record fields in order") {
        auto pair = RecordKind::make("Pair", {"first", "second"});
        REQUIRE(modify(times_ten, pair->make_record({1, 2}), elements_optic()) == pair->make_record({10, 20}));
    }

    SECTION("standard containers") {
        std::vector<int> v{1, 2, 3};
        REQUIRE(modify([](int x) { return x + 1; }, v, elements_optic()) == std::vector<int>{2, 3, 4});

        std::array<int, 2> a{4, 5};
        REQUIRE(modify([](int x) { return -x; }, a, elements_optic()) == std::array<int, 2>{-4, -5});

        std::map<std::string, int> m{{"a", 1}};
        REQUIRE(modify([](int x) { return x * 3; }, m, elements_optic()).at("a") == 3);
    }

    SECTION("MutableValue vector") {
        auto v = MutableValue::vector({1, 2});
        auto doubled = modify([](const MutableValue& x) { return MutableValue{x.as<int32_t>() * 2}; },
                              v, elements_optic());
        REQUIRE(doubled == MutableValue::vector({2, 4}));
        REQUIRE(v == MutableValue::vector({1, 2}));
    }

    SECTION("set replaces every element") {
        REQUIRE(set(Value::vector({1, 2, 3}), elements_optic(), 0) == Value::vector({0, 0, 0}));
    }

    SECTION("empty collection is unchanged") {
        REQUIRE(modify(times_ten, Value::vector({}), elements_optic()) == Value::vector({}));
    }

    SECTION("scalar has no elements") {
        REQUIRE_THROWS_AS(modify(times_ten, Value{1}, elements_optic()), std::invalid_argument);
    }
}

// ============================================================
// Properties
// ============================================================

TEST_CASE("properties optic maps every named field", "[optics][traversal][properties]") {
    auto ab = RecordKind::make("AB", {"a", "b"});

    SECTION("set replaces every field") {
        auto r = ab->make_record({1, 2});
        REQUIRE(set(r, properties_optic(), "x") == ab->make_record({"x", "x"}));
    }

    SECTION("map values") {
        auto m = Value::map({{"a", 1}, {"b", 2}});
        REQUIRE(modify(times_ten, m, properties_optic()) == Value::map({{"a", 10}, {"b", 20}}));
    }

    SECTION("objects with zero fields are unchanged") {
        auto empty = RecordKind::make("Empty", {});
        REQUIRE(set(empty->make_record({}), properties_optic(), 1) == empty->make_record({}));
        REQUIRE(set(Value{5}, properties_optic(), 1) == Value{5});
    }

    SECTION("invariant still applies") {
        auto positive = RecordKind::make("Positive", {"n"}, [](const RecordKind&, const ValueVector& f) {
            if (f[0].get().as_number() <= 0) throw std::invalid_argument("n must be positive");
        });
        REQUIRE_THROWS_AS(set(positive->make_record({1}), properties_optic(), -1), std::invalid_argument);
    }
}

// ============================================================
// If
// ============================================================

TEST_CASE("if optic applies f only when the predicate holds", "[optics][traversal][if]") {
    REQUIRE(modify(times_ten, Value{4}, if_optic(is_even)) == Value{40});
    REQUIRE(modify(times_ten, Value{3}, if_optic(is_even)) == Value{3});

    SECTION("only even elements are updated") {
        auto v = Value::vector({1, 2, 3, 4, 5, 6});
        auto evens = compose(if_optic(is_even), elements_optic());
        REQUIRE(modify(times_ten, v, evens) == Value::vector({1, 20, 3, 40, 5, 60}));
        REQUIRE(modify(times_ten, v, elements_optic() | if_optic(is_even)) == modify(times_ten, v, evens));
    }

    SECTION("standard containers") {
        std::vector<int> v{1, 2, 3, 4};
        auto odd = [](int x) { return x % 2 != 0; };
        REQUIRE(set(v, elements_optic() | if_optic(odd), 0) == std::vector<int>{0, 2, 0, 4});
    }
}

// ============================================================
// Recursive
// ============================================================

TEST_CASE("recursive optic descends while the predicate holds", "[optics][traversal][recursive]") {
    auto abc = RecordKind::make("ABC", {"a", "b", "c"});
    auto de = RecordKind::make("DE", {"d", "e"});
    auto obj = abc->make_record({Value{}, 1, de->make_record({Value{}, 2})});

    auto fill = recursive_optic(not_missing, properties_optic());

    REQUIRE(set(obj, fill, 100) == abc->make_record({100, 1, de->make_record({100, 2})}));

    SECTION("works over maps and through elements") {
        auto tree = Value::vector({
            Value::map({{"x", Value{}}}),
            Value::map({{"y", Value::map({{"z", Value{}}})}}),
        });
        auto filled = set(tree, recursive_optic(not_missing, elements_optic()), "n/a");
        REQUIRE(filled.at(0).at("x") == Value{"n/a"});
        REQUIRE(filled.at(1).at("y").at("z") == Value{"n/a"});
    }

    SECTION("accessors") {
        REQUIRE(fill.max_depth() == OPTICS_EXT_DEFAULT_MAX_RECURSION_DEPTH);
        REQUIRE(fill.with_max_depth(3).max_depth() == 3);
    }
}

TEST_CASE("recursive optic over statically typed containers", "[optics][traversal][recursive]") {
    auto not_int = [](const auto& x) { return !std::is_same_v<std::remove_cvref_t<decltype(x)>, int>; };
    auto all_ints = recursive_optic(not_int, elements_optic());
    auto times_hundred = [](int x) { return 100 * x; };

    SECTION("nested vectors") {
        std::vector<std::vector<int>> grid{{1, 2}, {3}};
        REQUIRE(modify(times_hundred, grid, all_ints) == std::vector<std::vector<int>>{{100, 200}, {300}});
        REQUIRE(set(grid, all_ints, 0) == std::vector<std::vector<int>>{{0, 0}, {0}});
    }

    SECTION("map of vectors") {
        std::map<std::string, std::vector<int>> m{{"a", {1}}, {"b", {2, 3}}};
        auto scaled = modify(times_hundred, m, all_ints);
        REQUIRE(scaled.at("a") == std::vector<int>{100});
        REQUIRE(scaled.at("b") == std::vector<int>{200, 300});
    }

    SECTION("parts f does not accept are kept") {
        std::vector<std::vector<int>> grid{{1}, {2}};
        auto never = [](const auto&) { return false; };
        REQUIRE(modify(times_hundred, grid, recursive_optic(never, elements_optic())) == grid);
    }
}

TEST_CASE("properties optic leaves objects without named fields alone", "[optics][traversal][properties]") {
    REQUIRE(set(7, properties_optic(), 1) == 7);
    REQUIRE(set(std::vector<int>{1, 2}, properties_optic(), 0) == std::vector<int>{1, 2});
}

TEST_CASE("recursive optic depth guard", "[optics][traversal][recursive][errors]") {
    auto nest = [](int depth) {
        Value v = Value::vector({Value{}});
        for (int i = 0; i < depth; ++i) {
            v = Value::vector({v});
        }
        return v;
    };
    auto fill = recursive_optic(not_missing, elements_optic());

    REQUIRE_NOTHROW(set(nest(5), fill.with_max_depth(10), 1));
    REQUIRE_THROWS_AS(set(nest(20), fill.with_max_depth(10), 1), recursion_depth_error);

    SECTION("error reports the limit") {
        try {
            (void)set(nest(20), fill.with_max_depth(10), 1);
            FAIL("expected recursion_depth_error");
        } catch (const recursion_depth_error& e) {
            REQUIRE(e.max_depth() == 10);
        }
    }

    SECTION("a descent predicate that always holds is stopped") {
        auto always = recursive_optic([](const Value&) { return true; }, identity_optic()).with_max_depth(50);
        REQUIRE_THROWS_AS(modify(times_ten, Value{1}, always), recursion_depth_error);
    }
}
