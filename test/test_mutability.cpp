// test_mutability.cpp - Tests for the Mutable / Immutable update modes

#include <catch2/catch_all.hpp>
#include <optics_ext/composed.h>
#include <optics_ext/errors.h>
#include <optics_ext/lenses.h>
#include <optics_ext/mutable_value.h>
#include <optics_ext/optics.h>
#include <optics_ext/record.h>
#include <optics_ext/traversals.h>
#include <optics_ext/value.h>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace optics_ext;

namespace {

/// Set-based optic on the first element with no reference access; rejects
/// negative values.
struct CheckedFront : OpticBase {
    int operator()(const std::vector<int>& v) const { return v.at(0); }

    std::vector<int> set(std::vector<int> v, int x) const {
        if (x < 0) throw std::invalid_argument("CheckedFront: negative value");
        v.at(0) = x;
        return v;
    }
};

RecordKindPtr make_positive() {
    return RecordKind::make("Positive", {"n"}, [](const RecordKind&, const ValueVector& f) {
        if (f[0].get().as_number() <= 0) throw std::invalid_argument("Positive: n must be positive");
    });
}

} // anonymous namespace

// ============================================================
// In-place capable objects
// ============================================================

TEST_CASE("mutable mode writes MutableValue in place", "[optics][mutable]") {
    auto root = MutableValue::map({
        {"user", MutableValue::map({{"name", "John"}, {"age", 40}})},
        {"settings", MutableValue::map({{"theme", "dark"}})},
    });

    auto* user_before = root.get("user");
    auto* settings_before = root.get("settings");
    auto* age_before = root.get("user")->get("age");

    auto& result = set(root, field_optic("user") | field_optic("name"), "Jane", mutable_mode);

    REQUIRE(&result == &root);
    REQUIRE(root.get("user")->get("name")->as_string() == "Jane");

    SECTION("untouched parts keep their addresses") {
        REQUIRE(root.get("user") == user_before);
        REQUIRE(root.get("settings") == settings_before);
        REQUIRE(root.get("user")->get("age") == age_before);
    }
}

TEST_CASE("mutable mode on MutableValue records and vectors", "[optics][mutable]") {
    auto point = RecordKind::make("Point", {"x", "y"});
    auto root = MutableValue::vector({MutableValue::record(point, {1, 2}), MutableValue::record(point, {3, 4})});
    auto* second = root.get(std::size_t{1});

    set(root, index_optic(1) | field_optic("y"), 40, mutable_mode);

    REQUIRE(root.get(std::size_t{1}) == second);
    REQUIRE(root.get(std::size_t{1})->get("y")->as<int32_t>() == 40);
    REQUIRE(root.get(std::size_t{0})->get("y")->as<int32_t>() == 2);
}

TEST_CASE("mutable mode on standard containers", "[optics][mutable]") {
    SECTION("vector element") {
        std::vector<int> v{1, 2, 3};
        const int* data = v.data();
        set(v, index_optic(1), 20, mutable_mode);
        REQUIRE(v == std::vector<int>{1, 20, 3});
        REQUIRE(v.data() == data);
    }

    SECTION("nested map of vectors") {
        std::map<std::string, std::vector<int>> m{{"a", {1, 2}}, {"b", {3}}};
        const int* a_data = m["a"].data();
        set(m, index_optic("a") | index_optic(1), 99, mutable_mode);
        REQUIRE(m["a"] == std::vector<int>{1, 99});
        REQUIRE(m["a"].data() == a_data);
    }

    SECTION("stage without reference access is rebound") {
        std::vector<Value> v{Value::map({{"x", 1}}), Value::map({{"x", 2}})};
        const Value* data = v.data();
        set(v, index_optic(0) | field_optic("x"), 10, mutable_mode);
        REQUIRE(v[0].at("x") == Value{10});
        REQUIRE(v[1].at("x") == Value{2});
        REQUIRE(v.data() == data);
    }

    SECTION("traversals rebind the focused object") {
        std::vector<int> v{1, 2, 3};
        set(v, elements_optic(), 0, mutable_mode);
        REQUIRE(v == std::vector<int>{0, 0, 0});
    }
}

// ============================================================
// Immutable objects
// ============================================================

TEST_CASE("mutable mode on Value leaves other copies untouched", "[optics][mutable][value]") {
    auto original = Value::map({{"a", Value::map({{"b", 1}})}});
    auto alias = original;

    set(original, field_optic("a") | field_optic("b"), 2, mutable_mode);

    REQUIRE(original.at("a").at("b") == Value{2});
    REQUIRE(alias.at("a").at("b") == Value{1});
}

TEST_CASE("immutable mode is the default", "[optics][immutable]") {
    auto v = MutableValue::map({{"n", 1}});
    auto optic = field_optic("n");

    auto updated = set(v, optic, 2, immutable_mode);
    REQUIRE(updated == set(v, optic, 2));
    REQUIRE(v.get("n")->as<int32_t>() == 1);
    REQUIRE(updated.get("n")->as<int32_t>() == 2);
}

// ============================================================
// Failed updates
// ============================================================

TEST_CASE("a failed mutable set leaves the object unchanged", "[optics][mutable][errors]") {
    SECTION("rebound stage that throws") {
        std::vector<int> flat{1, 2};
        REQUIRE_THROWS_AS(set(flat, CheckedFront{}, -1, mutable_mode), std::invalid_argument);
        REQUIRE(flat == std::vector<int>{1, 2});

        set(flat, CheckedFront{}, 7, mutable_mode);
        REQUIRE(flat == std::vector<int>{7, 2});
    }

    SECTION("rebound stage below an in-place stage") {
        std::vector<std::vector<int>> grid{{1, 2, 3}, {4}};
        REQUIRE_THROWS_AS(set(grid, index_optic(0) | CheckedFront{}, -1, mutable_mode), std::invalid_argument);
        REQUIRE(grid[0] == std::vector<int>{1, 2, 3});
    }

    SECTION("missing field inside a Value") {
        auto v = Value::map({{"a", Value::map({{"b", 1}})}});
        REQUIRE_THROWS_AS(set(v, field_optic("a") | field_optic("missing"), 1, mutable_mode), definition_error);
        REQUIRE(v == Value::map({{"a", Value::map({{"b", 1}})}}));
    }

    SECTION("missing field below a vector element") {
        std::vector<Value> v{Value::map({{"x", 1}})};
        REQUIRE_THROWS_AS(set(v, index_optic(0) | field_optic("missing"), 1, mutable_mode), definition_error);
        REQUIRE(v.size() == 1);
        REQUIRE(v[0] == Value::map({{"x", 1}}));
    }
}

TEST_CASE("mutable mode inserts only at the last stage", "[optics][mutable][index]") {
    SECTION("MutableValue map") {
        auto m = MutableValue::map({{"a", 1}});
        REQUIRE_THROWS_AS(set(m, index_optic("b") | field_optic("x"), 1, mutable_mode), std::out_of_range);
        REQUIRE_FALSE(m.contains("b"));

        set(m, index_optic("b"), 2, mutable_mode);
        REQUIRE(m.get("b")->as<int32_t>() == 2);
    }

    SECTION("std::map") {
        std::map<std::string, std::vector<int>> m{{"a", {1}}};
        REQUIRE_THROWS_AS(set(m, index_optic("z") | index_optic(0), 5, mutable_mode), std::out_of_range);
        REQUIRE(m.size() == 1);

        set(m, index_optic("z"), std::vector<int>{5}, mutable_mode);
        REQUIRE(m.at("z") == std::vector<int>{5});
    }
}

// ============================================================
// Record invariants
// ============================================================

TEST_CASE("mutable mode checks record invariants", "[optics][mutable][record]") {
    auto positive = make_positive();
    auto rec = MutableValue::record(positive, {1});

    REQUIRE_THROWS_AS(set(rec, field_optic("n"), -1, mutable_mode), std::invalid_argument);
    REQUIRE(rec.get("n")->as<int32_t>() == 1);
    REQUIRE_THROWS_AS(set(rec, field_optic("n"), -1), std::invalid_argument);

    set(rec, field_optic("n"), 5, mutable_mode);
    REQUIRE(rec.get("n")->as<int32_t>() == 5);

    SECTION("nested under in-place containers") {
        auto root = MutableValue::vector({MutableValue::record(positive, {1}), MutableValue::record(positive, {2})});
        auto* first = root.get(std::size_t{0});

        REQUIRE_THROWS_AS(set(root, index_optic(0) | field_optic("n"), 0, mutable_mode), std::invalid_argument);
        REQUIRE(root.get(std::size_t{0})->get("n")->as<int32_t>() == 1);

        set(root, index_optic(0) | field_optic("n"), 3, mutable_mode);
        REQUIRE(root.get(std::size_t{0}) == first);
        REQUIRE(first->get("n")->as<int32_t>() == 3);
    }

    SECTION("records without an invariant are still written in place") {
        auto point = RecordKind::make("Point", {"x", "y"});
        auto p = MutableValue::record(point, {1, 2});
        auto* x_before = p.get("x");
        set(p, field_optic("x"), 10, mutable_mode);
        REQUIRE(p.get("x") == x_before);
        REQUIRE(p.get("x")->as<int32_t>() == 10);
    }

    SECTION("MutableValue::set goes through the kind") {
        REQUIRE_THROWS_AS(rec.set("n", -3), std::invalid_argument);
        REQUIRE(rec.get("n")->as<int32_t>() == 5);
    }
}
