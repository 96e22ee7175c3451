// test_value.cpp - Tests for Value construction, records, and reconstruction helpers
// Module 1: Immutable dynamic object model

#include <catch2/catch_all.hpp>
#include <optics_ext/record.h>
#include <optics_ext/value.h>

#include <stdexcept>

using namespace optics_ext;

// ============================================================
// Construction Tests
// ============================================================

TEST_CASE("Value default construction", "[value][construction]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE(value_type_name(v) == "null");
}

TEST_CASE("Value primitive construction", "[value][construction]") {
    SECTION("bool") {
        Value v{true};
        REQUIRE(v.is<bool>());
        REQUIRE(v.as<bool>());
    }

    SECTION("int32_t") {
        Value v{42};
        REQUIRE(v.is<int32_t>());
        REQUIRE(v.as<int32_t>() == 42);
    }

    SECTION("int64_t") {
        Value v{int64_t{9999999999}};
        REQUIRE(v.is<int64_t>());
        REQUIRE(v.as_int64() == 9999999999);
    }

    SECTION("double") {
        Value v{2.5};
        REQUIRE(v.as_number() == Catch::Approx(2.5));
    }

    SECTION("string") {
        Value v{"hello"};
        REQUIRE(v.is_string());
        REQUIRE(v.as_string() == "hello");
    }

    SECTION("wrong alternative throws") {
        Value v{42};
        REQUIRE_THROWS_AS(v.as<std::string>(), std::bad_variant_access);
    }
}

TEST_CASE("Value containers", "[value][container]") {
    auto v = Value::map({
        {"name", "Alice"},
        {"scores", Value::vector({1, 2, 3})},
    });

    REQUIRE(v.is_map());
    REQUIRE(v.size() == 2);
    REQUIRE(v.contains("name"));
    REQUIRE_FALSE(v.contains("age"));
    REQUIRE(v.at("scores").at(1) == Value{2});

    SECTION("lenient access returns null") {
        REQUIRE(v.at("missing").is_null());
        REQUIRE(v.at("scores").at(10).is_null());
        REQUIRE(v.at_or("missing", Value{7}) == Value{7});
    }

    SECTION("updates leave the original untouched") {
        auto v2 = v.set("name", Value{"Bob"});
        REQUIRE(v.at("name") == Value{"Alice"});
        REQUIRE(v2.at("name") == Value{"Bob"});

        auto v3 = v.at("scores").push_back(Value{4});
        REQUIRE(v3.size() == 4);
        REQUIRE(v.at("scores").size() == 3);
    }
}

TEST_CASE("Value printing", "[value][print]") {
    auto v = Value::map({{"a", Value::vector({1, int64_t{2}})}});
    REQUIRE(value_to_string(v) == "{a: [1, 2L]}");
    REQUIRE(value_to_string(Value{"s"}) == "\"s\"");
}

// ============================================================
// RecordKind Tests
// ============================================================

TEST_CASE("RecordKind construction", "[value][record]") {
    auto point = RecordKind::make("Point", {"x", "y"});

    REQUIRE(point->name() == "Point");
    REQUIRE(point->arity() == 2);
    REQUIRE(point->field_index("y") == std::size_t{1});
    REQUIRE_FALSE(point->has_field("z"));

    auto p = point->make_record({1, 2});
    REQUIRE(p.is_record());
    REQUIRE(value_type_name(p) == "Point");
    REQUIRE(p.at("x") == Value{1});
    REQUIRE(value_to_string(p) == "Point(x=1, y=2)");

    SECTION("duplicate field names are rejected") {
        REQUIRE_THROWS_AS(RecordKind::make("Bad", {"a", "a"}), std::invalid_argument);
    }

    SECTION("arity mismatch is a data error") {
        REQUIRE_THROWS_AS(point->make_record({1}), std::invalid_argument);
    }
}

TEST_CASE("RecordKind invariant runs on every construction", "[value][record]") {
    auto range = RecordKind::make("Range", {"lo", "hi"}, [](const RecordKind&, const ValueVector& fields) {
        if (fields[0].get().as_number() > fields[1].get().as_number()) {
            throw std::invalid_argument("Range: lo > hi");
        }
    });

    auto r = range->make_record({1, 5});
    REQUIRE_THROWS_AS(range->make_record({5, 1}), std::invalid_argument);
    REQUIRE_THROWS_AS(set_properties(r, {{"lo", Value{10}}}), std::invalid_argument);
    REQUIRE(set_properties(r, {{"lo", Value{3}}}).at("lo") == Value{3});

    SECTION("Value::set on a record field") {
        REQUIRE_THROWS_AS(r.set("lo", Value{10}), std::invalid_argument);
        REQUIRE(r.set("lo", Value{3}) == range->make_record({3, 5}));
    }
}

TEST_CASE("Records compare by kind and fields", "[value][record]") {
    auto a = RecordKind::make("P", {"x"});
    auto b = RecordKind::make("P", {"x"});
    auto c = RecordKind::make("Q", {"x"});

    REQUIRE(a->make_record({1}) == b->make_record({1}));
    REQUIRE_FALSE(a->make_record({1}) == c->make_record({1}));
    REQUIRE_FALSE(a->make_record({1}) == a->make_record({2}));
}

// ============================================================
// Reconstruction Helper Tests
// ============================================================

TEST_CASE("set_properties", "[value][reconstruction]") {
    auto point = RecordKind::make("Point", {"x", "y"});
    auto p = point->make_record({1, 2});

    SECTION("replaces named fields, keeping kind and order") {
        auto q = set_properties(p, {{"y", Value{20}}, {"x", Value{10}}});
        REQUIRE(q == point->make_record({10, 20}));
        REQUIRE(property_names(q) == std::vector<std::string>{"x", "y"});
    }

    SECTION("unknown field is a definition error") {
        REQUIRE_THROWS_AS(set_properties(p, {{"z", Value{0}}}), definition_error);
    }

    SECTION("maps treat their keys as fields") {
        auto m = Value::map({{"a", 1}});
        REQUIRE(set_properties(m, {{"a", Value{2}}}).at("a") == Value{2});
        REQUIRE_THROWS_AS(set_properties(m, {{"b", Value{2}}}), definition_error);
    }

    SECTION("empty patch on a scalar is a no-op") {
        REQUIRE(set_properties(Value{5}, {}) == Value{5});
    }
}

TEST_CASE("map_properties", "[value][reconstruction]") {
    auto point = RecordKind::make("Point", {"x", "y"});
    auto twice = [](const Value& v) { return Value{v.as<int32_t>() * 2}; };

    REQUIRE(map_properties(twice, point->make_record({1, 2})) == point->make_record({2, 4}));
    REQUIRE(map_properties(twice, Value::map({{"a", 3}})) == Value::map({{"a", 6}}));

    SECTION("objects without named fields come back unchanged") {
        REQUIRE(map_properties(twice, Value::vector({1, 2})) == Value::vector({1, 2}));
        REQUIRE(map_properties(twice, Value{7}) == Value{7});
    }
}
