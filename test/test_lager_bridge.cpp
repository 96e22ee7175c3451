// test_lager_bridge.cpp - Tests for optics used as lager lenses and back

#include <catch2/catch_all.hpp>
#include <optics_ext/composed.h>
#include <optics_ext/lager_bridge.h>
#include <optics_ext/lenses.h>
#include <optics_ext/value.h>

#include <lager/lenses.hpp>

using namespace optics_ext;

namespace {

Value make_config() {
    return Value::map({
        {"window", Value::map({{"width", 800}, {"height", 600}})},
        {"title", "editor"},
    });
}

} // anonymous namespace

TEST_CASE("optics work with lager::view / set / over", "[lager][bridge]") {
    auto config = make_config();
    auto width = to_lager_lens(field_optic("window") | field_optic("width"));

    REQUIRE(lager::view(width, config) == Value{800});

    auto wider = lager::set(width, config, Value{1024});
    REQUIRE(wider.at("window").at("width") == Value{1024});
    REQUIRE(config.at("window").at("width") == Value{800});

    auto doubled = lager::over(width, config, [](Value w) { return Value{w.as<int32_t>() * 2}; });
    REQUIRE(doubled.at("window").at("width") == Value{1600});
}

TEST_CASE("bridged lenses pipe with zug composition", "[lager][bridge][compose]") {
    auto config = make_config();
    auto window = to_lager_lens(field_optic("window"));
    auto height = to_lager_lens(field_optic("height"));

    auto window_height = window | height;
    REQUIRE(lager::view(window_height, config) == Value{600});
    REQUIRE(lager::set(window_height, config, Value{720}).at("window").at("height") == Value{720});
}

TEST_CASE("type-erased lager lens round trip", "[lager][bridge][erased]") {
    auto config = make_config();
    LagerValueLens title = to_lager_lens(field_optic("title"));

    REQUIRE(lager::view(title, config) == Value{"editor"});

    auto optic = from_lager_lens(title, "title_lens");
    REQUIRE(optic.shape() == "title_lens");
    REQUIRE(get(config, optic) == Value{"editor"});
    REQUIRE(set(config, optic, "viewer").at("title") == Value{"viewer"});
    REQUIRE(modify([](const Value& t) { return Value{t.as_string() + "!"}; }, config, optic).at("title") ==
            Value{"editor!"});
}
