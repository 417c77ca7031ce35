#include <cassert>
#include <iostream>

#include "blitz/core/EngineConfig.hpp"
#include "blitz/core/Events.hpp"

using namespace blitz::core;

namespace {

void TestDefaults() {
    EngineConfig config;
    assert(config.IsValid());
    assert(config.width == 8 && config.height == 8);
    assert(config.colors.size() == 4);
    assert(config.max_cascade_depth == 50);
    assert(!config.seed.has_value());
    assert(config.HasPowerUp(TileType::SnitchLucky));
    assert(!config.HasPowerUp(TileType::Red));
}

void TestSerializeRoundTrip() {
    EngineConfig config;
    config.width = 10;
    config.height = 6;
    config.colors = {TileType::Red, TileType::Blue, TileType::Green};
    config.power_ups = {TileType::RocketVertical};
    config.max_cascade_depth = 12;
    config.seed = 31337u;

    auto restored = EngineConfig::Deserialize(config.Serialize());
    assert(restored.width == 10);
    assert(restored.height == 6);
    assert(restored.colors == config.colors);
    assert(restored.power_ups == config.power_ups);
    assert(restored.max_cascade_depth == 12);
    assert(restored.seed == config.seed);
}

void TestTolerantParsing() {
    auto json = Json::parse(R"({
        "width": "wide",
        "height": 5,
        "colors": ["red", "rocket_h", "purple", 3, "red", "yellow"],
        "power_ups": ["snitch", "blue"],
        "seed": -4
    })");
    auto config = EngineConfig::FromJson(json);
    assert(config.width == 8);
    assert(config.height == 5);
    assert((config.colors == std::vector<TileType>{TileType::Red, TileType::Yellow}));
    assert((config.power_ups == std::vector<TileType>{TileType::Snitch}));
    assert(!config.seed.has_value());
    assert(config.IsValid());
}

void TestOutOfRangeIntegersKeepDefaults() {
    auto json = Json::parse(R"({
        "width": 4294967304,
        "height": -9223372036854775807,
        "max_cascade_depth": 18446744073709551615,
        "seed": 4294967297
    })");
    auto config = EngineConfig::FromJson(json);
    assert(config.width == 8);
    assert(config.height == 8);
    assert(config.max_cascade_depth == 50);
    assert(!config.seed.has_value());

    auto edge = EngineConfig::FromJson(Json::parse(R"({"seed": 4294967295, "height": 12})"));
    assert(edge.seed == 4294967295u);
    assert(edge.height == 12);
}

void TestValidation() {
    EngineConfig config;
    config.colors.clear();
    assert(!config.IsValid());

    config = EngineConfig{};
    config.width = 1;
    assert(!config.IsValid());

    config = EngineConfig{};
    config.max_cascade_depth = -1;
    assert(!config.IsValid());

    config = EngineConfig{};
    config.colors.push_back(TileType::Snitch);
    assert(!config.IsValid());
}

void TestMalformedTextThrows() {
    bool threw = false;
    try {
        EngineConfig::Deserialize("{\"width\": ");
    } catch (const Json::parse_error&) {
        threw = true;
    }
    assert(threw);
}

void TestTileNames() {
    assert(ToString(TileType::RocketHorizontal) == "rocket_h");
    assert(TileTypeFromString("snitch_lucky") == TileType::SnitchLucky);
    assert(!TileTypeFromString("Red").has_value());
    assert(ToString(GameState::Cascading) == "Cascading");
    assert(ToString(ErrorCode::MissingAsset) == "MissingAsset");
    assert(ToString(ErrorCode::OutOfBounds) == "OutOfBounds");
}

}  // namespace

int main() {
    TestDefaults();
    TestSerializeRoundTrip();
    TestTolerantParsing();
    TestOutOfRangeIntegersKeepDefaults();
    TestValidation();
    TestMalformedTextThrows();
    TestTileNames();
    std::cout << "All config tests passed.\n";
    return 0;
}
