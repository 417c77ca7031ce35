#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "blitz/core/Json.hpp"
#include "blitz/core/Types.hpp"

namespace blitz::core {

struct EngineConfig {
    int width = 8;
    int height = 8;
    std::vector<TileType> colors{TileType::Red, TileType::Yellow, TileType::Green, TileType::Blue};
    // Power-up types the host can spawn. Spawning anything else is a MissingAsset error.
    std::vector<TileType> power_ups{TileType::RocketHorizontal, TileType::RocketVertical,
                                    TileType::Snitch, TileType::SnitchLucky};
    int max_cascade_depth = 50;
    std::optional<std::uint32_t> seed;

    bool IsValid() const noexcept;
    bool HasPowerUp(TileType type) const noexcept;

    Json ToJson() const;
    static EngineConfig FromJson(const Json& json);

    std::string Serialize() const;
    static EngineConfig Deserialize(const std::string& json_string);
};

}  // namespace blitz::core
