#pragma once

#include <cstdint>

#include "blitz/core/Types.hpp"

namespace blitz::core {

using TileId = std::uint64_t;

inline constexpr TileId kNoTile = 0;

struct Tile {
    TileId id = kNoTile;
    TileType type = TileType::Red;
    Cell pos{};
    // Set while an animation batch owns the tile; no structural operation may start on it.
    bool moving = false;
};

}  // namespace blitz::core
