#pragma once

#include <vector>

#include "blitz/core/Grid.hpp"
#include "blitz/core/Tile.hpp"
#include "blitz/core/Types.hpp"

namespace blitz::core {

struct MatchData {
    // Snapshots of the matched tiles, unique, in scan order.
    std::vector<Tile> tiles;
    MatchOrientation orientation = MatchOrientation::Horizontal;
    // Cell that receives a spawned power-up.
    Cell pivot{};

    int count() const noexcept { return static_cast<int>(tiles.size()); }

    bool isSnitchMatch() const noexcept { return orientation == MatchOrientation::Square; }

    bool isPowerUpMatch() const noexcept {
        return !isSnitchMatch() && count() >= kPowerUpMatchLength;
    }

    bool contains(TileId id) const noexcept;
};

bool HasMatchAt(const Grid& grid, const Cell& cell);

// Full-board scan. Squares first, then linear runs; pivots are the square's
// bottom-left corner or the run's middle tile.
std::vector<MatchData> FindAllMatches(const Grid& grid);

// Scan seeded by the given cells (typically the two cells of a swap); pivots
// are the seed cell that produced the match.
std::vector<MatchData> FindMatchesAt(const Grid& grid, const std::vector<Cell>& seeds);

}  // namespace blitz::core
