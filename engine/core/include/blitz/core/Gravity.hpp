#pragma once

#include <map>
#include <random>
#include <vector>

#include "blitz/core/Grid.hpp"
#include "blitz/core/Tile.hpp"

namespace blitz::core {

struct FallOperation {
    Tile tile{};
    int x = 0;
    int from_y = 0;
    int to_y = 0;

    int fallDistance() const noexcept { return from_y - to_y; }
};

struct SpawnOperation {
    int x = 0;
    int y = 0;
    // 0 is the lowest empty cell of the column and fills first.
    int spawn_rank = 0;
};

// Stable per-column compaction toward y = 0.
std::vector<FallOperation> CalculateFalls(const Grid& grid);
void ApplyFalls(Grid& grid, const std::vector<FallOperation>& falls);

// Stagger hint for the animator: falls keyed by source row, lowest first.
std::map<int, std::vector<FallOperation>> GroupFallsBySourceRow(
    const std::vector<FallOperation>& falls);

std::vector<SpawnOperation> CalculateSpawns(const Grid& grid);

// Places one uniformly random colored tile per spawn. Returns the new tiles in
// spawn order; returns nothing when `colors` holds no colored type.
std::vector<Tile> ApplySpawns(Grid& grid, const std::vector<SpawnOperation>& spawns,
                              const std::vector<TileType>& colors, std::mt19937& rng);

}  // namespace blitz::core
