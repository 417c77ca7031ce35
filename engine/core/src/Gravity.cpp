#include "blitz/core/Gravity.hpp"

namespace blitz::core {

std::vector<FallOperation> CalculateFalls(const Grid& grid) {
    std::vector<FallOperation> falls;
    for (int x = 0; x < grid.width(); ++x) {
        int empty_count = 0;
        for (int y = 0; y < grid.height(); ++y) {
            const Tile* tile = grid.get(x, y);
            if (tile == nullptr) {
                ++empty_count;
                continue;
            }
            if (empty_count > 0) {
                FallOperation fall;
                fall.tile = *tile;
                fall.x = x;
                fall.from_y = y;
                fall.to_y = y - empty_count;
                falls.push_back(fall);
            }
        }
    }
    return falls;
}

void ApplyFalls(Grid& grid, const std::vector<FallOperation>& falls) {
    // Falls within a column are ordered bottom-up, so every target is already vacated.
    for (const auto& fall : falls) {
        grid.move(Cell{fall.x, fall.from_y}, Cell{fall.x, fall.to_y});
    }
}

std::map<int, std::vector<FallOperation>> GroupFallsBySourceRow(
    const std::vector<FallOperation>& falls) {
    std::map<int, std::vector<FallOperation>> groups;
    for (const auto& fall : falls) {
        groups[fall.from_y].push_back(fall);
    }
    return groups;
}

std::vector<SpawnOperation> CalculateSpawns(const Grid& grid) {
    std::vector<SpawnOperation> spawns;
    for (int x = 0; x < grid.width(); ++x) {
        int rank = 0;
        for (int y = 0; y < grid.height(); ++y) {
            if (grid.get(x, y) == nullptr) {
                spawns.push_back(SpawnOperation{x, y, rank});
                ++rank;
            }
        }
    }
    return spawns;
}

std::vector<Tile> ApplySpawns(Grid& grid, const std::vector<SpawnOperation>& spawns,
                              const std::vector<TileType>& colors, std::mt19937& rng) {
    std::vector<Tile> spawned;
    std::vector<TileType> palette;
    for (auto type : colors) {
        if (IsColored(type)) {
            palette.push_back(type);
        }
    }
    if (palette.empty()) {
        return spawned;
    }
    spawned.reserve(spawns.size());
    std::uniform_int_distribution<std::size_t> dist(0, palette.size() - 1);
    for (const auto& spawn : spawns) {
        const Cell cell{spawn.x, spawn.y};
        if (grid.get(cell) != nullptr) {
            continue;
        }
        spawned.push_back(grid.place(cell, palette[dist(rng)]));
    }
    return spawned;
}

}  // namespace blitz::core
