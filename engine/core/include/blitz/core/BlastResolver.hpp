#pragma once

#include <deque>
#include <optional>
#include <random>
#include <unordered_set>
#include <vector>

#include "blitz/core/EngineConfig.hpp"
#include "blitz/core/Events.hpp"
#include "blitz/core/Grid.hpp"
#include "blitz/core/MatchDetector.hpp"

namespace blitz::core {

struct BlastResult {
    // Tiles removed by each processed unit, in removal order. Tiles replaced by
    // a power-up spawn form the final batch.
    std::vector<std::vector<Tile>> batches;
    std::vector<Tile> spawned;
    std::vector<EngineError> errors;
    int activations = 0;

    std::size_t removedCount() const noexcept;
    bool removed(TileId id) const noexcept;
};

// Cells a tile clears when it goes off: the full row or column for rockets,
// the cell, its orthogonal neighbours and 1 (2 when lucky) random occupied
// cells for snitches, the tile alone for colored tiles. Random picks never
// land on tiles listed in `skip`.
std::vector<Tile> BlastPath(const Grid& grid, const Tile& tile, std::mt19937& rng,
                            const std::unordered_set<TileId>& skip);
std::vector<Tile> BlastPath(const Grid& grid, const Tile& tile, std::mt19937& rng);

// Expands matches and power-up activations into removals and spawns. One
// resolver instance handles one blast episode at a time; resolve() drains the
// queue and resets it for the next episode.
class BlastResolver {
public:
    BlastResolver(Grid& grid, std::mt19937& rng, const EngineConfig& config);

    void enqueueMatch(const MatchData& match);
    bool enqueueActivation(const Cell& cell);

    bool empty() const noexcept { return queue_.empty(); }

    BlastResult resolve();

private:
    struct SpawnTarget {
        Cell cell{};
        TileType type = TileType::Snitch;
    };

    struct Unit {
        std::vector<Tile> tiles;
        // Power-up whose activation produced this unit; never re-triggered by it.
        TileId origin = kNoTile;
        std::optional<SpawnTarget> spawn;
        // Cell left in place for the spawn that replaces it.
        std::optional<Cell> keep;
    };

    void process(const Unit& unit, BlastResult& result);
    void addSpawn(const SpawnTarget& target);
    void performSpawns(BlastResult& result);

    Grid& grid_;
    std::mt19937& rng_;
    const EngineConfig& config_;
    std::deque<Unit> queue_;
    std::unordered_set<TileId> processed_;
    std::vector<SpawnTarget> spawns_;
    int activations_ = 0;
};

}  // namespace blitz::core
