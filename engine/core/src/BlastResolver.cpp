#include "blitz/core/BlastResolver.hpp"

#include <algorithm>
#include <string>

namespace blitz::core {

namespace {

void CollectLine(const Grid& grid, const Cell& origin, int dx, int dy, std::vector<Tile>& out) {
    const int length = dx != 0 ? grid.width() : grid.height();
    for (int i = 0; i < length; ++i) {
        const Cell cell{dx != 0 ? i : origin.x, dy != 0 ? i : origin.y};
        if (const Tile* tile = grid.get(cell)) {
            out.push_back(*tile);
        }
    }
}

void CollectSnitchArea(const Grid& grid, const Tile& snitch, std::mt19937& rng,
                       const std::unordered_set<TileId>& skip, std::vector<Tile>& out) {
    std::unordered_set<Cell, CellHash> selected;
    auto take = [&](const Cell& cell) {
        const Tile* tile = grid.get(cell);
        if (tile != nullptr && selected.insert(cell).second) {
            out.push_back(*tile);
        }
    };

    take(snitch.pos);
    constexpr int offsets[4][2] = {{0, 1}, {0, -1}, {-1, 0}, {1, 0}};
    for (const auto& off : offsets) {
        take(Cell{snitch.pos.x + off[0], snitch.pos.y + off[1]});
    }

    std::vector<Cell> available;
    for (int x = 0; x < grid.width(); ++x) {
        for (int y = 0; y < grid.height(); ++y) {
            const Tile* tile = grid.get(x, y);
            if (tile != nullptr && selected.count(tile->pos) == 0 && skip.count(tile->id) == 0) {
                available.push_back(tile->pos);
            }
        }
    }

    const int random_cells = snitch.type == TileType::SnitchLucky ? 2 : 1;
    for (int i = 0; i < random_cells && !available.empty(); ++i) {
        std::uniform_int_distribution<std::size_t> dist(0, available.size() - 1);
        const auto pick = dist(rng);
        take(available[pick]);
        available.erase(available.begin() + static_cast<std::ptrdiff_t>(pick));
    }
}

TileType RocketFor(MatchOrientation orientation) {
    return orientation == MatchOrientation::Vertical ? TileType::RocketVertical
                                                     : TileType::RocketHorizontal;
}

}  // namespace

std::size_t BlastResult::removedCount() const noexcept {
    std::size_t total = 0;
    for (const auto& batch : batches) {
        total += batch.size();
    }
    return total;
}

bool BlastResult::removed(TileId id) const noexcept {
    for (const auto& batch : batches) {
        for (const auto& tile : batch) {
            if (tile.id == id) {
                return true;
            }
        }
    }
    return false;
}

std::vector<Tile> BlastPath(const Grid& grid, const Tile& tile, std::mt19937& rng,
                            const std::unordered_set<TileId>& skip) {
    std::vector<Tile> path;
    switch (tile.type) {
        case TileType::RocketHorizontal:
            CollectLine(grid, tile.pos, 1, 0, path);
            break;
        case TileType::RocketVertical:
            CollectLine(grid, tile.pos, 0, 1, path);
            break;
        case TileType::Snitch:
        case TileType::SnitchLucky:
            CollectSnitchArea(grid, tile, rng, skip, path);
            break;
        case TileType::Red:
        case TileType::Yellow:
        case TileType::Green:
        case TileType::Blue:
            if (const Tile* live = grid.get(tile.pos)) {
                path.push_back(*live);
            }
            break;
    }
    return path;
}

std::vector<Tile> BlastPath(const Grid& grid, const Tile& tile, std::mt19937& rng) {
    static const std::unordered_set<TileId> kNone;
    return BlastPath(grid, tile, rng, kNone);
}

BlastResolver::BlastResolver(Grid& grid, std::mt19937& rng, const EngineConfig& config)
    : grid_(grid), rng_(rng), config_(config) {}

void BlastResolver::enqueueMatch(const MatchData& match) {
    Unit unit;
    unit.tiles = match.tiles;
    if (match.isSnitchMatch()) {
        // Lucky or regular is decided when the snitch is placed.
        unit.spawn = SpawnTarget{match.pivot, TileType::Snitch};
    } else if (match.isPowerUpMatch()) {
        unit.spawn = SpawnTarget{match.pivot, RocketFor(match.orientation)};
        unit.keep = match.pivot;
    }
    queue_.push_back(std::move(unit));
}

bool BlastResolver::enqueueActivation(const Cell& cell) {
    const Tile* tile = grid_.get(cell);
    if (tile == nullptr || !IsPowerUp(tile->type) || processed_.count(tile->id) > 0) {
        return false;
    }
    Unit unit;
    unit.tiles = BlastPath(grid_, *tile, rng_, processed_);
    unit.origin = tile->id;
    queue_.push_back(std::move(unit));
    ++activations_;
    return true;
}

BlastResult BlastResolver::resolve() {
    BlastResult result;
    while (!queue_.empty()) {
        Unit unit = std::move(queue_.front());
        queue_.pop_front();
        process(unit, result);
    }
    performSpawns(result);
    result.activations = activations_;

    processed_.clear();
    spawns_.clear();
    activations_ = 0;
    return result;
}

void BlastResolver::process(const Unit& unit, BlastResult& result) {
    if (unit.spawn) {
        addSpawn(*unit.spawn);
    }

    std::vector<Tile> candidates;
    candidates.reserve(unit.tiles.size());
    for (const auto& tile : unit.tiles) {
        if (processed_.count(tile.id) > 0) {
            continue;
        }
        if (unit.keep && tile.pos == *unit.keep) {
            continue;
        }
        const Tile* live = grid_.get(tile.pos);
        if (live == nullptr || live->id != tile.id) {
            continue;
        }
        processed_.insert(live->id);
        candidates.push_back(*live);
    }

    // Chained power-ups capture their paths before anything in this unit leaves the grid.
    for (const auto& tile : candidates) {
        if (!IsPowerUp(tile.type) || tile.id == unit.origin) {
            continue;
        }
        Unit chained;
        chained.tiles = BlastPath(grid_, tile, rng_, processed_);
        chained.origin = tile.id;
        queue_.push_back(std::move(chained));
        ++activations_;
    }

    for (const auto& tile : candidates) {
        grid_.remove(tile);
    }
    if (!candidates.empty()) {
        result.batches.push_back(std::move(candidates));
    }
}

void BlastResolver::addSpawn(const SpawnTarget& target) {
    const bool taken = std::any_of(spawns_.begin(), spawns_.end(), [&](const SpawnTarget& s) {
        return s.cell == target.cell;
    });
    if (!taken) {
        spawns_.push_back(target);
    }
}

void BlastResolver::performSpawns(BlastResult& result) {
    std::vector<Tile> replaced;
    for (const auto& target : spawns_) {
        TileType type = target.type;
        if (type == TileType::Snitch) {
            std::bernoulli_distribution lucky(0.5);
            if (lucky(rng_)) {
                type = TileType::SnitchLucky;
            }
        }
        if (!grid_.isValid(target.cell)) {
            result.errors.push_back(EngineError{ErrorCode::OutOfBounds, "spawn target off the grid"});
            continue;
        }
        // A pivot kept for a spawn leaves the grid even when the spawn fails.
        if (const Tile* occupant = grid_.get(target.cell)) {
            replaced.push_back(*occupant);
            grid_.clear(target.cell);
        }
        if (!config_.HasPowerUp(type)) {
            result.errors.push_back(EngineError{
                ErrorCode::MissingAsset,
                "no spawn registered for " + std::string(ToString(type)) + " at (" +
                    std::to_string(target.cell.x) + "," + std::to_string(target.cell.y) + ")"});
            continue;
        }
        result.spawned.push_back(grid_.place(target.cell, type));
    }
    if (!replaced.empty()) {
        result.batches.push_back(std::move(replaced));
    }
}

}  // namespace blitz::core
