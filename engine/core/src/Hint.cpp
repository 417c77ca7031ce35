#include "blitz/core/Hint.hpp"

#include <set>
#include <unordered_set>
#include <utility>

namespace blitz::core::hint {

namespace {

std::pair<Cell, Cell> NormalizedKey(const Move& move) {
    if (move.b < move.a) {
        return {move.b, move.a};
    }
    return {move.a, move.b};
}

bool Swappable(const Tile* tile) {
    return tile != nullptr && !tile->moving;
}

int DistinctTiles(const std::vector<MatchData>& matches) {
    std::unordered_set<TileId> ids;
    for (const auto& match : matches) {
        for (const auto& tile : match.tiles) {
            ids.insert(tile.id);
        }
    }
    return static_cast<int>(ids.size());
}

}  // namespace

std::optional<HintResult> FindHint(const Grid& grid) {
    const int offsets[4][2] = {{1, 0}, {0, 1}, {-1, 0}, {0, -1}};

    std::set<std::pair<Cell, Cell>> evaluated;
    HintResult best{};
    bool has_best = false;

    for (int x = 0; x < grid.width(); ++x) {
        for (int y = 0; y < grid.height(); ++y) {
            const Cell origin{x, y};
            if (!Swappable(grid.get(origin))) {
                continue;
            }
            for (const auto& offset : offsets) {
                const Cell neighbor{x + offset[0], y + offset[1]};
                if (!Swappable(grid.get(neighbor))) {
                    continue;
                }

                Move move{origin, neighbor};
                if (!evaluated.insert(NormalizedKey(move)).second) {
                    continue;
                }

                Grid evaluation_grid = grid;
                evaluation_grid.swap(move.a, move.b);
                auto matches = FindMatchesAt(evaluation_grid, {move.a, move.b});
                if (matches.empty()) {
                    continue;
                }

                HintResult candidate{};
                candidate.move = move;
                candidate.score = DistinctTiles(matches);
                candidate.matches = std::move(matches);

                if (!has_best || candidate.score > best.score) {
                    best = std::move(candidate);
                    has_best = true;
                }
            }
        }
    }

    if (!has_best) {
        return std::nullopt;
    }
    return best;
}

bool AnyLegalMoves(const Grid& grid) {
    for (int x = 0; x < grid.width(); ++x) {
        for (int y = 0; y < grid.height(); ++y) {
            const Tile* tile = grid.get(x, y);
            if (tile != nullptr && IsPowerUp(tile->type) && !tile->moving) {
                return true;
            }
        }
    }
    return FindHint(grid).has_value();
}

}  // namespace blitz::core::hint
