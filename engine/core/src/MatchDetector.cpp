#include "blitz/core/MatchDetector.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>

namespace blitz::core {

namespace {

using CellSet = std::unordered_set<Cell, CellHash>;

const Tile* ColoredAt(const Grid& grid, const Cell& cell) {
    const Tile* tile = grid.get(cell);
    if (tile == nullptr || !IsColored(tile->type)) {
        return nullptr;
    }
    return tile;
}

std::optional<MatchData> TrySquareAt(const Grid& grid, const Cell& corner, const Cell& pivot,
                                     const CellSet& consumed) {
    const Cell cells[4] = {corner,
                           Cell{corner.x + 1, corner.y},
                           Cell{corner.x, corner.y + 1},
                           Cell{corner.x + 1, corner.y + 1}};
    const Tile* first = ColoredAt(grid, cells[0]);
    if (first == nullptr) {
        return std::nullopt;
    }
    MatchData match;
    match.orientation = MatchOrientation::Square;
    match.pivot = pivot;
    for (const auto& cell : cells) {
        const Tile* tile = ColoredAt(grid, cell);
        if (tile == nullptr || tile->type != first->type || consumed.count(cell) > 0) {
            return std::nullopt;
        }
        match.tiles.push_back(*tile);
    }
    return match;
}

// Collects the maximal run through `origin` along (dx, dy). Cells in
// `barrier` stop the expansion in both directions.
std::vector<Tile> RunThrough(const Grid& grid, const Cell& origin, int dx, int dy,
                             const CellSet& barrier) {
    std::vector<Tile> run;
    const Tile* seed = ColoredAt(grid, origin);
    if (seed == nullptr || barrier.count(origin) > 0) {
        return run;
    }
    auto same = [&](const Cell& cell) {
        const Tile* tile = ColoredAt(grid, cell);
        return tile != nullptr && tile->type == seed->type && barrier.count(cell) == 0;
    };

    Cell start = origin;
    while (same(Cell{start.x - dx, start.y - dy})) {
        start = Cell{start.x - dx, start.y - dy};
    }
    for (Cell cursor = start; same(cursor); cursor = Cell{cursor.x + dx, cursor.y + dy}) {
        run.push_back(*grid.get(cursor));
    }
    return run;
}

struct LinearScan {
    const Grid& grid;
    const CellSet& squares;
    CellSet processed_horizontal;
    CellSet processed_vertical;

    void scan(const Cell& cell, const std::optional<Cell>& seed, std::vector<MatchData>& out) {
        const Tile* tile = ColoredAt(grid, cell);
        if (tile == nullptr || squares.count(cell) > 0) {
            return;
        }
        if (processed_horizontal.count(cell) == 0) {
            emit(RunThrough(grid, cell, 1, 0, squares), MatchOrientation::Horizontal, seed,
                 processed_horizontal, out);
        }
        if (processed_vertical.count(cell) == 0) {
            emit(RunThrough(grid, cell, 0, 1, squares), MatchOrientation::Vertical, seed,
                 processed_vertical, out);
        }
    }

    void emit(std::vector<Tile> run, MatchOrientation orientation, const std::optional<Cell>& seed,
              CellSet& processed, std::vector<MatchData>& out) {
        if (static_cast<int>(run.size()) < kMinMatchLength) {
            return;
        }
        for (const auto& tile : run) {
            processed.insert(tile.pos);
        }
        MatchData match;
        match.orientation = orientation;
        match.pivot = seed ? *seed : run[run.size() / 2].pos;
        match.tiles = std::move(run);
        out.push_back(std::move(match));
    }
};

void ConsumeSquare(const MatchData& square, CellSet& consumed) {
    for (const auto& tile : square.tiles) {
        consumed.insert(tile.pos);
    }
}

}  // namespace

bool MatchData::contains(TileId id) const noexcept {
    return std::any_of(tiles.begin(), tiles.end(),
                       [id](const Tile& tile) { return tile.id == id; });
}

bool HasMatchAt(const Grid& grid, const Cell& cell) {
    if (ColoredAt(grid, cell) == nullptr) {
        return false;
    }
    const CellSet none;
    if (static_cast<int>(RunThrough(grid, cell, 1, 0, none).size()) >= kMinMatchLength) {
        return true;
    }
    if (static_cast<int>(RunThrough(grid, cell, 0, 1, none).size()) >= kMinMatchLength) {
        return true;
    }
    for (int dx = 0; dx < kSquareSize; ++dx) {
        for (int dy = 0; dy < kSquareSize; ++dy) {
            const Cell corner{cell.x - dx, cell.y - dy};
            if (TrySquareAt(grid, corner, corner, none)) {
                return true;
            }
        }
    }
    return false;
}

std::vector<MatchData> FindAllMatches(const Grid& grid) {
    std::vector<MatchData> matches;
    CellSet squares;

    for (int x = 0; x + 1 < grid.width(); ++x) {
        for (int y = 0; y + 1 < grid.height(); ++y) {
            const Cell corner{x, y};
            if (auto square = TrySquareAt(grid, corner, corner, squares)) {
                ConsumeSquare(*square, squares);
                matches.push_back(std::move(*square));
            }
        }
    }

    LinearScan linear{grid, squares, {}, {}};
    for (int x = 0; x < grid.width(); ++x) {
        for (int y = 0; y < grid.height(); ++y) {
            linear.scan(Cell{x, y}, std::nullopt, matches);
        }
    }
    return matches;
}

std::vector<MatchData> FindMatchesAt(const Grid& grid, const std::vector<Cell>& seeds) {
    std::vector<MatchData> matches;
    CellSet squares;
    CellSet checked_corners;

    for (const auto& seed : seeds) {
        // The seed can be any of the four corners of a square.
        const Cell corners[4] = {seed,
                                 Cell{seed.x - 1, seed.y},
                                 Cell{seed.x, seed.y - 1},
                                 Cell{seed.x - 1, seed.y - 1}};
        for (const auto& corner : corners) {
            if (!checked_corners.insert(corner).second) {
                continue;
            }
            if (auto square = TrySquareAt(grid, corner, seed, squares)) {
                ConsumeSquare(*square, squares);
                matches.push_back(std::move(*square));
            }
        }
    }

    LinearScan linear{grid, squares, {}, {}};
    for (const auto& seed : seeds) {
        linear.scan(seed, seed, matches);
    }
    return matches;
}

}  // namespace blitz::core
