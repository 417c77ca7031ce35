#pragma once

#include <optional>
#include <random>
#include <string>
#include <vector>

#include "blitz/core/Tile.hpp"
#include "blitz/core/Types.hpp"

namespace blitz::core {

class Grid {
public:
    Grid() = default;
    Grid(int width, int height);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }

    bool isValid(int x, int y) const noexcept;
    bool isValid(const Cell& cell) const noexcept { return isValid(cell.x, cell.y); }

    // Out-of-bounds reads behave like empty cells.
    const Tile* get(int x, int y) const noexcept;
    const Tile* get(const Cell& cell) const noexcept { return get(cell.x, cell.y); }
    Tile* get(int x, int y) noexcept;
    Tile* get(const Cell& cell) noexcept { return get(cell.x, cell.y); }

    // Strict access: throws std::out_of_range for invalid coordinates or empty cells.
    const Tile& at(const Cell& cell) const;

    // Creates a tile with a fresh id in an empty cell. Throws std::out_of_range off the grid
    // and std::logic_error when the cell is occupied.
    Tile& place(const Cell& cell, TileType type);
    void clear(const Cell& cell) noexcept;
    bool remove(const Tile& tile) noexcept;

    bool swap(const Cell& a, const Cell& b) noexcept;
    bool move(const Cell& from, const Cell& to) noexcept;
    bool setMoving(const Cell& cell, bool moving) noexcept;

    bool areAdjacent(const Cell& a, const Cell& b) const noexcept;
    int countEmptyInColumn(int x) const noexcept;
    std::size_t tileCount() const noexcept;
    const Tile* findTile(TileId id) const noexcept;

    bool checkInvariants() const;

private:
    int index(int x, int y) const noexcept;

    int width_{0};
    int height_{0};
    TileId next_id_{1};
    std::vector<std::optional<Tile>> cells_;
};

// Rows are listed top first: rows.front() is y = height - 1.
std::optional<Grid> ParseLayout(const std::vector<std::string>& rows);
std::string FormatLayout(const Grid& grid);

void FillWithoutMatches(Grid& grid, const std::vector<TileType>& colors, std::mt19937& rng);

}  // namespace blitz::core
