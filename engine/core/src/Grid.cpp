#include "blitz/core/Grid.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

#include "blitz/core/MatchDetector.hpp"

namespace blitz::core {

namespace {

std::optional<TileType> TileFromLetter(char letter) {
    switch (letter) {
        case 'R':
            return TileType::Red;
        case 'Y':
            return TileType::Yellow;
        case 'G':
            return TileType::Green;
        case 'B':
            return TileType::Blue;
        case 'H':
            return TileType::RocketHorizontal;
        case 'V':
            return TileType::RocketVertical;
        case 'S':
            return TileType::Snitch;
        case 'L':
            return TileType::SnitchLucky;
        default:
            return std::nullopt;
    }
}

char LetterFromTile(TileType type) {
    switch (type) {
        case TileType::Red:
            return 'R';
        case TileType::Yellow:
            return 'Y';
        case TileType::Green:
            return 'G';
        case TileType::Blue:
            return 'B';
        case TileType::RocketHorizontal:
            return 'H';
        case TileType::RocketVertical:
            return 'V';
        case TileType::Snitch:
            return 'S';
        case TileType::SnitchLucky:
            return 'L';
    }
    return '?';
}

TileType RandomColor(const std::vector<TileType>& colors, std::mt19937& rng) {
    std::uniform_int_distribution<std::size_t> dist(0, colors.size() - 1);
    return colors[dist(rng)];
}

}  // namespace

Grid::Grid(int width, int height)
    : width_(std::max(width, 0)),
      height_(std::max(height, 0)),
      cells_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_)) {}

bool Grid::isValid(int x, int y) const noexcept {
    return x >= 0 && x < width_ && y >= 0 && y < height_;
}

const Tile* Grid::get(int x, int y) const noexcept {
    if (!isValid(x, y)) {
        return nullptr;
    }
    const auto& slot = cells_[index(x, y)];
    return slot ? &*slot : nullptr;
}

Tile* Grid::get(int x, int y) noexcept {
    if (!isValid(x, y)) {
        return nullptr;
    }
    auto& slot = cells_[index(x, y)];
    return slot ? &*slot : nullptr;
}

const Tile& Grid::at(const Cell& cell) const {
    if (!isValid(cell)) {
        throw std::out_of_range("grid access out of bounds");
    }
    const auto& slot = cells_[index(cell.x, cell.y)];
    if (!slot) {
        throw std::out_of_range("grid cell is empty");
    }
    return *slot;
}

Tile& Grid::place(const Cell& cell, TileType type) {
    if (!isValid(cell)) {
        throw std::out_of_range("grid access out of bounds");
    }
    auto& slot = cells_[index(cell.x, cell.y)];
    if (slot) {
        throw std::logic_error("grid cell is occupied");
    }
    Tile tile;
    tile.id = next_id_++;
    tile.type = type;
    tile.pos = cell;
    slot = tile;
    return *slot;
}

void Grid::clear(const Cell& cell) noexcept {
    if (isValid(cell)) {
        cells_[index(cell.x, cell.y)].reset();
    }
}

bool Grid::remove(const Tile& tile) noexcept {
    const Tile* current = get(tile.pos);
    if (current == nullptr || current->id != tile.id) {
        return false;
    }
    clear(tile.pos);
    return true;
}

bool Grid::swap(const Cell& a, const Cell& b) noexcept {
    if (!isValid(a) || !isValid(b)) {
        return false;
    }
    auto& slot_a = cells_[index(a.x, a.y)];
    auto& slot_b = cells_[index(b.x, b.y)];
    std::swap(slot_a, slot_b);
    if (slot_a) {
        slot_a->pos = a;
    }
    if (slot_b) {
        slot_b->pos = b;
    }
    return true;
}

bool Grid::move(const Cell& from, const Cell& to) noexcept {
    if (!isValid(from) || !isValid(to) || from == to) {
        return false;
    }
    auto& source = cells_[index(from.x, from.y)];
    auto& target = cells_[index(to.x, to.y)];
    if (!source || target) {
        return false;
    }
    target = source;
    target->pos = to;
    source.reset();
    return true;
}

bool Grid::setMoving(const Cell& cell, bool moving) noexcept {
    Tile* tile = get(cell);
    if (tile == nullptr) {
        return false;
    }
    tile->moving = moving;
    return true;
}

bool Grid::areAdjacent(const Cell& a, const Cell& b) const noexcept {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y) == 1;
}

int Grid::countEmptyInColumn(int x) const noexcept {
    if (x < 0 || x >= width_) {
        return 0;
    }
    int count = 0;
    for (int y = 0; y < height_; ++y) {
        if (!cells_[index(x, y)]) {
            ++count;
        }
    }
    return count;
}

std::size_t Grid::tileCount() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(cells_.begin(), cells_.end(), [](const auto& slot) { return slot.has_value(); }));
}

const Tile* Grid::findTile(TileId id) const noexcept {
    for (const auto& slot : cells_) {
        if (slot && slot->id == id) {
            return &*slot;
        }
    }
    return nullptr;
}

bool Grid::checkInvariants() const {
    std::unordered_set<TileId> seen;
    for (int x = 0; x < width_; ++x) {
        for (int y = 0; y < height_; ++y) {
            const auto& slot = cells_[index(x, y)];
            if (!slot) {
                continue;
            }
            if (slot->pos != Cell{x, y} || slot->id == kNoTile) {
                return false;
            }
            if (!seen.insert(slot->id).second) {
                return false;
            }
        }
    }
    return true;
}

int Grid::index(int x, int y) const noexcept {
    return x * height_ + y;
}

std::optional<Grid> ParseLayout(const std::vector<std::string>& rows) {
    if (rows.empty() || rows.front().empty()) {
        return std::nullopt;
    }
    const int width = static_cast<int>(rows.front().size());
    const int height = static_cast<int>(rows.size());
    Grid grid(width, height);
    for (int r = 0; r < height; ++r) {
        const auto& row = rows[static_cast<std::size_t>(r)];
        if (static_cast<int>(row.size()) != width) {
            return std::nullopt;
        }
        const int y = height - 1 - r;
        for (int x = 0; x < width; ++x) {
            const char letter = row[static_cast<std::size_t>(x)];
            if (letter == '.') {
                continue;
            }
            auto type = TileFromLetter(letter);
            if (!type) {
                return std::nullopt;
            }
            grid.place(Cell{x, y}, *type);
        }
    }
    return grid;
}

std::string FormatLayout(const Grid& grid) {
    std::string out;
    out.reserve(static_cast<std::size_t>((grid.width() + 1) * grid.height()));
    for (int y = grid.height() - 1; y >= 0; --y) {
        for (int x = 0; x < grid.width(); ++x) {
            const Tile* tile = grid.get(x, y);
            out += tile ? LetterFromTile(tile->type) : '.';
        }
        out += '\n';
    }
    return out;
}

void FillWithoutMatches(Grid& grid, const std::vector<TileType>& colors, std::mt19937& rng) {
    if (colors.empty()) {
        return;
    }
    for (int x = 0; x < grid.width(); ++x) {
        for (int y = 0; y < grid.height(); ++y) {
            const Cell cell{x, y};
            grid.clear(cell);
            grid.place(cell, RandomColor(colors, rng));
            int tries = 0;
            while (HasMatchAt(grid, cell) && tries <= 20) {
                grid.get(cell)->type = RandomColor(colors, rng);
                ++tries;
            }
        }
    }

    bool changed = true;
    int iter_guard = 0;
    while (changed && iter_guard < 1000) {
        changed = false;
        ++iter_guard;
        for (const auto& match : FindAllMatches(grid)) {
            const Tile& victim = match.tiles[match.tiles.size() / 2];
            if (Tile* tile = grid.get(victim.pos)) {
                tile->type = RandomColor(colors, rng);
                changed = true;
            }
        }
    }
}

}  // namespace blitz::core
