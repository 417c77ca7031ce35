#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace blitz::core {

inline constexpr int kMinMatchLength = 3;
inline constexpr int kPowerUpMatchLength = 4;
inline constexpr int kSquareSize = 2;

struct Cell {
    std::int32_t x{};
    std::int32_t y{};

    constexpr bool operator==(const Cell& other) const noexcept {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }

    constexpr bool operator<(const Cell& other) const noexcept {
        return x < other.x || (x == other.x && y < other.y);
    }
};

struct Move {
    Cell a{};
    Cell b{};
};

struct CellHash {
    std::size_t operator()(const Cell& cell) const noexcept {
        auto key = static_cast<std::uint64_t>(
            (static_cast<std::uint64_t>(static_cast<std::uint32_t>(cell.x)) << 32) |
            static_cast<std::uint32_t>(cell.y));
        return std::hash<std::uint64_t>{}(key);
    }
};

enum class TileType : std::uint8_t {
    Red,
    Yellow,
    Green,
    Blue,
    RocketHorizontal,
    RocketVertical,
    Snitch,
    SnitchLucky
};

enum class MatchOrientation { Horizontal, Vertical, Square };

enum class GameState { Idle, Swapping, Blasting, Gravity, Refilling, Cascading };

constexpr bool IsColored(TileType type) noexcept {
    return type == TileType::Red || type == TileType::Yellow || type == TileType::Green ||
           type == TileType::Blue;
}

constexpr bool IsRocket(TileType type) noexcept {
    return type == TileType::RocketHorizontal || type == TileType::RocketVertical;
}

constexpr bool IsSnitch(TileType type) noexcept {
    return type == TileType::Snitch || type == TileType::SnitchLucky;
}

constexpr bool IsPowerUp(TileType type) noexcept {
    return IsRocket(type) || IsSnitch(type);
}

std::string_view ToString(TileType type) noexcept;
std::string_view ToString(MatchOrientation orientation) noexcept;
std::string_view ToString(GameState state) noexcept;

std::optional<TileType> TileTypeFromString(std::string_view name) noexcept;

}  // namespace blitz::core
