#include "blitz/core/Types.hpp"

#include <array>
#include <utility>

namespace blitz::core {

namespace {

constexpr std::array<std::pair<TileType, std::string_view>, 8> kTileNames{{
    {TileType::Red, "red"},
    {TileType::Yellow, "yellow"},
    {TileType::Green, "green"},
    {TileType::Blue, "blue"},
    {TileType::RocketHorizontal, "rocket_h"},
    {TileType::RocketVertical, "rocket_v"},
    {TileType::Snitch, "snitch"},
    {TileType::SnitchLucky, "snitch_lucky"},
}};

}  // namespace

std::string_view ToString(TileType type) noexcept {
    for (const auto& [value, name] : kTileNames) {
        if (value == type) {
            return name;
        }
    }
    return "unknown";
}

std::string_view ToString(MatchOrientation orientation) noexcept {
    switch (orientation) {
        case MatchOrientation::Horizontal:
            return "horizontal";
        case MatchOrientation::Vertical:
            return "vertical";
        case MatchOrientation::Square:
            return "square";
    }
    return "unknown";
}

std::string_view ToString(GameState state) noexcept {
    switch (state) {
        case GameState::Idle:
            return "Idle";
        case GameState::Swapping:
            return "Swapping";
        case GameState::Blasting:
            return "Blasting";
        case GameState::Gravity:
            return "Gravity";
        case GameState::Refilling:
            return "Refilling";
        case GameState::Cascading:
            return "Cascading";
    }
    return "Unknown";
}

std::optional<TileType> TileTypeFromString(std::string_view name) noexcept {
    for (const auto& [value, known] : kTileNames) {
        if (known == name) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace blitz::core
