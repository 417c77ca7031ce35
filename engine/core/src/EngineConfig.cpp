#include "blitz/core/EngineConfig.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace blitz::core {

namespace {

Json TypeList(const std::vector<TileType>& types) {
    Json list = Json::array();
    for (auto type : types) {
        list.push_back(std::string(ToString(type)));
    }
    return list;
}

template <typename Predicate>
std::vector<TileType> ParseTypeList(const Json& json, Predicate accept) {
    std::vector<TileType> types;
    for (const auto& entry : json) {
        if (!entry.is_string()) {
            continue;
        }
        auto type = TileTypeFromString(entry.get<std::string>());
        if (type && accept(*type) && std::find(types.begin(), types.end(), *type) == types.end()) {
            types.push_back(*type);
        }
    }
    return types;
}

// Integers that do not fit T are treated as absent.
template <typename T>
std::optional<T> ReadInteger(const Json& json, const char* key) {
    if (!json.contains(key) || !json[key].is_number_integer()) {
        return std::nullopt;
    }
    const auto& value = json[key];
    if (value.is_number_unsigned()) {
        const auto number = value.get<std::uint64_t>();
        if (number > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            return std::nullopt;
        }
        return static_cast<T>(number);
    }
    const auto number = value.get<std::int64_t>();
    if (number < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
        number > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
        return std::nullopt;
    }
    return static_cast<T>(number);
}

}  // namespace

bool EngineConfig::IsValid() const noexcept {
    return width >= kSquareSize && height >= kSquareSize && !colors.empty() &&
           max_cascade_depth >= 0 &&
           std::all_of(colors.begin(), colors.end(), [](TileType t) { return IsColored(t); });
}

bool EngineConfig::HasPowerUp(TileType type) const noexcept {
    return std::find(power_ups.begin(), power_ups.end(), type) != power_ups.end();
}

Json EngineConfig::ToJson() const {
    Json json;
    json["width"] = width;
    json["height"] = height;
    json["colors"] = TypeList(colors);
    json["power_ups"] = TypeList(power_ups);
    json["max_cascade_depth"] = max_cascade_depth;
    if (seed) {
        json["seed"] = *seed;
    }
    return json;
}

EngineConfig EngineConfig::FromJson(const Json& json) {
    EngineConfig config;
    if (auto width = ReadInteger<int>(json, "width")) {
        config.width = *width;
    }
    if (auto height = ReadInteger<int>(json, "height")) {
        config.height = *height;
    }
    if (json.contains("colors") && json["colors"].is_array()) {
        config.colors = ParseTypeList(json["colors"], [](TileType t) { return IsColored(t); });
    }
    if (json.contains("power_ups") && json["power_ups"].is_array()) {
        config.power_ups = ParseTypeList(json["power_ups"], [](TileType t) { return IsPowerUp(t); });
    }
    if (auto depth = ReadInteger<int>(json, "max_cascade_depth")) {
        config.max_cascade_depth = *depth;
    }
    if (auto seed = ReadInteger<std::uint32_t>(json, "seed")) {
        config.seed = *seed;
    }
    return config;
}

std::string EngineConfig::Serialize() const {
    return ToJson().dump();
}

EngineConfig EngineConfig::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

}  // namespace blitz::core
