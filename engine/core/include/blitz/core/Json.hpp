#pragma once

#include <nlohmann/json.hpp>

namespace blitz::core {

using Json = nlohmann::json;

}  // namespace blitz::core
