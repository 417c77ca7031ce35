#include "blitz/core/Events.hpp"

namespace blitz::core {

std::string_view ToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidCommand:
            return "InvalidCommand";
        case ErrorCode::OutOfBounds:
            return "OutOfBounds";
        case ErrorCode::MissingAsset:
            return "MissingAsset";
    }
    return "Unknown";
}

}  // namespace blitz::core
