#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "blitz/core/Gravity.hpp"
#include "blitz/core/MatchDetector.hpp"
#include "blitz/core/Tile.hpp"
#include "blitz/core/Types.hpp"

namespace blitz::core {

using BatchToken = std::uint64_t;

enum class ErrorCode { InvalidCommand, OutOfBounds, MissingAsset };

struct EngineError {
    ErrorCode code = ErrorCode::InvalidCommand;
    std::string message;
};

std::string_view ToString(ErrorCode code) noexcept;

// Receives everything the engine reports to renderers, animators and scoring.
// Within one resolution cycle callbacks arrive in phase order: matches, blasts,
// gravity, refill. Batches issued through OnBatchIssued must be acknowledged
// with CascadeStateMachine::CompleteBatch before the engine moves on.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void OnSwapStarted(const Tile& /*a*/, const Tile& /*b*/) {}
    virtual void OnSwapReverted(const Tile& /*a*/, const Tile& /*b*/) {}

    virtual void OnMatchFound(const MatchData& /*match*/) {}
    virtual void OnItemsBlasted(const std::vector<Tile>& /*tiles*/) {}
    virtual void OnPowerUpSpawned(const Tile& /*tile*/) {}
    virtual void OnBlastCompleted() {}

    virtual void OnGravityStarted() {}
    virtual void OnTileFell(const FallOperation& /*fall*/, int /*stagger_group*/) {}
    virtual void OnGravityCompleted() {}

    virtual void OnRefillStarted() {}
    virtual void OnTileSpawned(const SpawnOperation& /*spawn*/, const Tile& /*tile*/) {}
    virtual void OnRefillCompleted() {}

    virtual void OnGameStateChanged(GameState /*state*/) {}
    virtual void OnBatchIssued(BatchToken /*token*/, GameState /*phase*/) {}
    virtual void OnError(const EngineError& /*error*/) {}
};

}  // namespace blitz::core
