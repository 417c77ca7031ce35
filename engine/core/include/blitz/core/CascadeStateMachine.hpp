#pragma once

#include <optional>
#include <random>
#include <vector>

#include "blitz/core/BlastResolver.hpp"
#include "blitz/core/EngineConfig.hpp"
#include "blitz/core/Events.hpp"
#include "blitz/core/Grid.hpp"
#include "blitz/core/MatchDetector.hpp"

namespace blitz::core {

// Sequences Swap -> Blast -> Gravity -> Refill -> Cascade check. Only Idle
// accepts commands. Phases that need the animator issue a batch token and
// wait for CompleteBatch; everything else runs synchronously.
class CascadeStateMachine {
public:
    explicit CascadeStateMachine(const EngineConfig& config, EventSink* sink = nullptr);
    CascadeStateMachine(const EngineConfig& config, Grid grid, EventSink* sink = nullptr);

    CascadeStateMachine(const CascadeStateMachine&) = delete;
    CascadeStateMachine& operator=(const CascadeStateMachine&) = delete;

    bool RequestSwap(const Cell& a, const Cell& b);
    bool RequestSwap(const Move& move) { return RequestSwap(move.a, move.b); }
    bool ActivatePowerUp(const Cell& cell);
    bool CompleteBatch(BatchToken token);

    std::optional<BatchToken> pendingBatch() const noexcept;

    GameState state() const noexcept { return state_; }
    int cascadeDepth() const noexcept { return cascade_depth_; }
    const Grid& grid() const noexcept { return grid_; }
    const EngineConfig& config() const noexcept { return config_; }

private:
    struct PendingBatch {
        BatchToken token = 0;
        std::vector<Cell> moving;
    };

    void SetState(GameState state);
    BatchToken IssueBatch(const std::vector<Cell>& moving);
    void AnnounceBatch(BatchToken token);
    template <typename Fn>
    void Dispatch(Fn&& fn);
    void Advance();

    void FinishSwap();
    void BeginBlast(const std::vector<MatchData>& matches, std::optional<Cell> activation);
    void BeginGravity();
    void BeginRefill();
    void CheckCascade();

    void Reject(const char* reason) const;
    void ReportError(const EngineError& error);

    EngineConfig config_;
    EventSink null_sink_;
    EventSink* sink_;
    std::mt19937 rng_;
    Grid grid_;
    BlastResolver resolver_;

    GameState state_ = GameState::Idle;
    int cascade_depth_ = 0;
    Move swap_{};
    bool reverting_ = false;

    std::optional<PendingBatch> pending_;
    BatchToken next_token_ = 1;
    bool advancing_ = false;
    bool resume_ = false;
};

}  // namespace blitz::core
