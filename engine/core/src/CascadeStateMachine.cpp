#include "blitz/core/CascadeStateMachine.hpp"

#include <SDL2/SDL.h>

#include <utility>

#include "blitz/core/Gravity.hpp"

namespace blitz::core {

namespace {

std::uint32_t SeedFor(const EngineConfig& config) {
    return config.seed ? *config.seed : std::random_device{}();
}

}  // namespace

CascadeStateMachine::CascadeStateMachine(const EngineConfig& config, EventSink* sink)
    : config_(config),
      sink_(sink != nullptr ? sink : &null_sink_),
      rng_(SeedFor(config)),
      grid_(config.width, config.height),
      resolver_(grid_, rng_, config_) {
    if (!config_.IsValid()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Engine config is invalid (%dx%d, %d colors)",
                    config_.width, config_.height, static_cast<int>(config_.colors.size()));
    }
    FillWithoutMatches(grid_, config_.colors, rng_);
}

CascadeStateMachine::CascadeStateMachine(const EngineConfig& config, Grid grid, EventSink* sink)
    : config_(config),
      sink_(sink != nullptr ? sink : &null_sink_),
      rng_(SeedFor(config)),
      grid_(std::move(grid)),
      resolver_(grid_, rng_, config_) {
    config_.width = grid_.width();
    config_.height = grid_.height();
}

template <typename Fn>
void CascadeStateMachine::Dispatch(Fn&& fn) {
    // Completions reported from inside sink callbacks are queued through
    // resume_ and handled once the outermost dispatch unwinds.
    const bool nested = advancing_;
    advancing_ = true;
    fn();
    if (nested) {
        return;
    }
    while (resume_) {
        resume_ = false;
        Advance();
    }
    advancing_ = false;
}

bool CascadeStateMachine::RequestSwap(const Cell& a, const Cell& b) {
    if (state_ != GameState::Idle) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Swap ignored while %s",
                     ToString(state_).data());
        return false;
    }
    const Tile* tile_a = grid_.get(a);
    const Tile* tile_b = grid_.get(b);
    if (tile_a == nullptr || tile_b == nullptr) {
        Reject("swap on an empty or off-grid cell");
        return false;
    }
    if (tile_a->moving || tile_b->moving) {
        Reject("swap on a moving tile");
        return false;
    }
    if (!grid_.areAdjacent(a, b)) {
        Reject("swap between non-adjacent cells");
        return false;
    }

    Dispatch([&] {
        cascade_depth_ = 0;
        swap_ = Move{a, b};
        reverting_ = false;
        SetState(GameState::Swapping);
        grid_.swap(a, b);
        const auto token = IssueBatch({a, b});
        sink_->OnSwapStarted(grid_.at(b), grid_.at(a));
        AnnounceBatch(token);
    });
    return true;
}

bool CascadeStateMachine::ActivatePowerUp(const Cell& cell) {
    if (state_ != GameState::Idle) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Activation ignored while %s",
                     ToString(state_).data());
        return false;
    }
    const Tile* tile = grid_.get(cell);
    if (tile == nullptr || !IsPowerUp(tile->type)) {
        Reject("activation on a cell without a power-up");
        return false;
    }
    if (tile->moving) {
        Reject("activation on a moving tile");
        return false;
    }

    Dispatch([&] {
        cascade_depth_ = 0;
        BeginBlast({}, cell);
    });
    return true;
}

bool CascadeStateMachine::CompleteBatch(BatchToken token) {
    if (!pending_ || pending_->token != token) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Completion for unknown batch %llu",
                    static_cast<unsigned long long>(token));
        return false;
    }
    for (const auto& cell : pending_->moving) {
        grid_.setMoving(cell, false);
    }
    pending_.reset();
    Dispatch([this] { resume_ = true; });
    return true;
}

std::optional<BatchToken> CascadeStateMachine::pendingBatch() const noexcept {
    if (!pending_) {
        return std::nullopt;
    }
    return pending_->token;
}

void CascadeStateMachine::SetState(GameState state) {
    if (state_ == state) {
        return;
    }
    state_ = state;
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "State changed to %s", ToString(state).data());
    sink_->OnGameStateChanged(state);
}

BatchToken CascadeStateMachine::IssueBatch(const std::vector<Cell>& moving) {
    PendingBatch batch;
    batch.token = next_token_++;
    for (const auto& cell : moving) {
        if (grid_.setMoving(cell, true)) {
            batch.moving.push_back(cell);
        }
    }
    pending_ = std::move(batch);
    return pending_->token;
}

void CascadeStateMachine::AnnounceBatch(BatchToken token) {
    if (pending_ && pending_->token == token) {
        sink_->OnBatchIssued(token, state_);
    }
}

void CascadeStateMachine::Advance() {
    switch (state_) {
        case GameState::Swapping:
            if (reverting_) {
                reverting_ = false;
                SetState(GameState::Idle);
            } else {
                FinishSwap();
            }
            break;
        case GameState::Blasting:
            sink_->OnBlastCompleted();
            BeginGravity();
            break;
        case GameState::Gravity:
            sink_->OnGravityCompleted();
            BeginRefill();
            break;
        case GameState::Refilling:
            sink_->OnRefillCompleted();
            CheckCascade();
            break;
        case GameState::Idle:
        case GameState::Cascading:
            break;
    }
}

void CascadeStateMachine::FinishSwap() {
    auto matches = FindMatchesAt(grid_, {swap_.a, swap_.b});
    if (!matches.empty()) {
        BeginBlast(matches, std::nullopt);
        return;
    }
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Swap (%d,%d)-(%d,%d) made no match, reverting",
                 swap_.a.x, swap_.a.y, swap_.b.x, swap_.b.y);
    reverting_ = true;
    grid_.swap(swap_.a, swap_.b);
    const auto token = IssueBatch({swap_.a, swap_.b});
    sink_->OnSwapReverted(grid_.at(swap_.a), grid_.at(swap_.b));
    AnnounceBatch(token);
}

void CascadeStateMachine::BeginBlast(const std::vector<MatchData>& matches,
                                     std::optional<Cell> activation) {
    SetState(GameState::Blasting);
    for (const auto& match : matches) {
        sink_->OnMatchFound(match);
        resolver_.enqueueMatch(match);
    }
    if (activation) {
        resolver_.enqueueActivation(*activation);
    }

    BlastResult result = resolver_.resolve();
    for (const auto& error : result.errors) {
        ReportError(error);
    }
    if (result.batches.empty() && result.spawned.empty()) {
        resume_ = true;
        return;
    }

    const auto token = IssueBatch({});
    for (const auto& batch : result.batches) {
        sink_->OnItemsBlasted(batch);
    }
    for (const auto& tile : result.spawned) {
        sink_->OnPowerUpSpawned(tile);
    }
    AnnounceBatch(token);
}

void CascadeStateMachine::BeginGravity() {
    SetState(GameState::Gravity);
    sink_->OnGravityStarted();

    const auto falls = CalculateFalls(grid_);
    if (falls.empty()) {
        resume_ = true;
        return;
    }
    ApplyFalls(grid_, falls);

    std::vector<Cell> landed;
    landed.reserve(falls.size());
    for (const auto& fall : falls) {
        landed.push_back(Cell{fall.x, fall.to_y});
    }
    const auto token = IssueBatch(landed);

    int stagger_group = 0;
    for (const auto& [row, group] : GroupFallsBySourceRow(falls)) {
        for (auto fall : group) {
            fall.tile = grid_.at(Cell{fall.x, fall.to_y});
            sink_->OnTileFell(fall, stagger_group);
        }
        ++stagger_group;
    }
    AnnounceBatch(token);
}

void CascadeStateMachine::BeginRefill() {
    SetState(GameState::Refilling);
    sink_->OnRefillStarted();

    const auto spawns = CalculateSpawns(grid_);
    if (spawns.empty()) {
        resume_ = true;
        return;
    }
    const auto spawned = ApplySpawns(grid_, spawns, config_.colors, rng_);
    if (spawned.empty()) {
        ReportError(EngineError{ErrorCode::MissingAsset, "no colored tile types configured for refill"});
        resume_ = true;
        return;
    }

    std::vector<Cell> cells;
    cells.reserve(spawned.size());
    for (const auto& tile : spawned) {
        cells.push_back(tile.pos);
    }
    const auto token = IssueBatch(cells);
    for (const auto& spawn : spawns) {
        if (const Tile* tile = grid_.get(spawn.x, spawn.y)) {
            sink_->OnTileSpawned(spawn, *tile);
        }
    }
    AnnounceBatch(token);
}

void CascadeStateMachine::CheckCascade() {
    SetState(GameState::Cascading);
    auto matches = FindAllMatches(grid_);
    if (matches.empty()) {
        cascade_depth_ = 0;
        SetState(GameState::Idle);
        return;
    }

    ++cascade_depth_;
    if (cascade_depth_ > config_.max_cascade_depth) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Max cascade depth (%d) reached, dropping %d pending matches",
                    config_.max_cascade_depth, static_cast<int>(matches.size()));
        cascade_depth_ = 0;
        SetState(GameState::Idle);
        return;
    }
    BeginBlast(matches, std::nullopt);
}

void CascadeStateMachine::Reject(const char* reason) const {
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Command rejected: %s", reason);
}

void CascadeStateMachine::ReportError(const EngineError& error) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s: %s", ToString(error.code).data(),
                 error.message.c_str());
    sink_->OnError(error);
}

}  // namespace blitz::core
