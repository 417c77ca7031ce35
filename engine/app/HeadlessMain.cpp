#define SDL_MAIN_HANDLED

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_main.h>

#include "blitz/core/CascadeStateMachine.hpp"
#include "blitz/core/EngineConfig.hpp"
#include "blitz/core/Hint.hpp"

using blitz::core::BatchToken;
using blitz::core::CascadeStateMachine;
using blitz::core::Cell;
using blitz::core::EngineConfig;
using blitz::core::EngineError;
using blitz::core::EventSink;
using blitz::core::FallOperation;
using blitz::core::GameState;
using blitz::core::MatchData;
using blitz::core::SpawnOperation;
using blitz::core::Tile;

namespace {

constexpr int kDefaultMoves = 20;

class LogSink : public EventSink {
public:
    void OnSwapStarted(const Tile& a, const Tile& b) override {
        SDL_Log("swap (%d,%d) <-> (%d,%d)", b.pos.x, b.pos.y, a.pos.x, a.pos.y);
    }

    void OnSwapReverted(const Tile& a, const Tile& b) override {
        SDL_Log("swap reverted (%d,%d) <-> (%d,%d)", a.pos.x, a.pos.y, b.pos.x, b.pos.y);
    }

    void OnMatchFound(const MatchData& match) override {
        SDL_Log("match %s x%d pivot (%d,%d)", ToString(match.orientation).data(), match.count(),
                match.pivot.x, match.pivot.y);
    }

    void OnItemsBlasted(const std::vector<Tile>& tiles) override {
        blasted_ += static_cast<int>(tiles.size());
        SDL_Log("blasted %d tiles", static_cast<int>(tiles.size()));
    }

    void OnPowerUpSpawned(const Tile& tile) override {
        SDL_Log("spawned %s at (%d,%d)", ToString(tile.type).data(), tile.pos.x, tile.pos.y);
    }

    void OnTileFell(const FallOperation& fall, int stagger_group) override {
        ++falls_;
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "fall x=%d %d->%d group %d", fall.x,
                     fall.from_y, fall.to_y, stagger_group);
    }

    void OnTileSpawned(const SpawnOperation& spawn, const Tile& tile) override {
        ++spawns_;
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "refill (%d,%d) rank %d %s", spawn.x, spawn.y,
                     spawn.spawn_rank, ToString(tile.type).data());
    }

    void OnGameStateChanged(GameState state) override {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "state %s", ToString(state).data());
    }

    void OnError(const EngineError& error) override {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "engine error %s: %s",
                     ToString(error.code).data(), error.message.c_str());
    }

    int blasted() const { return blasted_; }
    int falls() const { return falls_; }
    int spawns() const { return spawns_; }

private:
    int blasted_ = 0;
    int falls_ = 0;
    int spawns_ = 0;
};

EngineConfig LoadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cannot open %s, using defaults", path.c_str());
        return EngineConfig{};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        return EngineConfig::Deserialize(buffer.str());
    } catch (const blitz::core::Json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Bad config %s: %s", path.c_str(), e.what());
        return EngineConfig{};
    }
}

// Acknowledges every batch at once, as an animator with zero-length animations would.
void DrainBatches(CascadeStateMachine& engine) {
    while (auto token = engine.pendingBatch()) {
        engine.CompleteBatch(*token);
    }
}

bool PlayOneMove(CascadeStateMachine& engine) {
    if (auto hint = blitz::core::hint::FindHint(engine.grid())) {
        return engine.RequestSwap(hint->move);
    }
    const auto& grid = engine.grid();
    for (int x = 0; x < grid.width(); ++x) {
        for (int y = 0; y < grid.height(); ++y) {
            const Tile* tile = grid.get(x, y);
            if (tile != nullptr && IsPowerUp(tile->type)) {
                return engine.ActivatePowerUp(Cell{x, y});
            }
        }
    }
    return false;
}

}  // namespace

int main(int argc, char** argv) {
    SDL_SetMainReady();

    EngineConfig config;
    if (argc > 1) {
        config = LoadConfig(argv[1]);
    }
    int moves = kDefaultMoves;
    if (argc > 2) {
        moves = std::max(0, std::atoi(argv[2]));
    }
    if (!config.IsValid()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Config rejected: %s", config.Serialize().c_str());
        return 1;
    }

    LogSink sink;
    CascadeStateMachine engine(config, &sink);
    SDL_Log("start board:\n%s", FormatLayout(engine.grid()).c_str());

    int played = 0;
    for (; played < moves; ++played) {
        if (!PlayOneMove(engine)) {
            SDL_Log("no moves left after %d moves", played);
            break;
        }
        DrainBatches(engine);
    }

    SDL_Log("final board:\n%s", FormatLayout(engine.grid()).c_str());
    SDL_Log("moves %d, blasted %d, falls %d, refills %d", played, sink.blasted(), sink.falls(),
            sink.spawns());
    return 0;
}
