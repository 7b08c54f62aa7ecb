#pragma once

#include "game_types.hpp"
#include "rematch.hpp"
#include "session_registry.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace pong {

class Leaderboard;

static const std::chrono::microseconds kTickInterval{16667};  // 60 Hz
// Ticks a lone winner keeps its seat after a forfeit before the session is closed.
static const int kForfeitLingerTicks = 30;

// Owns the match state and advances it on a fixed schedule.
//
// Connection threads only touch it through setIntent (lock-free, latest value wins),
// signalReady and playerLeft. Everything that mutates the match happens under one
// mutex: either inside tick(), or in those two event calls.
class GameSession {
public:
    // Advances the match by one tick; returns true when the tick ended the game.
    using StepFunction = std::function<bool(MatchState&, Intent, Intent, const CourtConfig&)>;

    // `leaderboard` may be null, in which case wins are not recorded.
    GameSession(const CourtConfig& court, SessionRegistry& registry, Leaderboard* leaderboard);

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    void setIntent(PeerRole role, Intent intent);

    enum class ReadyResult {
        Ignored,
        Waiting,
        Restarted,
    };
    ReadyResult signalReady(PeerRole role, uint64_t connectionId);

    // Releases the caller's slot. Mid-game this is a forfeit; after a game it ends the session.
    void playerLeft(PeerRole role, uint64_t connectionId);

    // One simulation step followed by a snapshot publication.
    void tick();
    // Calls tick() every `interval` until `stop` is set.
    void run(const std::atomic<bool>& stop, std::chrono::microseconds interval = kTickInterval);

    // Replaces the physics step, StepMatch by default. Call before the tick thread starts.
    void setStepFunction(StepFunction step);

    MatchState matchState() const;
    GamePhase phase() const;
    uint64_t sessionId() const;
    uint64_t tickCount() const;
    const CourtConfig& court() const { return court_; }

private:
    Intent takeIntent(PeerRole role);
    void transitionLocked(GamePhase to);
    void terminateSessionLocked(const char* reason);
    void recordWins(const std::vector<std::string>& winners);

    const CourtConfig court_;
    SessionRegistry& registry_;
    Leaderboard* leaderboard_;
    StepFunction step_;

    std::atomic<int> leftIntent_{static_cast<int>(Intent::None)};
    std::atomic<int> rightIntent_{static_cast<int>(Intent::None)};

    mutable std::mutex mutex_;
    MatchState match_;
    RematchCoordinator rematch_;
    uint64_t tick_{0};
    uint64_t sessionId_{1};
    int lingerTicks_{-1};
};

}  // namespace pong
