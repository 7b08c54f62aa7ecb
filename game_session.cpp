#include "game_session.hpp"

#include "leaderboard.hpp"
#include "simulation.hpp"

#include <iostream>
#include <memory>
#include <utility>
#include <thread>

namespace pong {

GameSession::GameSession(const CourtConfig& court, SessionRegistry& registry, Leaderboard* leaderboard)
    : court_(court), registry_(registry), leaderboard_(leaderboard), step_(StepMatch),
      match_(InitialMatchState(court)) {}

void GameSession::setStepFunction(StepFunction step) {
    std::lock_guard<std::mutex> lock(mutex_);
    step_ = std::move(step);
}

void GameSession::setIntent(PeerRole role, Intent intent) {
    if (role == PeerRole::Left) leftIntent_.store(static_cast<int>(intent), std::memory_order_relaxed);
    if (role == PeerRole::Right) rightIntent_.store(static_cast<int>(intent), std::memory_order_relaxed);
}

Intent GameSession::takeIntent(PeerRole role) {
    auto& slot = role == PeerRole::Left ? leftIntent_ : rightIntent_;
    return static_cast<Intent>(slot.exchange(static_cast<int>(Intent::None), std::memory_order_relaxed));
}

void GameSession::transitionLocked(GamePhase to) {
    if (!IsLegalTransition(match_.phase, to)) {
        throw SimulationFault(std::string("illegal phase change ") + phaseName(match_.phase) + " -> " + phaseName(to));
    }
    match_.phase = to;
}

void GameSession::terminateSessionLocked(const char* reason) {
    auto evicted = registry_.evictSeatedPlayers();
    std::cerr << "[session] session " << sessionId_ << " closed: " << reason
              << " (evicted " << evicted.size() << " player connection(s))\n";
    match_ = InitialMatchState(court_);
    rematch_.clear();
    lingerTicks_ = -1;
    ++sessionId_;
    leftIntent_.store(static_cast<int>(Intent::None));
    rightIntent_.store(static_cast<int>(Intent::None));
}

void GameSession::recordWins(const std::vector<std::string>& winners) {
    if (!leaderboard_) return;
    for (const auto& user : winners) {
        if (user.empty()) continue;
        if (!leaderboard_->recordWin(user)) {
            std::cerr << "[session] could not record win for " << user << "\n";
        }
    }
}

GameSession::ReadyResult GameSession::signalReady(PeerRole role, uint64_t connectionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!registry_.ownsSlot(role, connectionId)) return ReadyResult::Ignored;
    if (match_.phase != GamePhase::AwaitingRematch || !registry_.bothPlayersSeated()) {
        return ReadyResult::Ignored;
    }
    auto outcome = rematch_.signalReady(role);
    if (outcome == RematchCoordinator::Outcome::Ignored) return ReadyResult::Ignored;
    if (outcome == RematchCoordinator::Outcome::Waiting) {
        std::cerr << "[session] " << roleName(role) << " is ready for a rematch\n";
        return ReadyResult::Waiting;
    }
    ResetPlay(match_, court_);
    rematch_.clear();
    lingerTicks_ = -1;
    transitionLocked(GamePhase::InProgress);
    std::cerr << "[session] rematch started in session " << sessionId_ << "\n";
    return ReadyResult::Restarted;
}

void GameSession::playerLeft(PeerRole role, uint64_t connectionId) {
    if (!isPlayer(role)) {
        registry_.release(role, connectionId);
        return;
    }
    std::vector<std::string> winners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!registry_.ownsSlot(role, connectionId)) return;
        if (registry_.slot(role).username.empty()) {
            // Never authenticated, so never part of the match.
            registry_.release(role, connectionId);
            return;
        }

        switch (match_.phase) {
            case GamePhase::InProgress: {
                PeerRole winner = opponentOf(role);
                match_.phase = GamePhase::GameOver;
                match_.hasWinner = true;
                match_.winner = winner;
                rematch_.arm();
                winners.push_back(registry_.slot(winner).username);
                std::cerr << "[session] " << roleName(role) << " left mid-game, "
                          << roleName(winner) << " wins by forfeit\n";
                registry_.release(role, connectionId);
                break;
            }
            case GamePhase::GameOver:
            case GamePhase::AwaitingRematch:
                if (rematch_.abort(role)) {
                    std::cerr << "[session] " << roleName(role) << " left while "
                              << roleName(opponentOf(role)) << " was ready\n";
                }
                terminateSessionLocked("player left after game over");
                break;
            case GamePhase::AwaitingPlayers:
                registry_.release(role, connectionId);
                break;
        }
    }
    recordWins(winners);
}

void GameSession::tick() {
    std::vector<std::string> winners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++tick_;
        const Intent left = takeIntent(PeerRole::Left);
        const Intent right = takeIntent(PeerRole::Right);

        try {
            if (match_.phase == GamePhase::AwaitingPlayers && registry_.bothPlayersSeated()) {
                ResetPlay(match_, court_);
                transitionLocked(GamePhase::InProgress);
                std::cerr << "[session] session " << sessionId_ << " started: "
                          << registry_.slot(PeerRole::Left).username << " vs "
                          << registry_.slot(PeerRole::Right).username << "\n";
            }
            if (step_(match_, left, right, court_)) {
                rematch_.arm();
                winners.push_back(registry_.slot(match_.winner).username);
                std::cerr << "[session] game over, " << roleName(match_.winner) << " wins "
                          << match_.score.left << "-" << match_.score.right << "\n";
            }
            CheckInvariants(match_, court_);
        } catch (const SimulationFault& e) {
            std::cerr << "[tick] simulation fault: " << e.what() << "\n";
            winners.clear();
            terminateSessionLocked("simulation fault");
        }

        registry_.broadcastSnapshot(std::make_shared<const StateSnapshot>(
            MakeSnapshot(match_, court_, tick_, sessionId_)));

        if (match_.phase == GamePhase::GameOver) {
            transitionLocked(GamePhase::AwaitingRematch);
        }
        if (match_.phase == GamePhase::AwaitingRematch && !registry_.bothPlayersSeated()) {
            if (lingerTicks_ < 0) {
                lingerTicks_ = kForfeitLingerTicks;
            } else if (--lingerTicks_ <= 0) {
                terminateSessionLocked("opponent forfeited");
            }
        }
    }
    recordWins(winners);
}

void GameSession::run(const std::atomic<bool>& stop, std::chrono::microseconds interval) {
    using Clock = std::chrono::steady_clock;
    auto next = Clock::now();
    while (!stop) {
        tick();
        next += interval;
        auto now = Clock::now();
        if (now - next > interval * 10) {
            // Fell far behind (suspended process, debugger): resynchronize instead of bursting.
            next = now;
        }
        std::this_thread::sleep_until(next);
    }
}

MatchState GameSession::matchState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return match_;
}

GamePhase GameSession::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return match_.phase;
}

uint64_t GameSession::sessionId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessionId_;
}

uint64_t GameSession::tickCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tick_;
}

}  // namespace pong
