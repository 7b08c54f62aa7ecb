#include "game_types.hpp"

namespace pong {

const char* roleName(PeerRole role) {
    switch (role) {
        case PeerRole::Left: return "left";
        case PeerRole::Right: return "right";
        case PeerRole::Observer: return "spectator";
    }
    return "spectator";
}

const char* phaseName(GamePhase phase) {
    switch (phase) {
        case GamePhase::AwaitingPlayers: return "awaiting-players";
        case GamePhase::InProgress: return "in-progress";
        case GamePhase::GameOver: return "game-over";
        case GamePhase::AwaitingRematch: return "awaiting-rematch";
    }
    return "unknown";
}

bool parseIntent(const std::string& payload, Intent& out) {
    if (payload.empty()) {
        out = Intent::None;
    } else if (payload == "up") {
        out = Intent::Up;
    } else if (payload == "down") {
        out = Intent::Down;
    } else {
        return false;
    }
    return true;
}

}  // namespace pong
