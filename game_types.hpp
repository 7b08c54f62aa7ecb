#pragma once

#include <cstdint>
#include <string>

namespace pong {

enum class PeerRole {
    Left,
    Right,
    Observer,
};

enum class GamePhase {
    AwaitingPlayers,
    InProgress,
    GameOver,
    AwaitingRematch,
};

enum class Intent {
    None,
    Up,
    Down,
};

// Handshake spelling: "left", "right", "spectator".
const char* roleName(PeerRole role);
const char* phaseName(GamePhase phase);
inline bool isPlayer(PeerRole role) { return role != PeerRole::Observer; }
inline PeerRole opponentOf(PeerRole role) {
    return role == PeerRole::Left ? PeerRole::Right : PeerRole::Left;
}

// Maps "up" / "down" / "" to an intent; false for anything else.
bool parseIntent(const std::string& payload, Intent& out);

// Court geometry and rules. All units are integer pixels and pixels per tick.
struct CourtConfig {
    int width{640};
    int height{480};
    int wallThickness{10};
    int paddleWidth{10};
    int paddleHeight{50};
    int paddleInset{10};
    int paddleSpeed{5};
    int ballSize{5};
    int ballServeSpeed{5};
    int winScore{5};

    int paddleStartY() const { return height / 2 - paddleHeight / 2; }
    int paddleMinY() const { return wallThickness; }
    int paddleMaxY() const { return height - wallThickness - paddleHeight; }
    int leftPaddleX() const { return paddleInset; }
    int rightPaddleX() const { return width - paddleInset - paddleWidth; }
};

struct BallState {
    int x{0};
    int y{0};
    int vx{0};
    int vy{0};
};

struct ScoreState {
    int left{0};
    int right{0};
};

// The whole authoritative game: one value, owned by the game session.
struct MatchState {
    GamePhase phase{GamePhase::AwaitingPlayers};
    int leftY{0};
    int rightY{0};
    BallState ball;
    ScoreState score;
    bool hasWinner{false};
    PeerRole winner{PeerRole::Observer};
};

// One tick's projection of the match, never modified after publication.
struct StateSnapshot {
    uint64_t tick{0};
    uint64_t sessionId{0};
    GamePhase phase{GamePhase::AwaitingPlayers};
    int leftY{0};
    int rightY{0};
    int ballX{0};
    int ballY{0};
    int leftScore{0};
    int rightScore{0};
    bool gameOver{false};
    PeerRole winner{PeerRole::Observer};
    int winScore{0};
    std::string line;
};

}  // namespace pong
