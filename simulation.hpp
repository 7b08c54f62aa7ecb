#pragma once

#include "game_types.hpp"

#include <stdexcept>
#include <string>

namespace pong {

// An invariant of the match state no longer holds. Fatal to the session, not the server.
class SimulationFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

MatchState InitialMatchState(const CourtConfig& court);

// Scores, paddles and ball back to kickoff. The phase is left to the caller.
void ResetPlay(MatchState& match, const CourtConfig& court);

// Serves from the center, toward the left side when `towardLeft`.
void ServeBall(BallState& ball, const CourtConfig& court, bool towardLeft);

// Advances an in-progress match by one tick. Paddles move first, then the ball,
// then scoring, paddle and wall contacts are resolved in that order:
//   - ball.x > width   -> left scores, serve toward the left
//   - ball.x < 0       -> right scores, serve toward the right
//   - paddle contact   -> vx points away from that paddle,
//                         vy = floor((ballCenterY - paddleCenterY) / 2)
//   - wall contact     -> vy points away from that wall, y clamped into the court
// Reaching court.winScore moves the match to GameOver. Returns true on that tick.
// A match in any other phase is not touched.
bool StepMatch(MatchState& match, Intent left, Intent right, const CourtConfig& court);

// "<leftY> <rightY> <ballX> <ballY> <leftScore> <rightScore>", plus
// " over <left|right> <winScore>" once the match has a winner.
std::string FormatStateLine(const MatchState& match, const CourtConfig& court);

StateSnapshot MakeSnapshot(const MatchState& match, const CourtConfig& court,
                           uint64_t tick, uint64_t sessionId);

bool IsLegalTransition(GamePhase from, GamePhase to);

// Throws SimulationFault naming the first broken invariant.
void CheckInvariants(const MatchState& match, const CourtConfig& court);

}  // namespace pong
