#include "simulation.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace pong {

namespace {

int floorDiv(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

struct Rect {
    int x, y, w, h;
};

bool overlaps(const Rect& a, const Rect& b) {
    return a.x < b.x + b.w && b.x < a.x + a.w && a.y < b.y + b.h && b.y < a.y + a.h;
}

int movePaddle(int y, Intent intent, const CourtConfig& court) {
    if (intent == Intent::Up) y -= court.paddleSpeed;
    if (intent == Intent::Down) y += court.paddleSpeed;
    return std::clamp(y, court.paddleMinY(), court.paddleMaxY());
}

void hitPaddle(BallState& ball, int paddleY, bool leftPaddle, const CourtConfig& court) {
    int speed = std::abs(ball.vx);
    ball.vx = leftPaddle ? speed : -speed;
    int ballCenter = ball.y + court.ballSize / 2;
    int paddleCenter = paddleY + court.paddleHeight / 2;
    ball.vy = floorDiv(ballCenter - paddleCenter, 2);
}

}  // namespace

MatchState InitialMatchState(const CourtConfig& court) {
    MatchState match;
    ResetPlay(match, court);
    match.phase = GamePhase::AwaitingPlayers;
    return match;
}

void ServeBall(BallState& ball, const CourtConfig& court, bool towardLeft) {
    ball.x = court.width / 2;
    ball.y = court.height / 2;
    ball.vx = towardLeft ? -court.ballServeSpeed : court.ballServeSpeed;
    ball.vy = 0;
}

void ResetPlay(MatchState& match, const CourtConfig& court) {
    match.leftY = court.paddleStartY();
    match.rightY = court.paddleStartY();
    match.score = ScoreState{};
    match.hasWinner = false;
    match.winner = PeerRole::Observer;
    ServeBall(match.ball, court, true);
}

bool StepMatch(MatchState& match, Intent left, Intent right, const CourtConfig& court) {
    if (match.phase != GamePhase::InProgress) return false;

    match.leftY = movePaddle(match.leftY, left, court);
    match.rightY = movePaddle(match.rightY, right, court);

    BallState& ball = match.ball;
    ball.x += ball.vx;
    ball.y += ball.vy;

    if (ball.x > court.width) {
        ++match.score.left;
        ServeBall(ball, court, true);
    } else if (ball.x < 0) {
        ++match.score.right;
        ServeBall(ball, court, false);
    }

    const Rect ballRect{ball.x, ball.y, court.ballSize, court.ballSize};
    const Rect leftRect{court.leftPaddleX(), match.leftY, court.paddleWidth, court.paddleHeight};
    const Rect rightRect{court.rightPaddleX(), match.rightY, court.paddleWidth, court.paddleHeight};
    if (overlaps(ballRect, leftRect)) {
        hitPaddle(ball, match.leftY, true, court);
    } else if (overlaps(ballRect, rightRect)) {
        hitPaddle(ball, match.rightY, false, court);
    }

    if (ball.y < court.wallThickness) {
        ball.vy = std::abs(ball.vy);
        ball.y = std::max(ball.y, 0);
    } else if (ball.y + court.ballSize > court.height - court.wallThickness) {
        ball.vy = -std::abs(ball.vy);
        ball.y = std::min(ball.y, court.height - court.ballSize);
    }

    if (match.score.left >= court.winScore || match.score.right >= court.winScore) {
        match.phase = GamePhase::GameOver;
        match.hasWinner = true;
        match.winner = match.score.left >= court.winScore ? PeerRole::Left : PeerRole::Right;
        return true;
    }
    return false;
}

std::string FormatStateLine(const MatchState& match, const CourtConfig& court) {
    std::ostringstream ss;
    ss << match.leftY << " " << match.rightY << " " << match.ball.x << " " << match.ball.y << " "
       << match.score.left << " " << match.score.right;
    if (match.hasWinner) {
        ss << " over " << roleName(match.winner) << " " << court.winScore;
    }
    return ss.str();
}

StateSnapshot MakeSnapshot(const MatchState& match, const CourtConfig& court,
                           uint64_t tick, uint64_t sessionId) {
    StateSnapshot snap;
    snap.tick = tick;
    snap.sessionId = sessionId;
    snap.phase = match.phase;
    snap.leftY = match.leftY;
    snap.rightY = match.rightY;
    snap.ballX = match.ball.x;
    snap.ballY = match.ball.y;
    snap.leftScore = match.score.left;
    snap.rightScore = match.score.right;
    snap.gameOver = match.hasWinner;
    snap.winner = match.winner;
    snap.winScore = court.winScore;
    snap.line = FormatStateLine(match, court);
    return snap;
}

bool IsLegalTransition(GamePhase from, GamePhase to) {
    if (from == to) return true;
    switch (from) {
        case GamePhase::AwaitingPlayers: return to == GamePhase::InProgress;
        case GamePhase::InProgress: return to == GamePhase::GameOver;
        case GamePhase::GameOver: return to == GamePhase::AwaitingRematch;
        case GamePhase::AwaitingRematch: return to == GamePhase::InProgress;
    }
    return false;
}

void CheckInvariants(const MatchState& match, const CourtConfig& court) {
    auto fail = [](const std::string& what) { throw SimulationFault(what); };
    if (match.leftY < 0 || match.leftY > court.height - court.paddleHeight) fail("left paddle out of court");
    if (match.rightY < 0 || match.rightY > court.height - court.paddleHeight) fail("right paddle out of court");
    if (match.score.left < 0 || match.score.right < 0) fail("negative score");
    if (match.score.left > court.winScore || match.score.right > court.winScore) fail("score past win threshold");
    if (match.ball.x < 0 || match.ball.x > court.width) fail("ball outside court horizontally");
    if (match.ball.y < 0 || match.ball.y > court.height - court.ballSize) fail("ball outside court vertically");
    bool over = match.phase == GamePhase::GameOver || match.phase == GamePhase::AwaitingRematch;
    if (over != match.hasWinner) fail("winner set outside game over");
}

}  // namespace pong
