#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

#include "simulation.hpp"

namespace {

using pong::CourtConfig;
using pong::GamePhase;
using pong::Intent;
using pong::MatchState;
using pong::PeerRole;

MatchState StartedMatch(const CourtConfig& court) {
  MatchState match = pong::InitialMatchState(court);
  match.phase = GamePhase::InProgress;
  return match;
}

std::vector<std::string> RunTrace(const CourtConfig& court,
                                  const std::vector<std::pair<Intent, Intent>>& trace) {
  MatchState match = StartedMatch(court);
  std::vector<std::string> lines;
  for (const auto& step : trace) {
    pong::StepMatch(match, step.first, step.second, court);
    lines.push_back(pong::FormatStateLine(match, court));
  }
  return lines;
}

std::vector<std::pair<Intent, Intent>> RandomTrace(unsigned seed, size_t length) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> pick(0, 2);
  std::vector<std::pair<Intent, Intent>> trace;
  for (size_t i = 0; i < length; ++i) {
    trace.emplace_back(static_cast<Intent>(pick(rng)), static_cast<Intent>(pick(rng)));
  }
  return trace;
}

}  // namespace

TEST(Simulation, InitialStateMatchesCourt) {
  CourtConfig court;
  MatchState match = pong::InitialMatchState(court);
  EXPECT_EQ(GamePhase::AwaitingPlayers, match.phase);
  EXPECT_EQ(215, match.leftY);
  EXPECT_EQ(215, match.rightY);
  EXPECT_EQ(320, match.ball.x);
  EXPECT_EQ(240, match.ball.y);
  EXPECT_EQ(-5, match.ball.vx);
  EXPECT_EQ(0, match.ball.vy);
  EXPECT_EQ("215 215 320 240 0 0", pong::FormatStateLine(match, court));
}

TEST(Simulation, DoesNotAdvanceOutsideInProgress) {
  CourtConfig court;
  MatchState match = pong::InitialMatchState(court);
  EXPECT_FALSE(pong::StepMatch(match, Intent::Up, Intent::Down, court));
  EXPECT_EQ(215, match.leftY);
  EXPECT_EQ(320, match.ball.x);
}

TEST(Simulation, PaddlesStayInsideCourtUnderSustainedInput) {
  CourtConfig court;
  MatchState match = StartedMatch(court);
  for (int i = 0; i < 200; ++i) {
    pong::StepMatch(match, Intent::Up, Intent::Down, court);
    ASSERT_GE(match.leftY, 0);
    ASSERT_LE(match.rightY, court.height - court.paddleHeight);
  }
  EXPECT_EQ(court.paddleMinY(), match.leftY);
  EXPECT_EQ(court.paddleMaxY(), match.rightY);
  EXPECT_EQ(10, match.leftY);
  EXPECT_EQ(420, match.rightY);
}

TEST(Simulation, PaddleMovesOneStepPerTick) {
  CourtConfig court;
  MatchState match = StartedMatch(court);
  pong::StepMatch(match, Intent::Down, Intent::Up, court);
  EXPECT_EQ(220, match.leftY);
  EXPECT_EQ(210, match.rightY);
  pong::StepMatch(match, Intent::None, Intent::None, court);
  EXPECT_EQ(220, match.leftY);
  EXPECT_EQ(210, match.rightY);
}

TEST(Simulation, LeftPaddleReflectsBallWithOffsetAngle) {
  CourtConfig court;
  MatchState match = StartedMatch(court);
  // The serve travels 5 px per tick from x=320; the first overlap is at x=15.
  for (int i = 0; i < 60; ++i) pong::StepMatch(match, Intent::None, Intent::None, court);
  EXPECT_EQ(20, match.ball.x);
  EXPECT_EQ(-5, match.ball.vx);
  pong::StepMatch(match, Intent::None, Intent::None, court);
  EXPECT_EQ(15, match.ball.x);
  EXPECT_EQ(5, match.ball.vx);
  // Ball center 242 against paddle center 240.
  EXPECT_EQ(1, match.ball.vy);
}

TEST(Simulation, ReflectionAngleRoundsTowardNegativeInfinity) {
  CourtConfig court;
  MatchState match = StartedMatch(court);
  match.ball = {625, 200, 5, 0};
  match.rightY = 190;
  pong::StepMatch(match, Intent::None, Intent::None, court);
  // Ball at (630, 200) no longer overlaps [620, 630).
  EXPECT_EQ(5, match.ball.vx);

  match = StartedMatch(court);
  match.ball = {610, 200, 5, 0};
  match.rightY = 190;
  pong::StepMatch(match, Intent::None, Intent::None, court);
  EXPECT_EQ(615, match.ball.x);
  EXPECT_EQ(5, match.ball.vx);
  pong::StepMatch(match, Intent::None, Intent::None, court);
  EXPECT_EQ(620, match.ball.x);
  EXPECT_EQ(-5, match.ball.vx);
  // floor((202 - 215) / 2) == -7
  EXPECT_EQ(-7, match.ball.vy);
}

TEST(Simulation, WallsReflectVerticalVelocity) {
  CourtConfig court;
  MatchState match = StartedMatch(court);
  match.ball = {300, 12, 5, -4};
  pong::StepMatch(match, Intent::None, Intent::None, court);
  EXPECT_EQ(8, match.ball.y);
  EXPECT_EQ(4, match.ball.vy);
  pong::StepMatch(match, Intent::None, Intent::None, court);
  EXPECT_EQ(12, match.ball.y);

  match.ball = {300, 463, 5, 4};
  pong::StepMatch(match, Intent::None, Intent::None, court);
  EXPECT_EQ(467, match.ball.y);
  EXPECT_EQ(-4, match.ball.vy);
}

TEST(Simulation, BallNeverLeavesCourtVertically) {
  CourtConfig court;
  MatchState match = StartedMatch(court);
  match.ball = {300, 11, 5, -14};
  pong::StepMatch(match, Intent::None, Intent::None, court);
  EXPECT_EQ(0, match.ball.y);
  EXPECT_EQ(14, match.ball.vy);
}

TEST(Simulation, PassingRightBoundaryScoresForLeft) {
  CourtConfig court;
  MatchState match = StartedMatch(court);
  match.ball = {638, 100, 5, 0};
  EXPECT_FALSE(pong::StepMatch(match, Intent::None, Intent::None, court));
  EXPECT_EQ(1, match.score.left);
  EXPECT_EQ(0, match.score.right);
  EXPECT_EQ(320, match.ball.x);
  EXPECT_EQ(240, match.ball.y);
  EXPECT_EQ(-5, match.ball.vx);
  EXPECT_EQ(0, match.ball.vy);
}

TEST(Simulation, PassingLeftBoundaryScoresForRight) {
  CourtConfig court;
  MatchState match = StartedMatch(court);
  match.ball = {2, 100, -5, 0};
  pong::StepMatch(match, Intent::None, Intent::None, court);
  EXPECT_EQ(0, match.score.left);
  EXPECT_EQ(1, match.score.right);
  EXPECT_EQ(5, match.ball.vx);
}

TEST(Simulation, ReachingWinScoreEndsAndFreezesTheGame) {
  CourtConfig court;
  MatchState match = StartedMatch(court);
  match.score.left = court.winScore - 1;
  match.ball = {638, 100, 5, 0};
  EXPECT_TRUE(pong::StepMatch(match, Intent::None, Intent::None, court));
  EXPECT_EQ(GamePhase::GameOver, match.phase);
  EXPECT_TRUE(match.hasWinner);
  EXPECT_EQ(PeerRole::Left, match.winner);
  EXPECT_EQ("215 215 320 240 5 0 over left 5", pong::FormatStateLine(match, court));

  MatchState frozen = match;
  EXPECT_FALSE(pong::StepMatch(match, Intent::Up, Intent::Up, court));
  EXPECT_EQ(pong::FormatStateLine(frozen, court), pong::FormatStateLine(match, court));
}

TEST(Simulation, IdenticalTracesProduceIdenticalSnapshots) {
  CourtConfig court;
  auto trace = RandomTrace(1234, 6000);
  auto first = RunTrace(court, trace);
  auto second = RunTrace(court, trace);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    ASSERT_EQ(first[i], second[i]) << "diverged at tick " << i;
  }
}

TEST(Simulation, InvariantsHoldForRandomPlay) {
  CourtConfig court;
  for (unsigned seed = 1; seed <= 5; ++seed) {
    MatchState match = StartedMatch(court);
    int prevLeft = 0;
    int prevRight = 0;
    for (const auto& step : RandomTrace(seed, 5000)) {
      pong::StepMatch(match, step.first, step.second, court);
      ASSERT_NO_THROW(pong::CheckInvariants(match, court));
      ASSERT_GE(match.score.left, prevLeft);
      ASSERT_GE(match.score.right, prevRight);
      prevLeft = match.score.left;
      prevRight = match.score.right;
      if (match.score.left >= court.winScore || match.score.right >= court.winScore) {
        ASSERT_EQ(GamePhase::GameOver, match.phase);
      }
    }
  }
}

TEST(Simulation, StationaryDefenderWinsAgainstRetreatingOpponent) {
  CourtConfig court;
  MatchState match = StartedMatch(court);
  int ticks = 0;
  while (match.phase == GamePhase::InProgress && ticks < 20000) {
    pong::StepMatch(match, Intent::None, Intent::Up, court);
    ++ticks;
  }
  EXPECT_EQ(GamePhase::GameOver, match.phase);
  EXPECT_EQ(PeerRole::Left, match.winner);
  EXPECT_EQ(5, match.score.left);
  EXPECT_EQ(0, match.score.right);
}

TEST(Simulation, InvariantCheckRejectsCorruptState) {
  CourtConfig court;
  MatchState match = StartedMatch(court);
  match.score.right = -1;
  EXPECT_THROW(pong::CheckInvariants(match, court), pong::SimulationFault);

  match = StartedMatch(court);
  match.leftY = court.height;
  EXPECT_THROW(pong::CheckInvariants(match, court), pong::SimulationFault);

  match = StartedMatch(court);
  match.hasWinner = true;
  EXPECT_THROW(pong::CheckInvariants(match, court), pong::SimulationFault);
}

TEST(Simulation, PhaseCycleOnlyMovesForward) {
  using pong::IsLegalTransition;
  EXPECT_TRUE(IsLegalTransition(GamePhase::AwaitingPlayers, GamePhase::InProgress));
  EXPECT_TRUE(IsLegalTransition(GamePhase::InProgress, GamePhase::GameOver));
  EXPECT_TRUE(IsLegalTransition(GamePhase::GameOver, GamePhase::AwaitingRematch));
  EXPECT_TRUE(IsLegalTransition(GamePhase::AwaitingRematch, GamePhase::InProgress));

  EXPECT_FALSE(IsLegalTransition(GamePhase::InProgress, GamePhase::AwaitingPlayers));
  EXPECT_FALSE(IsLegalTransition(GamePhase::InProgress, GamePhase::AwaitingRematch));
  EXPECT_FALSE(IsLegalTransition(GamePhase::GameOver, GamePhase::InProgress));
  EXPECT_FALSE(IsLegalTransition(GamePhase::AwaitingRematch, GamePhase::AwaitingPlayers));
}

TEST(Simulation, ParsesIntentPayloads) {
  Intent intent = Intent::Up;
  EXPECT_TRUE(pong::parseIntent("", intent));
  EXPECT_EQ(Intent::None, intent);
  EXPECT_TRUE(pong::parseIntent("up", intent));
  EXPECT_EQ(Intent::Up, intent);
  EXPECT_TRUE(pong::parseIntent("down", intent));
  EXPECT_EQ(Intent::Down, intent);
  EXPECT_FALSE(pong::parseIntent("left", intent));
  EXPECT_FALSE(pong::parseIntent("UP", intent));
}
