#include <gtest/gtest.h>

#include <array>
#include <stdexcept>

#include <rclcpp/logger.hpp>

#include "hand_gesture_perception/game/round_decider.hpp"

using namespace hgp;
using namespace hgp::game;

namespace
{

const std::array<Gesture, 3> kAll{Gesture::ROCK, Gesture::PAPER, Gesture::SCISSORS};

}  // namespace

// ------------------------------------------------------------
// winner()
// ------------------------------------------------------------
TEST(WinnerTest, ClassicRules)
{
  EXPECT_EQ(winner(Gesture::ROCK, Gesture::SCISSORS), Winner::PLAYER1);
  EXPECT_EQ(winner(Gesture::SCISSORS, Gesture::PAPER), Winner::PLAYER1);
  EXPECT_EQ(winner(Gesture::PAPER, Gesture::ROCK), Winner::PLAYER1);

  EXPECT_EQ(winner(Gesture::SCISSORS, Gesture::ROCK), Winner::PLAYER2);
  EXPECT_EQ(winner(Gesture::PAPER, Gesture::SCISSORS), Winner::PLAYER2);
  EXPECT_EQ(winner(Gesture::ROCK, Gesture::PAPER), Winner::PLAYER2);
}

TEST(WinnerTest, EqualGesturesDraw)
{
  for (const auto g : kAll) {
    EXPECT_EQ(winner(g, g), Winner::DRAW);
  }
}

TEST(WinnerTest, MissingGestureIsNull)
{
  for (const auto g : kAll) {
    EXPECT_EQ(winner(g, std::nullopt), Winner::NONE);
    EXPECT_EQ(winner(std::nullopt, g), Winner::NONE);
  }
  EXPECT_EQ(winner(std::nullopt, std::nullopt), Winner::NONE);
}

TEST(WinnerTest, SwappingPlayersSwapsWinner)
{
  for (const auto a : kAll) {
    for (const auto b : kAll) {
      const Winner ab = winner(a, b);
      const Winner ba = winner(b, a);

      if (ab == Winner::DRAW) {
        EXPECT_EQ(ba, Winner::DRAW);
      } else {
        EXPECT_EQ(ab == Winner::PLAYER1, ba == Winner::PLAYER2);
      }
    }
  }
}

TEST(WinnerTest, Labels)
{
  EXPECT_EQ(toString(Winner::PLAYER1), "p1");
  EXPECT_EQ(toString(Winner::PLAYER2), "p2");
  EXPECT_EQ(toString(Winner::DRAW), "draw");
  EXPECT_EQ(toString(Winner::NONE), "null");
}

// ------------------------------------------------------------
// RoundDecider
// ------------------------------------------------------------
class RoundDeciderTest : public ::testing::Test
{
protected:
  RoundDecider decider{"red", "blue", rclcpp::get_logger("test")};
};

TEST(RoundDeciderSetupTest, RejectsBadPlayers)
{
  EXPECT_THROW(
    RoundDecider("red", "red", rclcpp::get_logger("test")),
    std::invalid_argument);
  EXPECT_THROW(
    RoundDecider("", "blue", rclcpp::get_logger("test")),
    std::invalid_argument);
}

TEST_F(RoundDeciderTest, StartsEmpty)
{
  EXPECT_EQ(decider.roundCount(), 0);
  EXPECT_EQ(decider.score().total(), 0);
  EXPECT_EQ(decider.player1(), "red");
  EXPECT_EQ(decider.player2(), "blue");
}

TEST_F(RoundDeciderTest, ThreeRoundHistory)
{
  const RoundRecord r1 = decider.addRound(Gesture::ROCK, Gesture::SCISSORS);
  const RoundRecord r2 = decider.addRound(Gesture::PAPER, Gesture::PAPER);
  const RoundRecord r3 = decider.addRound(std::nullopt, Gesture::ROCK);

  EXPECT_EQ(r1.round, 1);
  EXPECT_EQ(r2.round, 2);
  EXPECT_EQ(r3.round, 3);

  EXPECT_EQ(r1.outcome1, Outcome::WINNER);
  EXPECT_EQ(r1.outcome2, Outcome::LOSER);
  EXPECT_EQ(r2.outcome1, Outcome::DRAW);
  EXPECT_EQ(r2.outcome2, Outcome::DRAW);
  EXPECT_EQ(r3.outcome1, Outcome::NONE);
  EXPECT_EQ(r3.outcome2, Outcome::NONE);

  const RoundScore & s = decider.score();
  EXPECT_EQ(s.winsOf("red"), 1);
  EXPECT_EQ(s.winsOf("blue"), 0);
  EXPECT_EQ(s.draws, 1);
  EXPECT_EQ(s.nulls, 1);
  EXPECT_EQ(s.total(), 3);

  ASSERT_EQ(decider.history().size(), 3u);
  EXPECT_EQ(decider.history()[1].gesture1, MaybeGesture(Gesture::PAPER));
}

TEST_F(RoundDeciderTest, RecordsKeepScoreAtTheirRound)
{
  decider.addRound(Gesture::ROCK, Gesture::SCISSORS);
  decider.addRound(Gesture::ROCK, Gesture::PAPER);

  const auto & h = decider.history();
  EXPECT_EQ(h[0].score_after.wins1, 1);
  EXPECT_EQ(h[0].score_after.wins2, 0);
  EXPECT_EQ(h[1].score_after.wins1, 1);
  EXPECT_EQ(h[1].score_after.wins2, 1);
}

TEST_F(RoundDeciderTest, UnknownPlayerThrows)
{
  EXPECT_THROW(decider.score().winsOf("green"), std::out_of_range);
}

TEST_F(RoundDeciderTest, RecordLine)
{
  const RoundRecord r = decider.addRound(Gesture::ROCK, Gesture::SCISSORS);

  EXPECT_EQ(
    r.to_string(),
    "[ROUND 001] red:ROCK(winner) blue:SCISSORS(loser) | "
    "red=1 blue=0 draws=0 nulls=0");
}
