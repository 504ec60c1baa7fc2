#include "hand_gesture_perception/game/round_decider.hpp"

#include <stdexcept>

namespace hgp::game
{

std::string toString(Winner w)
{
  switch (w) {
    case Winner::PLAYER1:
      return "p1";
    case Winner::PLAYER2:
      return "p2";
    case Winner::DRAW:
      return "draw";
    case Winner::NONE:
    default:
      return "null";
  }
}

std::string toString(Outcome o)
{
  switch (o) {
    case Outcome::WINNER:
      return "winner";
    case Outcome::LOSER:
      return "loser";
    case Outcome::DRAW:
      return "draw";
    case Outcome::NONE:
    default:
      return "null";
  }
}

namespace
{

Gesture beats(Gesture g)
{
  switch (g) {
    case Gesture::ROCK:
      return Gesture::SCISSORS;
    case Gesture::SCISSORS:
      return Gesture::PAPER;
    case Gesture::PAPER:
    default:
      return Gesture::ROCK;
  }
}

}  // namespace

Winner winner(const MaybeGesture & g1, const MaybeGesture & g2)
{
  if (!g1 || !g2) {
    return Winner::NONE;
  }
  if (*g1 == *g2) {
    return Winner::DRAW;
  }
  return beats(*g1) == *g2 ? Winner::PLAYER1 : Winner::PLAYER2;
}

int RoundScore::winsOf(const std::string & player) const
{
  if (player == player1) {
    return wins1;
  }
  if (player == player2) {
    return wins2;
  }
  throw std::out_of_range("Unknown player '" + player + "'");
}

RoundDecider::RoundDecider(
  std::string player1,
  std::string player2,
  rclcpp::Logger logger)
: logger_(make_child_logger(logger, "rounds"))
{
  if (player1.empty() || player2.empty()) {
    throw std::invalid_argument("RoundDecider needs two named players");
  }
  if (player1 == player2) {
    throw std::invalid_argument(
            "RoundDecider needs two distinct players, got '" + player1 + "' twice");
  }

  score_.player1 = std::move(player1);
  score_.player2 = std::move(player2);
}

RoundRecord RoundDecider::addRound(
  const MaybeGesture & g1,
  const MaybeGesture & g2)
{
  RoundRecord rec;
  rec.round = roundCount() + 1;
  rec.gesture1 = g1;
  rec.gesture2 = g2;

  switch (winner(g1, g2)) {
    case Winner::PLAYER1:
      score_.wins1++;
      rec.outcome1 = Outcome::WINNER;
      rec.outcome2 = Outcome::LOSER;
      break;
    case Winner::PLAYER2:
      score_.wins2++;
      rec.outcome1 = Outcome::LOSER;
      rec.outcome2 = Outcome::WINNER;
      break;
    case Winner::DRAW:
      score_.draws++;
      rec.outcome1 = Outcome::DRAW;
      rec.outcome2 = Outcome::DRAW;
      break;
    case Winner::NONE:
      score_.nulls++;
      rec.outcome1 = Outcome::NONE;
      rec.outcome2 = Outcome::NONE;
      break;
  }

  rec.score_after = score_;

  history_.push_back(std::move(rec));

  HGP_LOG(logger_, "%s", history_.back().to_string().c_str());

  return history_.back();
}

}  // namespace hgp::game
