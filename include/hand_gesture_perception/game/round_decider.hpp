#pragma once

#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <rclcpp/logger.hpp>

#include "hand_gesture_perception/gesture.hpp"
#include "hand_gesture_perception/logger.hpp"

namespace hgp::game
{

enum class Winner
{
  PLAYER1,
  PLAYER2,
  DRAW,
  NONE     // a gesture was missing
};

enum class Outcome
{
  WINNER,
  LOSER,
  DRAW,
  NONE
};

std::string toString(Winner w);    // "p1", "p2", "draw", "null"
std::string toString(Outcome o);   // "winner", "loser", "draw", "null"

// ROCK > SCISSORS > PAPER > ROCK
Winner winner(const MaybeGesture & g1, const MaybeGesture & g2);

struct RoundScore
{
  std::string player1;
  std::string player2;

  int wins1{0};
  int wins2{0};
  int draws{0};
  int nulls{0};

  // Wins of a player by name; throws std::out_of_range for other names
  int winsOf(const std::string & player) const;

  int total() const {return wins1 + wins2 + draws + nulls;}

  std::string to_string() const
  {
    std::ostringstream oss;
    oss << player1 << "=" << wins1 << " "
        << player2 << "=" << wins2 << " "
        << "draws=" << draws << " nulls=" << nulls;
    return oss.str();
  }
};

// Immutable once appended to the history
struct RoundRecord
{
  int round{0};   // 1-based

  MaybeGesture gesture1;
  MaybeGesture gesture2;

  Outcome outcome1{Outcome::NONE};
  Outcome outcome2{Outcome::NONE};

  RoundScore score_after;

  std::string to_string() const
  {
    std::ostringstream oss;
    oss << "[ROUND " << std::setw(3) << std::setfill('0') << round << "] "
        << score_after.player1 << ":" << gestureToString(gesture1)
        << "(" << toString(outcome1) << ") "
        << score_after.player2 << ":" << gestureToString(gesture2)
        << "(" << toString(outcome2) << ") | "
        << score_after.to_string();
    return oss.str();
  }
};

/**
 * @brief Running two-player score and append-only round history
 */
class RoundDecider
{
public:
  // Throws std::invalid_argument unless the two names are non-empty and distinct
  RoundDecider(
    std::string player1,
    std::string player2,
    rclcpp::Logger logger);

  // Returns a copy; history references are invalidated by later rounds
  RoundRecord addRound(const MaybeGesture & g1, const MaybeGesture & g2);

  const RoundScore & score() const {return score_;}
  const std::vector<RoundRecord> & history() const {return history_;}
  int roundCount() const {return static_cast<int>(history_.size());}

  const std::string & player1() const {return score_.player1;}
  const std::string & player2() const {return score_.player2;}

private:
  rclcpp::Logger logger_;
  RoundScore score_;
  std::vector<RoundRecord> history_;
};

}  // namespace hgp::game
