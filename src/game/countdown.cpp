#include "hand_gesture_perception/game/countdown.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace hgp::game
{

int countdownStep(double elapsed_s, double step_s)
{
  if (!(step_s > 0.0)) {
    return kCountdownSteps;
  }
  if (!(elapsed_s > 0.0)) {
    return 0;
  }

  const double steps = std::floor(elapsed_s / step_s);
  if (steps >= kCountdownSteps) {
    return kCountdownSteps;
  }
  return std::max(0, static_cast<int>(steps));
}

std::string countdownWord(int step)
{
  static const std::array<const char *, kCountdownSteps> kWords{
    "ROCK", "PAPER", "SCISSORS", "SHOOT!"};

  if (step < 0 || step >= kCountdownSteps) {
    throw std::out_of_range(
            "countdown step " + std::to_string(step) + " outside [0, " +
            std::to_string(kCountdownSteps) + ")");
  }
  return kWords[static_cast<size_t>(step)];
}

}  // namespace hgp::game
