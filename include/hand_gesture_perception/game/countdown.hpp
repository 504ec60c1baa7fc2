#pragma once

#include <string>

namespace hgp::game
{

// ROCK, PAPER, SCISSORS, SHOOT!
constexpr int kCountdownSteps = 4;

/**
 * @brief Countdown word index for the time spent in the countdown
 *
 * Always in [0, kCountdownSteps]; kCountdownSteps means the countdown is
 * over. A negative elapsed time (clock stepped back) stays on the first word.
 * A non-positive step length ends the countdown at once.
 */
int countdownStep(double elapsed_s, double step_s);

// Throws std::out_of_range outside [0, kCountdownSteps)
std::string countdownWord(int step);

}  // namespace hgp::game
