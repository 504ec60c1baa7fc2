#pragma once

#include "hand_gesture_perception/consensus/stability_debouncer.hpp"
#include "hand_gesture_perception/gesture.hpp"
#include "hand_gesture_perception/observation.hpp"

namespace hgp::consensus
{

struct RoundParams
{
  int hide_required_frames{20};     // both hands out of view before a round
  int stable_required_frames{24};   // per player, identical gesture frames
  double countdown_step_s{0.55};    // host timing
  double post_shoot_timeout_s{10.0};  // host timing
};

// Throws std::invalid_argument on non-positive frame counts or negative times
void validate(const RoundParams & params);

/**
 * @brief Frame gates around one round
 *
 * Hidden gate: both players undetected for hide_required_frames in a row.
 * Capture: each player's gesture (when detected) runs through its own
 * debouncer; the round is captured once both are stable. Timeouts are the
 * host's business: on timeout it reads choices() as-is.
 */
class RoundCapture
{
public:
  explicit RoundCapture(const RoundParams & params);

  bool updateHidden(const Observation & first, const Observation & second);
  bool handsHidden() const {return hidden_.isStable();}
  int hiddenStreak() const {return hidden_.streak();}

  bool update(const Observation & first, const Observation & second);
  bool update(const ObservedPair & pair);
  bool captured() const {return first_.isStable() && second_.isStable();}

  // Last non-null gesture per player in the current streak
  ObservedPair choices() const {return {first_.lastValue(), second_.lastValue()};}

  int streakFirst() const {return first_.streak();}
  int streakSecond() const {return second_.streak();}

  // Clears both gates for the next round
  void reset();

  const RoundParams & params() const {return params_;}

private:
  RoundParams params_;

  StabilityDebouncer<bool> hidden_;
  StabilityDebouncer<Gesture> first_;
  StabilityDebouncer<Gesture> second_;
};

}  // namespace hgp::consensus
