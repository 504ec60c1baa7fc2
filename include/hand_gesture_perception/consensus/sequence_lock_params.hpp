#pragma once

#include <vector>

#include "hand_gesture_perception/gesture.hpp"

namespace hgp::consensus
{

struct SequenceLockParams
{
  // Expected pairs, in order
  std::vector<GesturePair> steps;

  // Confirms a selection; also arms the lock
  GesturePair confirm_pair{Gesture::ROCK, Gesture::ROCK};

  int stable_required_frames{14};     // frames to accept a selection/confirm
  int settle_frames_after_step{12};   // input ignored after each transition
  int wrong_flash_frames{45};         // how long the failure text stays up

  double timeout_s{12.0};             // enforced by the host, not the lock
};

// Throws std::invalid_argument on negative or zero frame counts
void validate(const SequenceLockParams & params);

}  // namespace hgp::consensus
