#pragma once

#include <cstddef>
#include <deque>

#include "hand_gesture_perception/gesture.hpp"

namespace hgp::gesture
{

// Majority vote over the last N classified gestures
class GestureSmoother
{
public:
  explicit GestureSmoother(size_t window = 10);

  // Pushes g (evicting the oldest when full) and returns the majority.
  // Ties go to the label seen first in the window.
  Gesture update(Gesture g);

  // Majority of the current window, none if empty
  MaybeGesture current() const;

  void clear() {buf_.clear();}

  size_t size() const {return buf_.size();}
  size_t window() const {return window_;}

private:
  size_t window_;
  std::deque<Gesture> buf_;
};

}  // namespace hgp::gesture
