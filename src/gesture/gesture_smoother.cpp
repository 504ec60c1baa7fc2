#include "hand_gesture_perception/gesture/gesture_smoother.hpp"

#include <array>
#include <stdexcept>

namespace hgp::gesture
{

GestureSmoother::GestureSmoother(size_t window)
: window_(window)
{
  if (window == 0) {
    throw std::invalid_argument("GestureSmoother window must be >= 1");
  }
}

Gesture GestureSmoother::update(Gesture g)
{
  buf_.push_back(g);
  if (buf_.size() > window_) {
    buf_.pop_front();
  }

  return *current();
}

MaybeGesture GestureSmoother::current() const
{
  if (buf_.empty()) {
    return std::nullopt;
  }

  std::array<int, 3> counts{0, 0, 0};
  for (const auto g : buf_) {
    counts[static_cast<size_t>(g)]++;
  }

  // Walk in insertion order so the first-seen label wins a tie
  Gesture best = buf_.front();
  for (const auto g : buf_) {
    if (counts[static_cast<size_t>(g)] > counts[static_cast<size_t>(best)]) {
      best = g;
    }
  }

  return best;
}

}  // namespace hgp::gesture
