#include "hand_gesture_perception/consensus/round_capture.hpp"

#include <stdexcept>

namespace hgp::consensus
{

namespace
{

const RoundParams & validated(const RoundParams & params)
{
  validate(params);
  return params;
}

}  // namespace

void validate(const RoundParams & p)
{
  if (p.hide_required_frames < 1) {
    throw std::invalid_argument("game.hide_required_frames must be >= 1");
  }
  if (p.stable_required_frames < 1) {
    throw std::invalid_argument("game.stable_required_frames must be >= 1");
  }
  if (p.countdown_step_s < 0.0 || p.post_shoot_timeout_s < 0.0) {
    throw std::invalid_argument("game timings must be >= 0");
  }
}

RoundCapture::RoundCapture(const RoundParams & params)
: params_(validated(params)),
  hidden_(params_.hide_required_frames),
  first_(params_.stable_required_frames),
  second_(params_.stable_required_frames)
{
}

bool RoundCapture::updateHidden(const Observation & first, const Observation & second)
{
  const bool both_hidden = !first.detected && !second.detected;
  hidden_.update(both_hidden ? std::optional<bool>(true) : std::nullopt);
  return hidden_.isStable();
}

bool RoundCapture::update(const Observation & first, const Observation & second)
{
  return update(observedPair(first, second));
}

bool RoundCapture::update(const ObservedPair & pair)
{
  first_.update(pair.first);
  second_.update(pair.second);
  return captured();
}

void RoundCapture::reset()
{
  hidden_.reset();
  first_.reset();
  second_.reset();
}

}  // namespace hgp::consensus
