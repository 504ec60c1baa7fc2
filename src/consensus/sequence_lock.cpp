#include "hand_gesture_perception/consensus/sequence_lock.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace hgp::consensus
{

namespace
{

const SequenceLockParams & validated(const SequenceLockParams & params)
{
  validate(params);
  return params;
}

}  // namespace

void validate(const SequenceLockParams & p)
{
  if (p.stable_required_frames < 1) {
    throw std::invalid_argument("password.stable_required_frames must be >= 1");
  }
  if (p.settle_frames_after_step < 0) {
    throw std::invalid_argument("password.settle_frames_after_step must be >= 0");
  }
  if (p.wrong_flash_frames < 0) {
    throw std::invalid_argument("password.wrong_flash_frames must be >= 0");
  }
  if (p.timeout_s < 0.0) {
    throw std::invalid_argument("password.timeout_s must be >= 0");
  }
}

std::string toString(LockPhase phase)
{
  switch (phase) {
    case LockPhase::ARM:
      return "ARM";
    case LockPhase::SELECT:
      return "SELECT";
    case LockPhase::CONFIRM:
      return "CONFIRM";
    case LockPhase::DONE:
      return "DONE";
  }
  return "UNKNOWN";
}

std::string toString(LockEvent event)
{
  switch (event) {
    case LockEvent::ARMED:
      return "armed";
    case LockEvent::SELECTED:
      return "selected";
    case LockEvent::CONFIRMED:
      return "confirmed";
    case LockEvent::WRONG:
      return "wrong";
    case LockEvent::UNLOCKED:
      return "unlocked";
    case LockEvent::NONE:
    default:
      return "none";
  }
}

SequenceLock::SequenceLock(
  const SequenceLockParams & params,
  rclcpp::Logger logger)
: params_(validated(params)),
  logger_(make_child_logger(logger, "sequence_lock")),
  debounce_(params_.stable_required_frames)
{
  reset();

  HGP_LOG(
    logger_,
    "SequenceLock initialized: %zu steps, confirm=%s, stable=%d, settle=%d",
    params_.steps.size(),
    pairToString(params_.confirm_pair).c_str(),
    params_.stable_required_frames,
    params_.settle_frames_after_step);
}

void SequenceLock::reset()
{
  phase_ = LockPhase::ARM;
  step_index_ = 0;
  selected_.reset();

  debounce_.reset();
  cooldown_remaining_ = 0;

  last_pair_ = ObservedPair{};
  last_event_ = LockEvent::NONE;
}

bool SequenceLock::update(const Observation & first, const Observation & second)
{
  return update(observedPair(first, second));
}

bool SequenceLock::update(const ObservedPair & pair)
{
  last_event_ = LockEvent::NONE;

  if (wrong_flash_remaining_ > 0) {
    wrong_flash_remaining_--;
  }

  last_pair_ = pair;

  // Between transitions: keep displaying, ignore input
  if (cooldown_remaining_ > 0) {
    cooldown_remaining_--;
    return phase_ == LockPhase::DONE;
  }

  switch (phase_) {
    case LockPhase::ARM:
      return stepArm(pair);
    case LockPhase::SELECT:
      return stepSelect(pair);
    case LockPhase::CONFIRM:
      return stepConfirm(pair);
    case LockPhase::DONE:
      return true;
  }

  return false;
}

bool SequenceLock::feed(const std::optional<GesturePair> & value)
{
  debounce_.update(value);
  return debounce_.isStable();
}

// --------------------------------------------------
// ARM: confirm_pair stable to start
// --------------------------------------------------
bool SequenceLock::stepArm(const ObservedPair & pair)
{
  const bool match = pairEquals(pair, params_.confirm_pair);

  if (!feed(match ? std::optional<GesturePair>(params_.confirm_pair) : std::nullopt)) {
    return false;
  }

  if (params_.steps.empty()) {
    transition(LockPhase::DONE, LockEvent::UNLOCKED);
    return true;
  }

  transition(LockPhase::SELECT, LockEvent::ARMED);
  startCooldown();
  return false;
}

// --------------------------------------------------
// SELECT: any stable pair except confirm_pair
// --------------------------------------------------
bool SequenceLock::stepSelect(const ObservedPair & pair)
{
  if (step_index_ >= params_.steps.size()) {
    transition(LockPhase::DONE, LockEvent::UNLOCKED);
    return true;
  }

  std::optional<GesturePair> candidate;
  if (bothPresent(pair) && !pairEquals(pair, params_.confirm_pair)) {
    candidate = GesturePair(*pair.first, *pair.second);
  }

  if (!feed(candidate)) {
    return false;
  }

  selected_ = candidate;
  transition(LockPhase::CONFIRM, LockEvent::SELECTED);
  startCooldown();
  return false;
}

// --------------------------------------------------
// CONFIRM: confirm_pair stable, then check the selection
// --------------------------------------------------
bool SequenceLock::stepConfirm(const ObservedPair & pair)
{
  const bool match = pairEquals(pair, params_.confirm_pair);

  if (!feed(match ? std::optional<GesturePair>(params_.confirm_pair) : std::nullopt)) {
    return false;
  }

  std::optional<GesturePair> expected;
  if (step_index_ < params_.steps.size()) {
    expected = params_.steps[step_index_];
  }

  if (!expected || !selected_ || *selected_ != *expected) {
    wrongAndReset(selected_, expected);
    return false;
  }

  selected_.reset();
  step_index_++;

  if (step_index_ >= params_.steps.size()) {
    transition(LockPhase::DONE, LockEvent::UNLOCKED);
    return true;
  }

  transition(LockPhase::SELECT, LockEvent::CONFIRMED);
  startCooldown();
  return false;
}

void SequenceLock::transition(LockPhase next, LockEvent event)
{
  HGP_LOG(
    logger_,
    "%s -> %s (%s, step %zu/%zu)",
    toString(phase_).c_str(),
    toString(next).c_str(),
    toString(event).c_str(),
    std::min(step_index_ + 1, std::max<size_t>(params_.steps.size(), 1)),
    params_.steps.size());

  phase_ = next;
  last_event_ = event;
  debounce_.reset();
}

void SequenceLock::startCooldown()
{
  cooldown_remaining_ = std::max(0, params_.settle_frames_after_step);
}

void SequenceLock::wrongAndReset(
  const std::optional<GesturePair> & selected,
  const std::optional<GesturePair> & expected)
{
  HGP_LOG_WARN(
    logger_,
    "Wrong confirmation at step %zu/%zu, back to ARM",
    step_index_ + 1,
    params_.steps.size());

  last_wrong_ = WrongAttempt{selected, expected};
  wrong_flash_remaining_ = params_.wrong_flash_frames;

  reset();
  last_event_ = LockEvent::WRONG;
  startCooldown();
}

std::string SequenceLock::statusText() const
{
  if (wrong_flash_remaining_ > 0) {
    return "PASSWORD WRONG";
  }

  const size_t total = params_.steps.size();
  const size_t step_num = std::min(step_index_ + 1, std::max<size_t>(total, 1));
  const int need = params_.stable_required_frames;

  std::ostringstream oss;

  switch (phase_) {
    case LockPhase::ARM:
      oss << "LOCK | SHOW " << pairToString(params_.confirm_pair)
          << " TO START (" << streak() << "/" << need << ")";
      break;

    case LockPhase::SELECT:
      oss << "LOCK | STEP " << step_num << "/" << total
          << " | SELECT GESTURE (" << streak() << "/" << need << ")";
      break;

    case LockPhase::CONFIRM:
      oss << "LOCK | STEP " << step_num << "/" << total
          << " | SELECTED " << (selected_ ? pairToString(*selected_) : "?+?")
          << " | CONFIRM " << pairToString(params_.confirm_pair)
          << " (" << streak() << "/" << need << ")";
      break;

    case LockPhase::DONE:
      oss << "LOCK | UNLOCKED";
      break;
  }

  return oss.str();
}

}  // namespace hgp::consensus
