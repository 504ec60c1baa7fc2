#pragma once

#include <optional>
#include <string>
#include <utility>

#include <rclcpp/logger.hpp>

#include "hand_gesture_perception/consensus/sequence_lock_params.hpp"
#include "hand_gesture_perception/consensus/stability_debouncer.hpp"
#include "hand_gesture_perception/gesture.hpp"
#include "hand_gesture_perception/logger.hpp"
#include "hand_gesture_perception/observation.hpp"

namespace hgp::consensus
{

enum class LockPhase
{
  ARM,
  SELECT,
  CONFIRM,
  DONE
};

enum class LockEvent
{
  NONE,
  ARMED,
  SELECTED,
  CONFIRMED,
  WRONG,
  UNLOCKED
};

std::string toString(LockPhase phase);
std::string toString(LockEvent event);   // "armed", ..., "none"

struct WrongAttempt
{
  std::optional<GesturePair> selected;
  std::optional<GesturePair> expected;
};

/**
 * @brief Gesture-pair password
 *
 * Per step:
 *   ARM      confirm_pair stable                -> SELECT            (armed)
 *   SELECT   any stable pair != confirm_pair     -> CONFIRM           (selected)
 *   CONFIRM  confirm_pair stable, selected == expected
 *                                                -> SELECT or DONE    (confirmed / unlocked)
 *            confirm_pair stable, mismatch       -> ARM, step 0       (wrong)
 *   DONE     terminal
 *
 * The expected step is only consulted on confirmation, never while
 * selecting. A single wrong confirmation discards all progress. Every
 * transition starts a cooldown during which input is ignored.
 */
class SequenceLock
{
public:
  SequenceLock(const SequenceLockParams & params, rclcpp::Logger logger);

  // Call once per frame. True once DONE is reached and on every call after.
  bool update(const ObservedPair & pair);

  // Gestures only count for detected players
  bool update(const Observation & first, const Observation & second);

  // Back to ARM / step 0. Keeps configuration and the wrong-flash timer.
  void reset();

  // Display only; never reveals the expected step
  std::string statusText() const;

  LockPhase phase() const {return phase_;}
  LockEvent lastEvent() const {return last_event_;}
  bool unlocked() const {return phase_ == LockPhase::DONE;}

  size_t stepIndex() const {return step_index_;}
  size_t stepCount() const {return params_.steps.size();}
  const std::optional<GesturePair> & selectedPair() const {return selected_;}

  int streak() const {return debounce_.streak();}
  int cooldownRemaining() const {return cooldown_remaining_;}
  int wrongFlashRemaining() const {return wrong_flash_remaining_;}
  const std::optional<WrongAttempt> & lastWrong() const {return last_wrong_;}
  const ObservedPair & lastPair() const {return last_pair_;}

  const SequenceLockParams & params() const {return params_;}

private:
  bool stepArm(const ObservedPair & pair);
  bool stepSelect(const ObservedPair & pair);
  bool stepConfirm(const ObservedPair & pair);

  // Feeds the debouncer; true once the value has been stable long enough
  bool feed(const std::optional<GesturePair> & value);

  void transition(LockPhase next, LockEvent event);
  void startCooldown();
  void wrongAndReset(
    const std::optional<GesturePair> & selected,
    const std::optional<GesturePair> & expected);

private:
  SequenceLockParams params_;
  rclcpp::Logger logger_;

  LockPhase phase_{LockPhase::ARM};
  size_t step_index_{0};
  std::optional<GesturePair> selected_;

  StabilityDebouncer<GesturePair> debounce_;

  int cooldown_remaining_{0};
  int wrong_flash_remaining_{0};
  std::optional<WrongAttempt> last_wrong_;

  ObservedPair last_pair_;
  LockEvent last_event_{LockEvent::NONE};
};

}  // namespace hgp::consensus
