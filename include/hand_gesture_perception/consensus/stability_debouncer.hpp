#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace hgp::consensus
{

/**
 * @brief "Same value for N consecutive updates" counter
 *
 *   value present and equal to last  -> streak += 1
 *   value present but different      -> streak = 1, last = value
 *   value absent                     -> streak = 0, last = none
 *
 * Stable once streak >= required. Shared by round capture (per player
 * gesture) and the sequence lock (pair against target).
 */
template<typename T, typename Equal = std::equal_to<T>>
class StabilityDebouncer
{
public:
  explicit StabilityDebouncer(int required, Equal equal = Equal())
  : required_(required),
    equal_(std::move(equal))
  {
    if (required < 1) {
      throw std::invalid_argument(
              "stable frame count must be >= 1, got " + std::to_string(required));
    }
  }

  int update(const std::optional<T> & value)
  {
    if (value && last_ && equal_(*value, *last_)) {
      streak_++;
    } else {
      streak_ = value ? 1 : 0;
      last_ = value;
    }
    return streak_;
  }

  bool isStable() const {return streak_ >= required_;}

  void reset()
  {
    last_.reset();
    streak_ = 0;
  }

  int streak() const {return streak_;}
  int required() const {return required_;}
  const std::optional<T> & lastValue() const {return last_;}

private:
  int required_;
  Equal equal_;

  std::optional<T> last_;
  int streak_{0};
};

}  // namespace hgp::consensus
