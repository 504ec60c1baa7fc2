#include "hand_gesture_perception/segmentation/color_range.hpp"

#include <stdexcept>

namespace hgp::segmentation
{

void validateRange(const HsvRange & range, const std::string & color_name)
{
  static constexpr std::array<int, 3> kMax{kHueMax, kSatMax, kValMax};
  static constexpr std::array<const char *, 3> kChannel{"h", "s", "v"};

  for (size_t c = 0; c < 3; ++c) {
    const int lo = range.lower[c];
    const int hi = range.upper[c];

    if (lo < 0 || hi < 0 || lo > kMax[c] || hi > kMax[c]) {
      throw std::invalid_argument(
              "Color '" + color_name + "': channel " + kChannel[c] +
              " bound out of range [0, " + std::to_string(kMax[c]) + "]");
    }

    if (lo > hi) {
      throw std::invalid_argument(
              "Color '" + color_name + "': channel " + kChannel[c] +
              " lower bound " + std::to_string(lo) +
              " exceeds upper bound " + std::to_string(hi));
    }
  }
}

void validateTrackedColor(const TrackedColor & color)
{
  if (color.name.empty()) {
    throw std::invalid_argument("Tracked color must have a name");
  }

  if (color.ranges.empty()) {
    throw std::invalid_argument(
            "Color '" + color.name + "' needs at least one HSV range");
  }

  for (const auto & r : color.ranges) {
    validateRange(r, color.name);
  }
}

HsvRange makeRange(
  const std::vector<int64_t> & lower,
  const std::vector<int64_t> & upper,
  const std::string & color_name)
{
  if (lower.size() != 3 || upper.size() != 3) {
    throw std::invalid_argument(
            "Color '" + color_name + "': lower/upper must have exactly 3 values [h, s, v]");
  }

  static constexpr std::array<int64_t, 3> kMax{kHueMax, kSatMax, kValMax};

  // Range-checked as int64 before narrowing
  HsvRange r;
  for (size_t c = 0; c < 3; ++c) {
    for (const int64_t v : {lower[c], upper[c]}) {
      if (v < 0 || v > kMax[c]) {
        throw std::invalid_argument(
                "Color '" + color_name + "': value " + std::to_string(v) +
                " out of range [0, " + std::to_string(kMax[c]) + "]");
      }
    }
    r.lower[c] = static_cast<int>(lower[c]);
    r.upper[c] = static_cast<int>(upper[c]);
  }

  validateRange(r, color_name);
  return r;
}

}  // namespace hgp::segmentation
