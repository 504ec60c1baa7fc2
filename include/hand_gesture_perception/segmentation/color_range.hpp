#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace hgp::segmentation
{

// OpenCV HSV domain for 8-bit images
constexpr int kHueMax = 180;
constexpr int kSatMax = 255;
constexpr int kValMax = 255;

struct HsvRange
{
  std::array<int, 3> lower{0, 0, 0};
  std::array<int, 3> upper{kHueMax, kSatMax, kValMax};

  cv::Scalar lowerScalar() const {return cv::Scalar(lower[0], lower[1], lower[2]);}
  cv::Scalar upperScalar() const {return cv::Scalar(upper[0], upper[1], upper[2]);}
};

// One tracked hand. Red usually needs two ranges because hue wraps at 180.
struct TrackedColor
{
  std::string name;
  std::vector<HsvRange> ranges;
};

// Throws std::invalid_argument on an out-of-domain or inverted bound
void validateRange(const HsvRange & range, const std::string & color_name);

// Throws std::invalid_argument on an empty name, no ranges, or a bad range
void validateTrackedColor(const TrackedColor & color);

// Builds a range from a flat [h,s,v] pair as read from parameters
HsvRange makeRange(
  const std::vector<int64_t> & lower,
  const std::vector<int64_t> & upper,
  const std::string & color_name);

}  // namespace hgp::segmentation
