#pragma once

#include <opencv2/core.hpp>

#include "hand_gesture_perception/segmentation/color_range.hpp"

namespace hgp::segmentation
{

class ColorSegmenter
{
public:
  ColorSegmenter(int kernel_size, int iterations);

  // hsv: CV_8UC3 in OpenCV HSV. Returns a cleaned CV_8UC1 mask (0 / 255).
  cv::Mat segment(const cv::Mat & hsv, const TrackedColor & color) const;

  // Union of the color's ranges, no cleaning
  cv::Mat rawMask(const cv::Mat & hsv, const TrackedColor & color) const;

  // Open (speckle removal) then close (hole filling), in place
  void clean(cv::Mat & mask) const;

private:
  cv::Mat kernel_;
  int iterations_;
};

}  // namespace hgp::segmentation
