#include "hand_gesture_perception/segmentation/color_segmenter.hpp"

#include <stdexcept>
#include <string>

#include <opencv2/imgproc.hpp>

namespace hgp::segmentation
{

ColorSegmenter::ColorSegmenter(int kernel_size, int iterations)
: iterations_(iterations)
{
  if (kernel_size < 1) {
    throw std::invalid_argument(
            "mask kernel size must be >= 1, got " + std::to_string(kernel_size));
  }
  if (iterations < 0) {
    throw std::invalid_argument(
            "mask iterations must be >= 0, got " + std::to_string(iterations));
  }

  kernel_ = cv::getStructuringElement(
    cv::MORPH_RECT, cv::Size(kernel_size, kernel_size));
}

cv::Mat ColorSegmenter::rawMask(
  const cv::Mat & hsv,
  const TrackedColor & color) const
{
  cv::Mat mask = cv::Mat::zeros(hsv.size(), CV_8UC1);

  for (const auto & r : color.ranges) {
    cv::Mat m;
    cv::inRange(hsv, r.lowerScalar(), r.upperScalar(), m);
    cv::bitwise_or(mask, m, mask);
  }

  return mask;
}

void ColorSegmenter::clean(cv::Mat & mask) const
{
  if (mask.empty() || iterations_ == 0) {
    return;
  }

  cv::morphologyEx(
    mask, mask, cv::MORPH_OPEN, kernel_,
    cv::Point(-1, -1), iterations_);
  cv::morphologyEx(
    mask, mask, cv::MORPH_CLOSE, kernel_,
    cv::Point(-1, -1), iterations_);
}

cv::Mat ColorSegmenter::segment(
  const cv::Mat & hsv,
  const TrackedColor & color) const
{
  cv::Mat mask = rawMask(hsv, color);
  clean(mask);
  return mask;
}

}  // namespace hgp::segmentation
