#include "hand_gesture_perception/gesture/gesture_classifier.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

#include "hand_gesture_perception/utils/img_utils.hpp"

namespace hgp::gesture
{

namespace
{

double pointDistance(const cv::Point & a, const cv::Point & b)
{
  const double dx = static_cast<double>(a.x - b.x);
  const double dy = static_cast<double>(a.y - b.y);
  return std::sqrt(dx * dx + dy * dy);
}

}  // namespace

int countFingers(
  const segmentation::Contour & contour,
  const DefectThresholds & thresholds)
{
  if (contour.size() < 3) {
    return 0;
  }

  std::vector<int> hull_idx;
  cv::convexHull(contour, hull_idx, false, false);

  if (hull_idx.size() < 3) {
    return 0;
  }

  std::vector<cv::Vec4i> defects;
  try {
    cv::convexityDefects(contour, hull_idx, defects);
  } catch (const cv::Exception &) {
    // Self-intersecting or non-monotonous hulls on ragged masks
    return 0;
  }

  int gaps = 0;

  for (const auto & d : defects) {
    const cv::Point & start = contour[d[0]];
    const cv::Point & end = contour[d[1]];
    const cv::Point & far = contour[d[2]];

    const double a = pointDistance(end, start);
    const double b = pointDistance(far, start);
    const double c = pointDistance(end, far);

    if (b * c == 0.0) {
      continue;
    }

    // Law of cosines at the deepest point
    const double cos_angle =
      std::clamp((b * b + c * c - a * a) / (2.0 * b * c), -1.0, 1.0);
    const double angle_deg = std::acos(cos_angle) * 180.0 / CV_PI;

    // Depth is fixed-point with 8 fractional bits
    const double depth = d[3] / 256.0;

    if (angle_deg < thresholds.max_angle_deg && depth > thresholds.min_depth) {
      gaps++;
    }
  }

  const int fingers = gaps > 0 ? gaps + 1 : 0;
  return std::min(fingers, kMaxFingers);
}

Gesture fingersToGesture(int fingers)
{
  if (fingers <= 1) {
    return Gesture::ROCK;
  }
  if (fingers == 2) {
    return Gesture::SCISSORS;
  }
  return Gesture::PAPER;
}

GestureClassifier::GestureClassifier(
  const segmentation::ColorSegmenter & segmenter,
  double min_area_contour_roi,
  int roi_pad,
  const DefectThresholds & thresholds)
: segmenter_(segmenter),
  min_area_contour_roi_(min_area_contour_roi),
  roi_pad_(roi_pad),
  thresholds_(thresholds)
{
}

MaybeGesture GestureClassifier::classify(
  const cv::Mat & frame_bgr,
  const segmentation::TrackedColor & color,
  const cv::Rect & bbox) const
{
  if (frame_bgr.empty()) {
    return std::nullopt;
  }

  const cv::Rect roi = paddedRoi(bbox, roi_pad_, frame_bgr.size());
  if (roi.area() == 0) {
    return std::nullopt;
  }

  cv::Mat roi_hsv;
  cv::cvtColor(frame_bgr(roi), roi_hsv, cv::COLOR_BGR2HSV);

  const cv::Mat roi_mask = segmenter_.segment(roi_hsv, color);

  const auto contour =
    segmentation::largestContour(roi_mask, min_area_contour_roi_);
  if (!contour) {
    return std::nullopt;
  }

  return fingersToGesture(countFingers(*contour, thresholds_));
}

}  // namespace hgp::gesture
