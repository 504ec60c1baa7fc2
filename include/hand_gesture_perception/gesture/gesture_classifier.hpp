#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "hand_gesture_perception/gesture.hpp"
#include "hand_gesture_perception/segmentation/blob_detector.hpp"
#include "hand_gesture_perception/segmentation/color_range.hpp"
#include "hand_gesture_perception/segmentation/color_segmenter.hpp"

namespace hgp::gesture
{

constexpr int kMaxFingers = 5;

struct DefectThresholds
{
  double max_angle_deg{90.0};
  double min_depth{10.0};
};

/**
 * @brief Extended finger count from convexity defects
 *
 * A defect counts as a gap between two fingers when the angle at its
 * deepest point is sharper than max_angle_deg and its depth exceeds
 * min_depth. Fingers = gaps + 1 when at least one gap exists, else 0,
 * clamped to kMaxFingers. Contours with fewer than 3 hull points give 0.
 */
int countFingers(
  const segmentation::Contour & contour,
  const DefectThresholds & thresholds);

// <= 1 ROCK, 2 SCISSORS, >= 3 PAPER
Gesture fingersToGesture(int fingers);

class GestureClassifier
{
public:
  GestureClassifier(
    const segmentation::ColorSegmenter & segmenter,
    double min_area_contour_roi,
    int roi_pad,
    const DefectThresholds & thresholds);

  // frame_bgr: full frame. Re-segments a padded crop around bbox so that
  // background pixels of the global mask do not leak into the hull.
  MaybeGesture classify(
    const cv::Mat & frame_bgr,
    const segmentation::TrackedColor & color,
    const cv::Rect & bbox) const;

private:
  segmentation::ColorSegmenter segmenter_;
  double min_area_contour_roi_;
  int roi_pad_;
  DefectThresholds thresholds_;
};

}  // namespace hgp::gesture
