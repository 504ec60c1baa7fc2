#pragma once

#include <vector>

#include "hand_gesture_perception/segmentation/color_range.hpp"

namespace hgp::tracking
{

struct TrackerParams
{
  // ----------------------------
  // Detection
  // ----------------------------
  double min_area_detect{1500.0};       // global blob, px²
  double min_area_contour_roi{800.0};   // gesture contour inside the ROI, px²
  int mask_kernel{7};
  int mask_iterations{1};
  int roi_pad{20};

  // ----------------------------
  // Gesture
  // ----------------------------
  int smoother_window{10};
  double defect_angle_deg{90.0};
  double defect_depth{10.0};            // px (fixed-point depth / 256)

  // ----------------------------
  // Motion model
  // ----------------------------
  double kalman_dt{1.0};
  double kalman_q{1e-2};                // process noise, per state
  double kalman_r{1e-1};                // measurement noise, per axis

  // Fallback crop size while a track is lost
  int fallback_size{120};
};

// Throws std::invalid_argument on values no tracker can run with
void validate(const TrackerParams & params);

}  // namespace hgp::tracking
