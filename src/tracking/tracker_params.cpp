#include "hand_gesture_perception/tracking/tracker_params.hpp"

#include <stdexcept>
#include <string>

namespace hgp::tracking
{

void validate(const TrackerParams & p)
{
  if (p.min_area_detect < 0.0 || p.min_area_contour_roi < 0.0) {
    throw std::invalid_argument("area thresholds must be >= 0");
  }
  if (p.mask_kernel < 1) {
    throw std::invalid_argument(
            "tracker.mask_kernel must be >= 1, got " + std::to_string(p.mask_kernel));
  }
  if (p.mask_iterations < 0) {
    throw std::invalid_argument("tracker.mask_iterations must be >= 0");
  }
  if (p.roi_pad < 0) {
    throw std::invalid_argument("tracker.roi_pad must be >= 0");
  }
  if (p.smoother_window < 1) {
    throw std::invalid_argument(
            "tracker.smoother_window must be >= 1, got " +
            std::to_string(p.smoother_window));
  }
  if (p.defect_angle_deg <= 0.0 || p.defect_angle_deg > 180.0) {
    throw std::invalid_argument("tracker.defect_angle_deg must be in (0, 180]");
  }
  if (p.defect_depth < 0.0) {
    throw std::invalid_argument("tracker.defect_depth must be >= 0");
  }
  if (p.kalman_dt <= 0.0) {
    throw std::invalid_argument("tracker.kalman_dt must be > 0");
  }
  if (p.kalman_q <= 0.0 || p.kalman_r <= 0.0) {
    throw std::invalid_argument("tracker.kalman_q and tracker.kalman_r must be > 0");
  }
  if (p.fallback_size < 1) {
    throw std::invalid_argument("tracker.fallback_size must be >= 1");
  }
}

}  // namespace hgp::tracking
