#pragma once

#include <cmath>

#include <opencv2/core.hpp>

#include "hand_gesture_perception/gesture/gesture_smoother.hpp"
#include "hand_gesture_perception/tracking/constant_velocity_kalman_filter.hpp"

namespace hgp::tracking
{

// Lives for the whole session; re-seeded when detection resumes
struct TrackState
{
  explicit TrackState(size_t smoother_window, int fallback_size)
  : last_size(fallback_size, fallback_size),
    smoother(smoother_window)
  {
  }

  bool initialized() const {return kf.initialized();}

  // Region around the current estimate, sized like the last detection
  cv::Rect estimatedRegion() const
  {
    const Eigen::Vector2d p = kf.position();
    return cv::Rect(
      static_cast<int>(std::lround(p.x() - last_size.width / 2.0)),
      static_cast<int>(std::lround(p.y() - last_size.height / 2.0)),
      last_size.width,
      last_size.height);
  }

  ConstantVelocityKalmanFilter kf;   // owns state + covariance

  // Fallback crop size while detection is momentarily lost
  cv::Size last_size;

  gesture::GestureSmoother smoother;

  int frames_seen{0};
  int frames_missed{0};
};

}  // namespace hgp::tracking
