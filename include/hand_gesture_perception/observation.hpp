#pragma once

#include <map>
#include <optional>
#include <sstream>
#include <iomanip>
#include <string>

#include <opencv2/core.hpp>

#include "hand_gesture_perception/gesture.hpp"

namespace hgp
{

// Per tracked color, per frame. Produced fresh every frame.
struct Observation
{
  bool detected{false};

  std::optional<cv::Rect> bbox;
  std::optional<cv::Point2d> center_measured;

  // Present once the track is initialized, even while undetected
  std::optional<cv::Point2d> center_predicted;

  // Estimated hand region: filter position, last detected size
  std::optional<cv::Rect> region_predicted;

  MaybeGesture gesture;

  // Gesture only counts when the color is actually seen this frame
  MaybeGesture effectiveGesture() const
  {
    return detected ? gesture : std::nullopt;
  }

  std::string to_string() const
  {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);

    oss << "detected=" << (detected ? "yes" : "no");

    if (bbox) {
      oss << " bbox=[" << bbox->x << ", " << bbox->y << ", "
          << bbox->width << ", " << bbox->height << "]";
    }
    if (center_measured) {
      oss << " meas=(" << center_measured->x << ", " << center_measured->y << ")";
    }
    if (center_predicted) {
      oss << " pred=(" << center_predicted->x << ", " << center_predicted->y << ")";
    }
    if (region_predicted) {
      oss << " region=[" << region_predicted->x << ", " << region_predicted->y << ", "
          << region_predicted->width << ", " << region_predicted->height << "]";
    }
    oss << " gesture=" << gestureToString(gesture);

    return oss.str();
  }
};

using ObservationMap = std::map<std::string, Observation>;
using MaskMap = std::map<std::string, cv::Mat>;

// Masks are kept apart from observations and only filled on request
struct TrackingResult
{
  ObservationMap observations;
  std::optional<MaskMap> masks;

  const Observation & at(const std::string & color) const
  {
    return observations.at(color);
  }
};

inline ObservedPair observedPair(
  const Observation & first,
  const Observation & second)
{
  return {first.effectiveGesture(), second.effectiveGesture()};
}

}  // namespace hgp
