#pragma once

#include <map>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <rclcpp/logger.hpp>

#include "hand_gesture_perception/gesture/gesture_classifier.hpp"
#include "hand_gesture_perception/logger.hpp"
#include "hand_gesture_perception/observation.hpp"
#include "hand_gesture_perception/segmentation/blob_detector.hpp"
#include "hand_gesture_perception/segmentation/color_range.hpp"
#include "hand_gesture_perception/segmentation/color_segmenter.hpp"
#include "hand_gesture_perception/tracking/track_state.hpp"
#include "hand_gesture_perception/tracking/tracker_params.hpp"

namespace hgp::tracking
{

/**
 * @brief Per-frame multi-color hand tracker
 *
 * One TrackState per configured color, created at construction and kept for
 * the whole session. Every update runs, per color:
 *   segment -> largest blob -> Kalman predict/correct -> ROI gesture -> vote
 *
 * Colors are independent of each other; frames must arrive in order.
 */
class ColorTracker
{
public:
  // Throws std::invalid_argument on an empty color list, a duplicated name,
  // a malformed range or invalid params
  ColorTracker(
    std::vector<segmentation::TrackedColor> colors,
    const TrackerParams & params,
    rclcpp::Logger logger);

  // frame_bgr: CV_8UC3. An empty or non-BGR frame is handled like a frame
  // without detections (filters still predict).
  TrackingResult update(const cv::Mat & frame_bgr, bool return_masks = false);

  // Drop all track state (filters, smoothers, fallback sizes)
  void reset();

  const std::vector<segmentation::TrackedColor> & colors() const {return colors_;}
  std::vector<std::string> colorNames() const;

  // Throws std::out_of_range for an unknown color
  const TrackState & track(const std::string & name) const;

  const TrackerParams & params() const {return params_;}
  uint64_t frameCount() const {return frame_count_;}

private:
  Observation updateColor(
    const cv::Mat & frame_bgr,
    const cv::Mat & hsv,
    const segmentation::TrackedColor & color,
    TrackState & state,
    cv::Mat * mask_out);

  void buildNoiseModels();

private:
  TrackerParams params_;
  rclcpp::Logger logger_;

  std::vector<segmentation::TrackedColor> colors_;
  std::map<std::string, TrackState> tracks_;

  segmentation::ColorSegmenter segmenter_;
  segmentation::BlobDetector blob_detector_;
  gesture::GestureClassifier classifier_;

  ConstantVelocityKalmanFilter::StateMatrix Q_;
  ConstantVelocityKalmanFilter::MeasMatrix R_;

  uint64_t frame_count_{0};
};

}  // namespace hgp::tracking
