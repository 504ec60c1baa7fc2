#include "hand_gesture_perception/tracking/color_tracker.hpp"

#include <set>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

namespace hgp::tracking
{

namespace
{

const TrackerParams & validated(const TrackerParams & params)
{
  validate(params);
  return params;
}

}  // namespace

ColorTracker::ColorTracker(
  std::vector<segmentation::TrackedColor> colors,
  const TrackerParams & params,
  rclcpp::Logger logger)
: params_(validated(params)),
  logger_(make_child_logger(logger, "tracker")),
  colors_(std::move(colors)),
  segmenter_(params_.mask_kernel, params_.mask_iterations),
  blob_detector_(params_.min_area_detect),
  classifier_(
    segmenter_,
    params_.min_area_contour_roi,
    params_.roi_pad,
    gesture::DefectThresholds{params_.defect_angle_deg, params_.defect_depth})
{
  if (colors_.empty()) {
    throw std::invalid_argument("ColorTracker needs at least one tracked color");
  }

  std::set<std::string> seen;
  for (const auto & c : colors_) {
    segmentation::validateTrackedColor(c);

    if (!seen.insert(c.name).second) {
      throw std::invalid_argument("Duplicate tracked color '" + c.name + "'");
    }

    tracks_.emplace(
      c.name,
      TrackState(
        static_cast<size_t>(params_.smoother_window),
        params_.fallback_size));
  }

  buildNoiseModels();

  HGP_LOG(
    logger_,
    "ColorTracker initialized with %zu colors (min_area=%.0f, roi_min_area=%.0f)",
    colors_.size(),
    params_.min_area_detect,
    params_.min_area_contour_roi);
}

void ColorTracker::buildNoiseModels()
{
  Q_ = ConstantVelocityKalmanFilter::StateMatrix::Identity() * params_.kalman_q;
  R_ = ConstantVelocityKalmanFilter::MeasMatrix::Identity() * params_.kalman_r;
}

std::vector<std::string> ColorTracker::colorNames() const
{
  std::vector<std::string> names;
  names.reserve(colors_.size());
  for (const auto & c : colors_) {
    names.push_back(c.name);
  }
  return names;
}

const TrackState & ColorTracker::track(const std::string & name) const
{
  const auto it = tracks_.find(name);
  if (it == tracks_.end()) {
    throw std::out_of_range("Unknown tracked color '" + name + "'");
  }
  return it->second;
}

void ColorTracker::reset()
{
  for (auto & kv : tracks_) {
    kv.second = TrackState(
      static_cast<size_t>(params_.smoother_window),
      params_.fallback_size);
  }
  frame_count_ = 0;

  HGP_LOG(logger_, "ColorTracker reset");
}

TrackingResult ColorTracker::update(const cv::Mat & frame_bgr, bool return_masks)
{
  frame_count_++;

  TrackingResult result;
  if (return_masks) {
    result.masks = MaskMap{};
  }

  // --------------------------------------------------
  // Unusable frame: keep predicting, report nothing
  // --------------------------------------------------
  cv::Mat hsv;
  const bool usable = !frame_bgr.empty() && frame_bgr.type() == CV_8UC3;

  if (usable) {
    cv::cvtColor(frame_bgr, hsv, cv::COLOR_BGR2HSV);
  } else {
    HGP_LOG_WARN(
      logger_,
      "Frame %lu unusable (empty=%d type=%d), treating as no detections",
      static_cast<unsigned long>(frame_count_),
      frame_bgr.empty() ? 1 : 0,
      frame_bgr.empty() ? -1 : frame_bgr.type());
  }

  for (const auto & color : colors_) {
    TrackState & state = tracks_.at(color.name);

    cv::Mat mask;
    result.observations[color.name] = updateColor(
      usable ? frame_bgr : cv::Mat(),
      hsv,
      color,
      state,
      return_masks ? &mask : nullptr);

    if (return_masks) {
      (*result.masks)[color.name] = mask;
    }
  }

  return result;
}

Observation ColorTracker::updateColor(
  const cv::Mat & frame_bgr,
  const cv::Mat & hsv,
  const segmentation::TrackedColor & color,
  TrackState & state,
  cv::Mat * mask_out)
{
  Observation obs;

  // --------------------------------------------------
  // Detection
  // --------------------------------------------------
  std::optional<segmentation::Blob> blob;
  if (!hsv.empty()) {
    cv::Mat mask = segmenter_.segment(hsv, color);
    blob = blob_detector_.detect(mask);

    if (mask_out) {
      *mask_out = mask;
    }
  }

  // --------------------------------------------------
  // Reacquisition after a gap: drop the stale velocity
  // --------------------------------------------------
  const bool reacquired =
    blob && state.kf.initialized() &&
    state.frames_seen == 0 && state.frames_missed > 0;

  if (reacquired) {
    HGP_LOG(
      logger_,
      "Color '%s' reacquired after %d frames, re-seeding",
      color.name.c_str(), state.frames_missed);
    state.kf.reset();
  }

  // --------------------------------------------------
  // Prediction (unconditional)
  // --------------------------------------------------
  const bool was_initialized = state.kf.initialized();

  state.kf.predict(params_.kalman_dt, Q_);

  if (was_initialized) {
    const Eigen::Vector2d p = state.kf.position();
    obs.center_predicted = cv::Point2d(p.x(), p.y());
  }

  if (!blob) {
    if (state.frames_missed == 0 && state.frames_seen > 0) {
      HGP_LOG(logger_, "Color '%s' lost", color.name.c_str());
    }
    state.frames_missed++;
    state.frames_seen = 0;

    if (was_initialized) {
      obs.region_predicted = state.estimatedRegion();
    }

    HGP_LOG_DEBUG(logger_, "%s: %s", color.name.c_str(), obs.to_string().c_str());
    return obs;
  }

  // --------------------------------------------------
  // Correction
  // --------------------------------------------------
  const Eigen::Vector2d z(blob->center.x, blob->center.y);

  if (!was_initialized) {
    // Seed from the measurement instead of correcting from a zero prior
    state.kf.initialize(z);
    if (!reacquired) {
      HGP_LOG(
        logger_,
        "Color '%s' acquired @ [%.1f %.1f]",
        color.name.c_str(), z.x(), z.y());
    }
  }

  state.kf.update(z, R_);

  if (!was_initialized) {
    const Eigen::Vector2d p = state.kf.position();
    obs.center_predicted = cv::Point2d(p.x(), p.y());
  }

  state.last_size = blob->bbox.size();
  state.frames_seen++;
  state.frames_missed = 0;

  obs.region_predicted = state.estimatedRegion();

  obs.detected = true;
  obs.bbox = blob->bbox;
  obs.center_measured = blob->center;

  // --------------------------------------------------
  // Gesture
  // --------------------------------------------------
  const MaybeGesture raw = classifier_.classify(frame_bgr, color, blob->bbox);
  if (raw) {
    obs.gesture = state.smoother.update(*raw);
  }

  HGP_LOG_DEBUG(logger_, "%s: %s", color.name.c_str(), obs.to_string().c_str());
  return obs;
}

}  // namespace hgp::tracking
