#include <algorithm>
#include <map>
#include <memory>
#include <string>

#include <rclcpp/rclcpp.hpp>

#include <sensor_msgs/msg/image.hpp>
#include <std_msgs/msg/string.hpp>
#include <vision_msgs/msg/detection2_d_array.hpp>

#include <cv_bridge/cv_bridge.h>
#include <opencv2/core.hpp>

#include "hand_gesture_perception/config/pipeline_config.hpp"
#include "hand_gesture_perception/consensus/round_capture.hpp"
#include "hand_gesture_perception/consensus/sequence_lock.hpp"
#include "hand_gesture_perception/game/countdown.hpp"
#include "hand_gesture_perception/game/round_decider.hpp"
#include "hand_gesture_perception/tracking/color_tracker.hpp"
#include "hand_gesture_perception/utils/img_utils.hpp"

using hgp::PipelineConfig;
using hgp::PipelineParams;
using hgp::TrackingResult;
using hgp::consensus::LockEvent;
using hgp::consensus::RoundCapture;
using hgp::consensus::SequenceLock;
using hgp::game::RoundDecider;
using hgp::tracking::ColorTracker;

namespace
{

enum class SessionPhase
{
  UNLOCK,
  HIDE_HANDS,
  COUNTDOWN,
  STABILIZE
};

const char * toString(SessionPhase p)
{
  switch (p) {
    case SessionPhase::UNLOCK:
      return "UNLOCK";
    case SessionPhase::HIDE_HANDS:
      return "HIDE_HANDS";
    case SessionPhase::COUNTDOWN:
      return "COUNTDOWN";
    case SessionPhase::STABILIZE:
      return "STABILIZE";
  }
  return "UNKNOWN";
}

}  // namespace

class GesturePipelineNode : public rclcpp::Node
{
public:
  GesturePipelineNode()
  : Node("gesture_pipeline_node")
  {
    // =========================================
    // Load parameters via PipelineConfig
    // =========================================
    PipelineConfig config(*this);
    params_ = config.params();

    tracker_ = std::make_unique<ColorTracker>(
      params_.colors, params_.tracker, get_logger());

    lock_ = std::make_unique<SequenceLock>(
      params_.password, get_logger());

    capture_ = std::make_unique<RoundCapture>(params_.game);

    rounds_ = std::make_unique<RoundDecider>(
      params_.player1, params_.player2, get_logger());

    // =========================================
    // Publishers
    // =========================================
    observations_pub_ =
      create_publisher<vision_msgs::msg::Detection2DArray>(
      "~/observations", 10);

    predictions_pub_ =
      create_publisher<vision_msgs::msg::Detection2DArray>(
      "~/predictions", 10);

    status_pub_ =
      create_publisher<std_msgs::msg::String>("~/status", 10);

    round_pub_ =
      create_publisher<std_msgs::msg::String>("~/round_result", 10);

    if (params_.publish_masks) {
      for (const auto & name : tracker_->colorNames()) {
        mask_pubs_[name] =
          create_publisher<sensor_msgs::msg::Image>("~/mask/" + name, 1);
      }
    }

    // =========================================
    // Frames, in arrival order
    // =========================================
    image_sub_ =
      create_subscription<sensor_msgs::msg::Image>(
      "image",
      rclcpp::SensorDataQoS(),
      std::bind(
        &GesturePipelineNode::imageCallback,
        this,
        std::placeholders::_1));

    // Both stamps must carry the node clock type before any subtraction
    const rclcpp::Time start = now();
    last_lock_progress_ = start;

    enter(
      params_.password_enabled ? SessionPhase::UNLOCK : SessionPhase::HIDE_HANDS,
      start);

    RCLCPP_INFO(
      get_logger(),
      "GesturePipelineNode ready. players=%s vs %s, password=%s",
      params_.player1.c_str(),
      params_.player2.c_str(),
      params_.password_enabled ? "on" : "off");
  }

private:
  // ==========================================================
  // Frame callback
  // ==========================================================
  void imageCallback(const sensor_msgs::msg::Image::ConstSharedPtr msg)
  {
    cv::Mat frame;
    try {
      frame = hgp::toCvBgr(*msg);
    } catch (const cv_bridge::Exception & e) {
      // Still run the pipeline so counters advance like a frame without hands
      RCLCPP_WARN(
        get_logger(),
        "Frame conversion failed (%s), treating as empty frame",
        e.what());
    }

    const TrackingResult result =
      tracker_->update(frame, params_.publish_masks);

    const rclcpp::Time stamp = now();

    advance(result, stamp);

    publishObservations(result, msg->header);
    publishPredictions(result, msg->header);
    publishMasks(result, msg->header);
  }

  // ==========================================================
  // Session flow
  // ==========================================================
  void advance(const TrackingResult & result, const rclcpp::Time & stamp)
  {
    const auto & obs1 = result.at(params_.player1);
    const auto & obs2 = result.at(params_.player2);

    // A clock stepped backwards (system time jump, bag restart) re-anchors
    // every running interval instead of producing negative elapsed times
    if (stamp < phase_start_ || stamp < last_lock_progress_) {
      RCLCPP_WARN(
        get_logger(),
        "Clock moved backwards by %.2f s, restarting phase timers",
        (std::max(phase_start_, last_lock_progress_) - stamp).seconds());
      phase_start_ = stamp;
      last_lock_progress_ = stamp;
    }

    const double elapsed = (stamp - phase_start_).seconds();

    switch (phase_) {
      case SessionPhase::UNLOCK:
        {
          const bool ok = lock_->update(obs1, obs2);
          const LockEvent event = lock_->lastEvent();

          if (event != LockEvent::NONE) {
            last_lock_progress_ = stamp;
          }

          // Abandoned entry falls back to ARM
          if (!ok && lock_->phase() != hgp::consensus::LockPhase::ARM &&
            params_.password.timeout_s > 0.0 &&
            (stamp - last_lock_progress_).seconds() > params_.password.timeout_s)
          {
            RCLCPP_WARN(
              get_logger(),
              "Password entry timed out after %.1f s, resetting lock",
              params_.password.timeout_s);
            lock_->reset();
            last_lock_progress_ = stamp;
          }

          publishStatus(lock_->statusText());

          if (ok) {
            RCLCPP_INFO(get_logger(), "Password accepted");
            enter(SessionPhase::HIDE_HANDS, stamp);
          }
          break;
        }

      case SessionPhase::HIDE_HANDS:
        {
          capture_->updateHidden(obs1, obs2);

          publishStatus(
            "Hide hands. " + std::to_string(capture_->hiddenStreak()) + "/" +
            std::to_string(params_.game.hide_required_frames));

          if (capture_->handsHidden()) {
            enter(SessionPhase::COUNTDOWN, stamp);
          }
          break;
        }

      case SessionPhase::COUNTDOWN:
        {
          const int step =
            hgp::game::countdownStep(elapsed, params_.game.countdown_step_s);

          if (step >= hgp::game::kCountdownSteps) {
            enter(SessionPhase::STABILIZE, stamp);
            break;
          }

          publishStatus(hgp::game::countdownWord(step));
          break;
        }

      case SessionPhase::STABILIZE:
        {
          const bool captured = capture_->update(obs1, obs2);
          const bool timed_out = elapsed > params_.game.post_shoot_timeout_s;

          publishStatus(
            "Stabilizing. " +
            params_.player1 + ":" + std::to_string(capture_->streakFirst()) + "/" +
            std::to_string(params_.game.stable_required_frames) + " " +
            params_.player2 + ":" + std::to_string(capture_->streakSecond()) + "/" +
            std::to_string(params_.game.stable_required_frames));

          if (captured || timed_out) {
            if (timed_out && !captured) {
              RCLCPP_WARN(
                get_logger(),
                "No stable gestures after %.1f s, deciding on last seen",
                params_.game.post_shoot_timeout_s);
            }

            const auto choices = capture_->choices();
            const auto record = rounds_->addRound(choices.first, choices.second);

            std_msgs::msg::String out;
            out.data = record.to_string();
            round_pub_->publish(out);

            enter(SessionPhase::HIDE_HANDS, stamp);
          }
          break;
        }
    }
  }

  void enter(SessionPhase next, const rclcpp::Time & stamp)
  {
    RCLCPP_INFO(
      get_logger(),
      "Session %s -> %s",
      toString(phase_),
      toString(next));

    switch (next) {
      case SessionPhase::UNLOCK:
        lock_->reset();
        last_lock_progress_ = stamp;
        break;
      case SessionPhase::HIDE_HANDS:
      case SessionPhase::STABILIZE:
        capture_->reset();
        break;
      case SessionPhase::COUNTDOWN:
        break;
    }

    phase_ = next;
    phase_start_ = stamp;
  }

  // ==========================================================
  // Output
  // ==========================================================
  void publishStatus(const std::string & text)
  {
    std_msgs::msg::String out;
    out.data = text;
    status_pub_->publish(out);
  }

  void publishObservations(
    const TrackingResult & result,
    const std_msgs::msg::Header & header)
  {
    vision_msgs::msg::Detection2DArray out;
    out.header = header;

    for (const auto & kv : result.observations) {
      const auto & obs = kv.second;
      if (!obs.detected || !obs.bbox) {
        continue;
      }

      vision_msgs::msg::Detection2D det;
      det.header = header;
      det.id = kv.first;

      det.bbox.center.position.x = obs.bbox->x + obs.bbox->width / 2.0;
      det.bbox.center.position.y = obs.bbox->y + obs.bbox->height / 2.0;
      det.bbox.size_x = obs.bbox->width;
      det.bbox.size_y = obs.bbox->height;

      vision_msgs::msg::ObjectHypothesisWithPose hyp;
      hyp.hypothesis.class_id = hgp::gestureToString(obs.gesture);
      hyp.hypothesis.score = obs.gesture ? 1.0 : 0.0;

      if (obs.center_predicted) {
        hyp.pose.pose.position.x = obs.center_predicted->x;
        hyp.pose.pose.position.y = obs.center_predicted->y;
      }

      det.results.push_back(hyp);
      out.detections.push_back(det);
    }

    observations_pub_->publish(out);
  }

  // Filter estimate for every tracked color, detected or not
  void publishPredictions(
    const TrackingResult & result,
    const std_msgs::msg::Header & header)
  {
    vision_msgs::msg::Detection2DArray out;
    out.header = header;

    for (const auto & kv : result.observations) {
      const auto & region = kv.second.region_predicted;
      if (!region) {
        continue;
      }

      vision_msgs::msg::Detection2D det;
      det.header = header;
      det.id = kv.first;

      det.bbox.center.position.x = region->x + region->width / 2.0;
      det.bbox.center.position.y = region->y + region->height / 2.0;
      det.bbox.size_x = region->width;
      det.bbox.size_y = region->height;

      out.detections.push_back(det);
    }

    predictions_pub_->publish(out);
  }

  void publishMasks(
    const TrackingResult & result,
    const std_msgs::msg::Header & header)
  {
    if (!result.masks) {
      return;
    }

    for (const auto & kv : *result.masks) {
      const auto it = mask_pubs_.find(kv.first);
      if (it == mask_pubs_.end() || kv.second.empty()) {
        continue;
      }
      it->second->publish(*hgp::toMonoImageMsg(kv.second, header));
    }
  }

  // ==========================================================
  // Members
  // ==========================================================
  PipelineParams params_;

  std::unique_ptr<ColorTracker> tracker_;
  std::unique_ptr<SequenceLock> lock_;
  std::unique_ptr<RoundCapture> capture_;
  std::unique_ptr<RoundDecider> rounds_;

  SessionPhase phase_{SessionPhase::UNLOCK};
  rclcpp::Time phase_start_;
  rclcpp::Time last_lock_progress_;

  rclcpp::Subscription<sensor_msgs::msg::Image>::SharedPtr image_sub_;
  rclcpp::Publisher<vision_msgs::msg::Detection2DArray>::SharedPtr observations_pub_;
  rclcpp::Publisher<vision_msgs::msg::Detection2DArray>::SharedPtr predictions_pub_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr status_pub_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr round_pub_;
  std::map<std::string, rclcpp::Publisher<sensor_msgs::msg::Image>::SharedPtr> mask_pubs_;
};

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);

  std::shared_ptr<GesturePipelineNode> node;
  try {
    node = std::make_shared<GesturePipelineNode>();
  } catch (const std::exception & e) {
    RCLCPP_FATAL(
      rclcpp::get_logger("gesture_pipeline_node"),
      "Configuration error: %s",
      e.what());
    rclcpp::shutdown();
    return 1;
  }

  rclcpp::spin(node);

  rclcpp::shutdown();
  return 0;
}
