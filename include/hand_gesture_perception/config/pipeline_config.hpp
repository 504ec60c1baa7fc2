#pragma once

#include <string>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "hand_gesture_perception/consensus/round_capture.hpp"
#include "hand_gesture_perception/consensus/sequence_lock_params.hpp"
#include "hand_gesture_perception/segmentation/color_range.hpp"
#include "hand_gesture_perception/tracking/tracker_params.hpp"

namespace hgp
{

struct PipelineParams
{
  std::vector<segmentation::TrackedColor> colors;

  // Two of the configured colors
  std::string player1;
  std::string player2;

  tracking::TrackerParams tracker;

  bool password_enabled{true};
  consensus::SequenceLockParams password;

  consensus::RoundParams game;

  bool publish_masks{false};
};

// Throws std::invalid_argument on an incomplete or inconsistent setup
void validate(const PipelineParams & params);

/**
 * @brief Declares and reads all pipeline parameters on a node
 *
 *   colors.names                : [red, blue]
 *   colors.<name>.lower/.upper  : [h, s, v]        single range, or
 *   colors.<name>.ranges        : [h,s,v, h,s,v, ...] lower/upper pairs
 *   game.players                : two color names (default: first two colors)
 *   password.steps              : ["ROCK+SCISSORS", ...]
 *   password.confirm_pair       : "ROCK+ROCK"
 *   tracker.*, game.*, password.*, debug.publish_masks
 *
 * Throws std::invalid_argument on malformed values.
 */
class PipelineConfig
{
public:
  explicit PipelineConfig(rclcpp::Node & node);

  const PipelineParams & params() const {return params_;}

private:
  void loadColors(rclcpp::Node & node);
  void loadTracker(rclcpp::Node & node);
  void loadPassword(rclcpp::Node & node);
  void loadGame(rclcpp::Node & node);

private:
  PipelineParams params_;
};

}  // namespace hgp
