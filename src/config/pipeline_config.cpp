#include "hand_gesture_perception/config/pipeline_config.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace hgp
{

void validate(const PipelineParams & params)
{
  if (params.colors.empty()) {
    throw std::invalid_argument("colors.names must list at least one color");
  }

  if (params.colors.size() < 2) {
    throw std::invalid_argument(
            "Two players need two tracked colors, got " +
            std::to_string(params.colors.size()));
  }

  for (const auto & c : params.colors) {
    segmentation::validateTrackedColor(c);
  }

  const auto has_color = [&](const std::string & name) {
      return std::any_of(
        params.colors.begin(), params.colors.end(),
        [&](const segmentation::TrackedColor & c) {return c.name == name;});
    };

  if (!has_color(params.player1) || !has_color(params.player2)) {
    throw std::invalid_argument(
            "game.players must name configured colors, got '" +
            params.player1 + "', '" + params.player2 + "'");
  }
  if (params.player1 == params.player2) {
    throw std::invalid_argument("game.players must be two distinct colors");
  }

  tracking::validate(params.tracker);
  consensus::validate(params.password);
  consensus::validate(params.game);
}

PipelineConfig::PipelineConfig(rclcpp::Node & node)
{
  loadColors(node);
  loadTracker(node);
  loadPassword(node);
  loadGame(node);

  params_.publish_masks =
    node.declare_parameter<bool>("debug.publish_masks", false);

  validate(params_);
}

// ------------------------------------------------------------
// Colors
// ------------------------------------------------------------
void PipelineConfig::loadColors(rclcpp::Node & node)
{
  const auto names =
    node.declare_parameter<std::vector<std::string>>(
    "colors.names", std::vector<std::string>{"red", "blue"});

  std::set<std::string> seen;

  for (const auto & name : names) {
    if (!seen.insert(name).second) {
      throw std::invalid_argument("colors.names lists '" + name + "' twice");
    }

    const std::string prefix = "colors." + name;

    const auto ranges =
      node.declare_parameter<std::vector<int64_t>>(
      prefix + ".ranges", std::vector<int64_t>{});
    const auto lower =
      node.declare_parameter<std::vector<int64_t>>(
      prefix + ".lower", std::vector<int64_t>{});
    const auto upper =
      node.declare_parameter<std::vector<int64_t>>(
      prefix + ".upper", std::vector<int64_t>{});

    segmentation::TrackedColor color;
    color.name = name;

    if (!ranges.empty()) {
      if (ranges.size() % 6 != 0) {
        throw std::invalid_argument(
                prefix + ".ranges must hold [h,s,v] lower/upper pairs (multiple of 6 values)");
      }

      for (size_t i = 0; i < ranges.size(); i += 6) {
        color.ranges.push_back(
          segmentation::makeRange(
            {ranges[i], ranges[i + 1], ranges[i + 2]},
            {ranges[i + 3], ranges[i + 4], ranges[i + 5]},
            name));
      }
    } else if (!lower.empty() || !upper.empty()) {
      color.ranges.push_back(segmentation::makeRange(lower, upper, name));
    } else {
      throw std::invalid_argument(
              "Color '" + name + "' needs either " + prefix + ".ranges or " +
              prefix + ".lower/.upper");
    }

    params_.colors.push_back(std::move(color));
  }

  const auto players =
    node.declare_parameter<std::vector<std::string>>(
    "game.players", std::vector<std::string>{});

  if (!players.empty()) {
    if (players.size() != 2) {
      throw std::invalid_argument(
              "game.players must name exactly two colors, got " +
              std::to_string(players.size()));
    }
    params_.player1 = players[0];
    params_.player2 = players[1];
  } else if (params_.colors.size() >= 2) {
    params_.player1 = params_.colors[0].name;
    params_.player2 = params_.colors[1].name;
  }
}

// ------------------------------------------------------------
// Tracker
// ------------------------------------------------------------
void PipelineConfig::loadTracker(rclcpp::Node & node)
{
  auto & t = params_.tracker;

  t.min_area_detect =
    node.declare_parameter<double>("tracker.min_area_detect", t.min_area_detect);
  t.min_area_contour_roi =
    node.declare_parameter<double>("tracker.min_area_contour_roi", t.min_area_contour_roi);

  t.mask_kernel =
    node.declare_parameter<int>("tracker.mask_kernel", t.mask_kernel);
  t.mask_iterations =
    node.declare_parameter<int>("tracker.mask_iterations", t.mask_iterations);
  t.roi_pad =
    node.declare_parameter<int>("tracker.roi_pad", t.roi_pad);

  t.smoother_window =
    node.declare_parameter<int>("tracker.smoother_window", t.smoother_window);
  t.defect_angle_deg =
    node.declare_parameter<double>("tracker.defect_angle_deg", t.defect_angle_deg);
  t.defect_depth =
    node.declare_parameter<double>("tracker.defect_depth", t.defect_depth);

  t.kalman_dt =
    node.declare_parameter<double>("tracker.kalman_dt", t.kalman_dt);
  t.kalman_q =
    node.declare_parameter<double>("tracker.kalman_q", t.kalman_q);
  t.kalman_r =
    node.declare_parameter<double>("tracker.kalman_r", t.kalman_r);

  t.fallback_size =
    node.declare_parameter<int>("tracker.fallback_size", t.fallback_size);
}

// ------------------------------------------------------------
// Password
// ------------------------------------------------------------
void PipelineConfig::loadPassword(rclcpp::Node & node)
{
  auto & p = params_.password;

  params_.password_enabled =
    node.declare_parameter<bool>("password.enabled", true);

  const auto steps =
    node.declare_parameter<std::vector<std::string>>(
    "password.steps",
    std::vector<std::string>{
    "ROCK+SCISSORS", "SCISSORS+ROCK", "PAPER+PAPER", "SCISSORS+SCISSORS"});

  p.steps.clear();
  for (const auto & s : steps) {
    p.steps.push_back(pairFromString(s));
  }

  p.confirm_pair = pairFromString(
    node.declare_parameter<std::string>("password.confirm_pair", "ROCK+ROCK"));

  p.stable_required_frames =
    node.declare_parameter<int>("password.stable_required_frames", p.stable_required_frames);
  p.settle_frames_after_step =
    node.declare_parameter<int>("password.settle_frames_after_step", p.settle_frames_after_step);
  p.wrong_flash_frames =
    node.declare_parameter<int>("password.wrong_flash_frames", p.wrong_flash_frames);
  p.timeout_s =
    node.declare_parameter<double>("password.timeout_s", p.timeout_s);

  const bool confirm_in_steps = std::any_of(
    p.steps.begin(), p.steps.end(),
    [&](const GesturePair & s) {return s == p.confirm_pair;});

  if (confirm_in_steps) {
    // Such a step could never be selected
    throw std::invalid_argument(
            "password.steps must not contain the confirm pair " +
            pairToString(p.confirm_pair));
  }
}

// ------------------------------------------------------------
// Game
// ------------------------------------------------------------
void PipelineConfig::loadGame(rclcpp::Node & node)
{
  auto & g = params_.game;

  g.hide_required_frames =
    node.declare_parameter<int>("game.hide_required_frames", g.hide_required_frames);
  g.stable_required_frames =
    node.declare_parameter<int>("game.stable_required_frames", g.stable_required_frames);
  g.countdown_step_s =
    node.declare_parameter<double>("game.countdown_step_s", g.countdown_step_s);
  g.post_shoot_timeout_s =
    node.declare_parameter<double>("game.post_shoot_timeout_s", g.post_shoot_timeout_s);
}

}  // namespace hgp
