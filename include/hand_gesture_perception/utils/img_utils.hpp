#pragma once

#include <string>

#include <opencv2/core.hpp>

#include <sensor_msgs/msg/image.hpp>
#include <std_msgs/msg/header.hpp>

namespace hgp
{

// bbox grown by pad on every side, clipped to the frame. May be empty.
cv::Rect paddedRoi(const cv::Rect & bbox, int pad, const cv::Size & frame_size);

cv::Mat toCvBgr(
  const sensor_msgs::msg::Image & image);

sensor_msgs::msg::Image::SharedPtr toMonoImageMsg(
  const cv::Mat & mask,
  const std_msgs::msg::Header & header);

}  // namespace hgp
