#include "hand_gesture_perception/utils/img_utils.hpp"

#include <algorithm>

#include <cv_bridge/cv_bridge.h>
#include <opencv2/imgproc.hpp>

namespace hgp
{

cv::Rect paddedRoi(const cv::Rect & bbox, int pad, const cv::Size & frame_size)
{
  const int x0 = std::max(0, bbox.x - pad);
  const int y0 = std::max(0, bbox.y - pad);
  const int x1 = std::min(frame_size.width, bbox.x + bbox.width + pad);
  const int y1 = std::min(frame_size.height, bbox.y + bbox.height + pad);

  if (x1 <= x0 || y1 <= y0) {
    return cv::Rect();  // valid, but empty
  }

  return cv::Rect(x0, y0, x1 - x0, y1 - y0);
}

cv::Mat toCvBgr(
  const sensor_msgs::msg::Image & image)
{
  return cv_bridge::toCvCopy(image, "bgr8")->image;
}

sensor_msgs::msg::Image::SharedPtr toMonoImageMsg(
  const cv::Mat & mask,
  const std_msgs::msg::Header & header)
{
  return cv_bridge::CvImage(header, "mono8", mask).toImageMsg();
}

}  // namespace hgp
