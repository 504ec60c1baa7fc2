#include "hand_gesture_perception/segmentation/blob_detector.hpp"

#include <algorithm>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

namespace hgp::segmentation
{

std::optional<Contour> largestContour(const cv::Mat & mask, double min_area)
{
  if (mask.empty()) {
    return std::nullopt;
  }

  std::vector<Contour> contours;
  // findContours may modify its input on older OpenCV
  cv::findContours(
    mask.clone(), contours,
    cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  if (contours.empty()) {
    return std::nullopt;
  }

  const auto it = std::max_element(
    contours.begin(), contours.end(),
    [](const Contour & a, const Contour & b) {
      return cv::contourArea(a) < cv::contourArea(b);
    });

  if (cv::contourArea(*it) < min_area) {
    return std::nullopt;
  }

  return *it;
}

BlobDetector::BlobDetector(double min_area)
: min_area_(min_area)
{
  if (min_area < 0.0) {
    throw std::invalid_argument("min_area_detect must be >= 0");
  }
}

std::optional<Blob> BlobDetector::detect(const cv::Mat & mask) const
{
  auto contour = largestContour(mask, min_area_);
  if (!contour) {
    return std::nullopt;
  }

  Blob blob;
  blob.bbox = cv::boundingRect(*contour);
  blob.center = cv::Point2d(
    blob.bbox.x + blob.bbox.width / 2.0,
    blob.bbox.y + blob.bbox.height / 2.0);
  blob.area = cv::contourArea(*contour);
  blob.contour = std::move(*contour);

  return blob;
}

}  // namespace hgp::segmentation
