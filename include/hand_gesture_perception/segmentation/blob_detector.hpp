#pragma once

#include <optional>
#include <vector>

#include <opencv2/core.hpp>

namespace hgp::segmentation
{

using Contour = std::vector<cv::Point>;

struct Blob
{
  cv::Rect bbox;
  cv::Point2d center;   // bbox center
  double area{0.0};
  Contour contour;
};

/**
 * @brief Largest external contour of a binary mask
 *
 * Returns std::nullopt when the mask has no contour or when the largest one
 * is smaller than min_area. Smaller blobs are never promoted: a shadow next
 * to an undersized hand does not count as a detection.
 */
std::optional<Contour> largestContour(const cv::Mat & mask, double min_area);

class BlobDetector
{
public:
  explicit BlobDetector(double min_area);

  std::optional<Blob> detect(const cv::Mat & mask) const;

  double minArea() const {return min_area_;}

private:
  double min_area_;
};

}  // namespace hgp::segmentation
