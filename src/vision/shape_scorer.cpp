#include <markscan/vision/shape_scorer.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <numbers>

namespace markscan::vision {

namespace {

constexpr double kMinArea = 1.0;
constexpr double kMinPerimeter = 1.0;

}  // namespace

std::optional<double> compactness(const std::vector<cv::Point>& contour) {
  if (contour.size() < 3) return std::nullopt;

  const double area = cv::contourArea(contour);
  const double perimeter = cv::arcLength(contour, true);
  if (area < kMinArea || perimeter < kMinPerimeter) return std::nullopt;

  const double c = 4.0 * std::numbers::pi * area / (perimeter * perimeter);
  return std::clamp(c, 1e-9, 1.0);
}

std::optional<double> l_mark_score(const std::vector<cv::Point>& contour) {
  const auto c = compactness(contour);
  if (!c) return std::nullopt;
  return 1.0 - *c;
}

}  // namespace markscan::vision
