#include <markscan/vision/anchor_detector.hpp>
#include <markscan/vision/cv_interop.hpp>
#include <markscan/vision/shape_scorer.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace markscan::vision {

namespace mc = markscan::core;

namespace {

constexpr double kTieEpsilon = 1e-9;

cv::Point2d contour_centroid(const std::vector<cv::Point>& contour) {
  const cv::Moments m = cv::moments(contour);
  if (std::abs(m.m00) > kTieEpsilon) {
    return {m.m10 / m.m00, m.m01 / m.m00};
  }
  cv::Point2d sum{0.0, 0.0};
  for (const auto& p : contour) {
    sum.x += p.x;
    sum.y += p.y;
  }
  const double n = static_cast<double>(contour.size());
  return {sum.x / n, sum.y / n};
}

}  // namespace

bool ranks_before(const mc::AnchorCandidate& a,
                  const mc::AnchorCandidate& b) noexcept {
  if (std::abs(a.confidence - b.confidence) > kTieEpsilon) {
    return a.confidence > b.confidence;
  }
  if (std::abs(a.distance_px - b.distance_px) > kTieEpsilon) {
    return a.distance_px < b.distance_px;
  }
  if (a.position.y != b.position.y) return a.position.y < b.position.y;
  return a.position.x < b.position.x;
}

AnchorDetector::AnchorDetector(AnchorDetectorConfig config)
    : config_(config) {}

std::optional<mc::AnchorCandidate> AnchorDetector::detect(
    const mc::PageImage& page,
    mc::Corner corner,
    mc::RawPixelPoint expected,
    double half_extent_px) const {
  const cv::Mat gray = as_mat(page);
  if (gray.empty() || !(half_extent_px > 0.0)) return std::nullopt;

  const int x0 = std::max(0, static_cast<int>(std::floor(expected.x - half_extent_px)));
  const int y0 = std::max(0, static_cast<int>(std::floor(expected.y - half_extent_px)));
  const int x1 = std::min(gray.cols, static_cast<int>(std::ceil(expected.x + half_extent_px)));
  const int y1 = std::min(gray.rows, static_cast<int>(std::ceil(expected.y + half_extent_px)));
  if (x1 - x0 < 2 || y1 - y0 < 2) return std::nullopt;

  cv::Mat window = gray(cv::Rect(x0, y0, x1 - x0, y1 - y0));
  cv::Mat smoothed;
  if (config_.blur_kernel > 1) {
    const int k = config_.blur_kernel | 1;
    cv::GaussianBlur(window, smoothed, cv::Size(k, k), 0);
  } else {
    smoothed = window;
  }
  double lo = 0.0;
  double hi = 0.0;
  cv::minMaxLoc(smoothed, &lo, &hi);
  if (hi - lo < config_.min_contrast) return std::nullopt;

  cv::Mat binary;
  cv::threshold(smoothed, binary, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  const double scale = page.dpi() / config_.reference_dpi;
  const double min_area = config_.min_area * scale * scale;
  const double max_area = config_.max_area * scale * scale;
  const double weight_sum = config_.shape_weight + config_.distance_weight;

  std::optional<mc::AnchorCandidate> best;
  for (const auto& contour : contours) {
    const double area = cv::contourArea(contour);
    if (area < min_area || area > max_area) continue;

    const auto shape = l_mark_score(contour);
    if (!shape) continue;

    const cv::Point2d c = contour_centroid(contour);
    mc::AnchorCandidate cand;
    cand.corner = corner;
    cand.position = mc::RawPixelPoint{x0 + c.x, y0 + c.y};
    cand.area = area;
    cand.shape_score = *shape;
    cand.distance_px = mc::distance(cand.position, expected);
    cand.distance_score = std::clamp(1.0 - cand.distance_px / half_extent_px, 0.0, 1.0);
    cand.confidence = weight_sum > 0.0
                          ? (config_.shape_weight * cand.shape_score +
                             config_.distance_weight * cand.distance_score) /
                                weight_sum
                          : 0.0;

    if (!best || ranks_before(cand, *best)) {
      best = cand;
    }
  }
  return best;
}

mc::AnchorSet AnchorDetector::detect_all(const mc::PageImage& page,
                                         const mc::FormTemplate& tpl) const {
  mc::AnchorSet out{};
  if (!page.valid() || !(tpl.dpi > 0.0)) return out;

  const double window_scale = page.dpi() / tpl.dpi;
  for (const mc::Corner corner : mc::kCorners) {
    const mc::AnchorSpec& spec = tpl.anchor(corner);
    const mc::RawPixelPoint expected =
        mc::expected_raw_position(spec.position, page.width(), page.height());
    out[mc::corner_index(corner)] =
        detect(page, corner, expected, spec.search_half_extent_px * window_scale);
  }
  return out;
}

}  // namespace markscan::vision
