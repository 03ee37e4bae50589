#include <markscan/vision/feature_extractor.hpp>
#include <markscan/vision/cv_interop.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>

namespace markscan::vision {

namespace mc = markscan::core;

namespace {

constexpr double kEnergyEpsilon = 1e-6;

int count_local_maxima(const cv::Mat& response, double threshold) {
  cv::Mat dilated;
  cv::dilate(response, dilated, cv::Mat());
  cv::Mat peaks = (response >= dilated) & (response > threshold);
  return cv::countNonZero(peaks);
}

/// Pixel span [first, second) of the interval [a, b) shrunk by margin on
/// each side, then clipped to [0, limit). A span the margin would empty
/// keeps its middle pixel.
std::optional<std::pair<int, int>> inner_span(double a, double b, int margin, int limit) {
  if (!std::isfinite(a) || !std::isfinite(b)) return std::nullopt;
  const double lo = std::floor(a);
  const double hi = std::max(std::floor(b), lo + 1.0);
  double in_lo = lo + margin;
  double in_hi = hi - margin;
  if (in_hi <= in_lo) {
    in_lo = lo + std::floor((hi - lo - 1.0) / 2.0);
    in_hi = in_lo + 1.0;
  }
  in_lo = std::max(in_lo, 0.0);
  in_hi = std::min(in_hi, static_cast<double>(limit));
  if (in_hi <= in_lo) return std::nullopt;
  return std::pair{static_cast<int>(in_lo), static_cast<int>(in_hi)};
}

}  // namespace

FeatureExtractor::FeatureExtractor(FeatureExtractorConfig config)
    : config_(config) {}

std::optional<cv::Rect> FeatureExtractor::roi_for(const mc::CheckboxSpec& spec,
                                                  const mc::FormTemplate& tpl,
                                                  const mc::CropBounds& crop,
                                                  cv::Size crop_size) const {
  const mc::CroppedRect r = mc::to_cropped(mc::denormalize(spec.rect, tpl.canvas), crop);
  const int m = std::max(0, config_.inner_margin_px);
  const auto xs = inner_span(r.x, r.right(), m, crop_size.width);
  const auto ys = inner_span(r.y, r.bottom(), m, crop_size.height);
  if (!xs || !ys) return std::nullopt;
  return cv::Rect(xs->first, ys->first, xs->second - xs->first, ys->second - ys->first);
}

cv::Mat FeatureExtractor::binarize(const cv::Mat& roi) const {
  double lo = 0.0;
  double hi = 0.0;
  cv::minMaxLoc(roi, &lo, &hi);
  if (hi - lo < config_.min_contrast) {
    return cv::Mat::zeros(roi.size(), CV_8UC1);
  }
  cv::Mat binary;
  cv::threshold(roi, binary, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
  return binary;
}

mc::FeatureVector FeatureExtractor::extract_roi(const cv::Mat& roi) const {
  mc::FeatureVector::Values v{};
  if (roi.empty() || roi.type() != CV_8UC1) return mc::FeatureVector(v);

  const double area = static_cast<double>(roi.total());
  const cv::Mat binary = binarize(roi);

  v[mc::feature_index(mc::Feature::FillRatio)] = cv::countNonZero(binary) / area;

  cv::Mat edges;
  cv::Canny(roi, edges, config_.canny_low, config_.canny_high);
  v[mc::feature_index(mc::Feature::EdgeDensity)] = cv::countNonZero(edges) / area;

  cv::Mat boundary;
  cv::morphologyEx(binary, boundary, cv::MORPH_GRADIENT,
                   cv::Mat::ones(2, 2, CV_8U));
  v[mc::feature_index(mc::Feature::StrokeLength)] = cv::countNonZero(boundary) / area;

  cv::Mat roi_f;
  roi.convertTo(roi_f, CV_32F);
  cv::Mat response;
  cv::cornerHarris(roi_f, response, config_.harris_block_size,
                   config_.harris_aperture, config_.harris_k);
  double r_max = 0.0;
  cv::minMaxLoc(response, nullptr, &r_max);
  v[mc::feature_index(mc::Feature::CornerCount)] =
      r_max > 0.0
          ? count_local_maxima(response, r_max * config_.harris_relative_threshold)
          : 0;

  cv::Mat labels;
  cv::Mat stats;
  cv::Mat centroids;
  const int n = cv::connectedComponentsWithStats(binary, labels, stats, centroids, 8, CV_32S);
  int components = 0;
  for (int i = 1; i < n; ++i) {
    if (stats.at<int>(i, cv::CC_STAT_AREA) >= config_.min_component_area) ++components;
  }
  v[mc::feature_index(mc::Feature::ComponentCount)] = components;

  cv::Mat gx;
  cv::Mat gy;
  cv::Sobel(roi, gx, CV_64F, 1, 0, 3);
  cv::Sobel(roi, gy, CV_64F, 0, 1, 3);
  const double h_energy = cv::norm(gx, cv::NORM_L1);
  const double v_energy = cv::norm(gy, cv::NORM_L1);
  v[mc::feature_index(mc::Feature::HvRatio)] = h_energy / (v_energy + kEnergyEpsilon);

  cv::Scalar mean;
  cv::Scalar stddev;
  cv::meanStdDev(roi, mean, stddev);
  v[mc::feature_index(mc::Feature::Variance)] = stddev[0] * stddev[0];

  return mc::FeatureVector(v);
}

std::vector<mc::CheckboxFeatures> FeatureExtractor::extract(
    const mc::PageImage& cropped,
    const mc::CropBounds& crop,
    const mc::FormTemplate& tpl) const {
  std::vector<mc::CheckboxFeatures> out;
  out.reserve(tpl.checkboxes.size());

  const cv::Mat image = as_mat(cropped);
  for (const mc::CheckboxSpec& spec : tpl.checkboxes) {
    mc::CheckboxFeatures entry;
    entry.id = spec.id;
    if (!image.empty()) {
      if (const auto roi = roi_for(spec, tpl, crop, image.size())) {
        // Clone so border handling never reads pixels outside the ROI.
        entry.features = extract_roi(image(*roi).clone());
      }
    }
    out.push_back(std::move(entry));
  }
  return out;
}

}  // namespace markscan::vision
