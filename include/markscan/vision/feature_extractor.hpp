#pragma once

#include <markscan/core/feature_vector.hpp>
#include <markscan/core/form_template.hpp>
#include <markscan/core/geometry.hpp>
#include <markscan/core/page_image.hpp>
#include <markscan/core/page_result.hpp>
#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>
#include <optional>
#include <vector>

namespace markscan::vision {

struct FeatureExtractorConfig {
  /// Inward margin keeping the printed box outline out of the ROI.
  int inner_margin_px{2};
  /// ROIs whose intensity range is below this are blank (no ink).
  int min_contrast{40};
  double canny_low{50.0};
  double canny_high{150.0};
  int harris_block_size{2};
  int harris_aperture{3};
  double harris_k{0.04};
  /// Corner responses must exceed this fraction of the ROI maximum.
  double harris_relative_threshold{0.01};
  /// Blobs smaller than this (pixels) are not counted as components.
  int min_component_area{1};
};

/// Computes the seven checkbox features on canonical crops.
class FeatureExtractor {
 public:
  explicit FeatureExtractor(FeatureExtractorConfig config = {});

  /// Pixel ROI of a checkbox inside a crop of crop_size, after the inward
  /// margin and clipping. Never leaves the checkbox rectangle: boxes thinner
  /// than twice the margin shrink to their middle pixel. nullopt when the
  /// rectangle lies fully outside.
  [[nodiscard]] std::optional<cv::Rect> roi_for(
      const markscan::core::CheckboxSpec& spec,
      const markscan::core::FormTemplate& tpl,
      const markscan::core::CropBounds& crop,
      cv::Size crop_size) const;

  /// Ink mask (255 = ink) from Otsu binarization, empty for low-contrast ROIs.
  [[nodiscard]] cv::Mat binarize(const cv::Mat& roi) const;

  /// Features of one 8-bit grayscale ROI.
  [[nodiscard]] markscan::core::FeatureVector extract_roi(const cv::Mat& roi) const;

  /// One entry per template checkbox, in template order.
  [[nodiscard]] std::vector<markscan::core::CheckboxFeatures> extract(
      const markscan::core::PageImage& cropped,
      const markscan::core::CropBounds& crop,
      const markscan::core::FormTemplate& tpl) const;

  [[nodiscard]] const FeatureExtractorConfig& config() const noexcept {
    return config_;
  }

 private:
  FeatureExtractorConfig config_;
};

}  // namespace markscan::vision
