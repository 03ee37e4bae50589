#pragma once

#include <markscan/core/form_template.hpp>
#include <markscan/core/geometry.hpp>
#include <markscan/core/page_image.hpp>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace markscan::core {

/// Alignment quality, ordered from best to worst.
enum class QualityTier : std::uint8_t {
  Ok,
  Warn,
  Fail,
};

[[nodiscard]] std::string_view to_string(QualityTier tier) noexcept;

/// Residual cutoffs in page pixels: ok <= ok_px < warn <= warn_px < fail.
struct QualityThresholds {
  double ok_px{4.5};
  double warn_px{6.0};
};

/// Pure and monotonic in mean_residual_px.
[[nodiscard]] QualityTier classify_residual(
    double mean_residual_px,
    const QualityThresholds& thresholds) noexcept;

struct AnchorResidual {
  Corner corner{Corner::TopLeft};
  /// Distance between the detected anchor and the canonical anchor mapped
  /// back through the inverse transform, in page pixels.
  double residual_px{0.0};
};

struct AlignmentResult {
  PageTransform transform{};
  std::size_t anchors_used{0};
  std::vector<AnchorResidual> residuals;
  double mean_residual_px{0.0};
  double max_residual_px{0.0};
  /// Mean residual of a least-squares affine fit over the same anchors;
  /// only informative with four anchors.
  double planarity_px{0.0};
  /// Value the tier was graded on: mean_residual_px, or for a gated
  /// four-anchor fit the larger of it and planarity_px.
  double graded_residual_px{0.0};
  QualityThresholds thresholds{};
  QualityTier tier{QualityTier::Ok};
  /// Crop window in canonical pixels and the cropped canonical image.
  CropBounds crop{};
  PageImage canonical_image{};
};

}  // namespace markscan::core
