#pragma once

#include <markscan/core/alignment_result.hpp>
#include <markscan/core/anchor.hpp>
#include <markscan/core/error.hpp>
#include <markscan/core/form_template.hpp>
#include <markscan/core/geometry.hpp>
#include <markscan/core/page_image.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <vector>

namespace markscan::vision {

/// Fit used when all four anchors are available.
enum class ProjectiveMethod : std::uint8_t {
  LeastSquares,  // DLT solved in double precision
  Ransac,        // cv::findHomography with RANSAC
};

struct AlignerConfig {
  /// Residual cutoffs at reference_dpi; scaled to the page resolution.
  markscan::core::QualityThresholds thresholds{};
  double reference_dpi{300.0};
  /// Outward crop margin beyond the anchor bounding box.
  double crop_margin_in{0.125};
  ProjectiveMethod projective_method{ProjectiveMethod::LeastSquares};
  /// A homography through four anchors reprojects them exactly, so four-anchor
  /// fits are also graded on planarity_px.
  bool gate_on_planarity{true};
  double ransac_reproj_px{3.0};
  /// Fill value for canonical pixels that map outside the scan.
  std::uint8_t border_value{255};
};

/// Transform and residuals, before any image is warped.
struct TransformFit {
  markscan::core::PageTransform transform{};
  std::vector<markscan::core::AnchorResidual> residuals;
  double mean_residual_px{0.0};
  double max_residual_px{0.0};
  double planarity_px{0.0};
};

/// Bounding box of the canonical anchors expanded outward by margin_px on
/// every side, clamped to the canvas.
[[nodiscard]] markscan::core::CropBounds compute_crop_bounds(
    const std::array<markscan::core::CanonicalPoint, 4>& anchors,
    int margin_px,
    markscan::core::CanvasSize canvas) noexcept;

/// Turns detected anchors into a page-to-canonical transform, a quality tier
/// and a cropped canonical image. States per page: fewer than three anchors
/// is a failure, three give an exact affine fit, four a projective fit.
class GeometricAligner {
 public:
  GeometricAligner(markscan::core::FormTemplate tpl, AlignerConfig config = {});

  /// Fit only; InsufficientAnchors with fewer than three anchors,
  /// TransformFailed for degenerate (e.g. collinear) geometry.
  [[nodiscard]] std::expected<TransformFit, markscan::core::PipelineError> fit(
      const markscan::core::AnchorSet& detected) const;

  /// Fit, warp into the canonical canvas, crop, and grade. The tier uses the
  /// thresholds scaled to page.dpi() and graded_residual().
  [[nodiscard]] std::expected<markscan::core::AlignmentResult,
                              markscan::core::PipelineError>
  align(const markscan::core::PageImage& page,
        const markscan::core::AnchorSet& detected) const;

  /// Residual the tier is computed from.
  [[nodiscard]] double graded_residual(const TransformFit& fit) const noexcept;

  [[nodiscard]] markscan::core::QualityThresholds scaled_thresholds(
      double page_dpi) const noexcept;

  /// Crop margin in canonical pixels.
  [[nodiscard]] int margin_px() const noexcept;

  /// Crop window for this template; identical for every page.
  [[nodiscard]] markscan::core::CropBounds crop_bounds() const noexcept;

  [[nodiscard]] const markscan::core::FormTemplate& form() const noexcept {
    return tpl_;
  }
  [[nodiscard]] const AlignerConfig& config() const noexcept { return config_; }

 private:
  markscan::core::FormTemplate tpl_;
  AlignerConfig config_;
};

}  // namespace markscan::vision
