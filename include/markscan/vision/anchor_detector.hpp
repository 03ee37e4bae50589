#pragma once

#include <markscan/core/anchor.hpp>
#include <markscan/core/form_template.hpp>
#include <markscan/core/geometry.hpp>
#include <markscan/core/page_image.hpp>
#include <optional>

namespace markscan::vision {

struct AnchorDetectorConfig {
  /// Confidence = (shape_weight * shape + distance_weight * distance) / sum.
  double shape_weight{0.6};
  double distance_weight{0.4};
  /// Admissible contour area band in px^2, expressed at reference_dpi and
  /// scaled by (page dpi / reference_dpi)^2.
  double min_area{50.0};
  double max_area{8000.0};
  double reference_dpi{300.0};
  /// Gaussian kernel applied before Otsu binarization; <= 1 disables it.
  int blur_kernel{5};
  /// Windows whose smoothed intensity range is below this hold no mark.
  int min_contrast{40};
};

/// Strict, total ordering of candidates: higher confidence, then closer to
/// the expected position, then smaller y, then smaller x.
[[nodiscard]] bool ranks_before(const markscan::core::AnchorCandidate& a,
                                const markscan::core::AnchorCandidate& b) noexcept;

/// Finds L-shaped registration marks near their expected positions.
/// Stateless after construction; safe to share across threads.
class AnchorDetector {
 public:
  explicit AnchorDetector(AnchorDetectorConfig config = {});

  /// Best candidate inside the square window of half side half_extent_px
  /// centred on expected, or nullopt if the window is flat (see
  /// min_contrast) or no contour passes the area band.
  [[nodiscard]] std::optional<markscan::core::AnchorCandidate> detect(
      const markscan::core::PageImage& page,
      markscan::core::Corner corner,
      markscan::core::RawPixelPoint expected,
      double half_extent_px) const;

  /// Runs detect() for all four template corners. Expected positions come
  /// from the normalized anchor positions, windows are scaled from template
  /// dpi to page dpi.
  [[nodiscard]] markscan::core::AnchorSet detect_all(
      const markscan::core::PageImage& page,
      const markscan::core::FormTemplate& tpl) const;

  [[nodiscard]] const AnchorDetectorConfig& config() const noexcept {
    return config_;
  }

 private:
  AnchorDetectorConfig config_;
};

}  // namespace markscan::vision
