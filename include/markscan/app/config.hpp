#pragma once

#include <markscan/core/error.hpp>
#include <markscan/vision/geometric_aligner.hpp>
#include <cstddef>
#include <expected>
#include <string>

namespace markscan::app {

/// Pipeline configuration: file paths, detector and aligner tuning, batch
/// and review settings. Pixel constants are expressed at reference_dpi.
struct PipelineConfig {
  std::string template_path;
  /// Empty: threshold mode with fill_threshold.
  std::string classifier_path;
  double fill_threshold{0.115};
  double page_dpi{300.0};
  bool color_fusion{true};

  double shape_weight{0.6};
  double distance_weight{0.4};
  double anchor_min_area{50.0};
  double anchor_max_area{8000.0};
  int anchor_min_contrast{40};

  double residual_ok_px{4.5};
  double residual_warn_px{6.0};
  double reference_dpi{300.0};
  double crop_margin_in{0.125};
  bool stop_on_fail{false};
  bool gate_on_planarity{true};
  markscan::vision::ProjectiveMethod projective_method{
      markscan::vision::ProjectiveMethod::LeastSquares};

  int checkbox_margin_px{2};
  std::size_t num_workers{0};  // 0 = hardware concurrency
  double review_near_margin{0.03};
};

/// Load config from a simple key=value file (one per line). A missing file
/// gives the defaults; a malformed or out-of-range value gives InvalidConfig.
[[nodiscard]] std::expected<PipelineConfig, markscan::core::PipelineError>
load_config(const std::string& path);

/// Default config when no file is provided.
PipelineConfig default_config();

/// InvalidConfig unless weights, dpi values and thresholds are usable.
[[nodiscard]] std::expected<void, markscan::core::PipelineError> validate(
    const PipelineConfig& config);

}  // namespace markscan::app
