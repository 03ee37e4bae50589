#include <markscan/app/config.hpp>
#include "key_value.hpp"
#include <cmath>
#include <fstream>
#include <optional>

namespace markscan::app {

namespace mc = markscan::core;

namespace {

bool set_double(const std::string& value, double& out) {
  const auto v = detail::parse_double(value);
  if (!v || !std::isfinite(*v)) return false;
  out = *v;
  return true;
}

bool set_bool(const std::string& value, bool& out) {
  const auto v = detail::parse_bool(value);
  if (!v) return false;
  out = *v;
  return true;
}

bool set_non_negative(const std::string& value, long& out) {
  const auto v = detail::parse_long(value);
  if (!v || *v < 0) return false;
  out = *v;
  return true;
}

/// Applies one key; false when the value does not parse. Unknown keys are
/// ignored so configs can carry settings for other tools.
bool apply(PipelineConfig& c, const std::string& key, const std::string& value) {
  if (key == "template_path") c.template_path = value;
  else if (key == "classifier_path") c.classifier_path = value;
  else if (key == "fill_threshold") return set_double(value, c.fill_threshold);
  else if (key == "page_dpi") return set_double(value, c.page_dpi);
  else if (key == "color_fusion") return set_bool(value, c.color_fusion);
  else if (key == "shape_weight") return set_double(value, c.shape_weight);
  else if (key == "distance_weight") return set_double(value, c.distance_weight);
  else if (key == "anchor_min_area") return set_double(value, c.anchor_min_area);
  else if (key == "anchor_max_area") return set_double(value, c.anchor_max_area);
  else if (key == "anchor_min_contrast") {
    long v = 0;
    if (!set_non_negative(value, v) || v > 255) return false;
    c.anchor_min_contrast = static_cast<int>(v);
  }
  else if (key == "residual_ok_px") return set_double(value, c.residual_ok_px);
  else if (key == "residual_warn_px") return set_double(value, c.residual_warn_px);
  else if (key == "reference_dpi") return set_double(value, c.reference_dpi);
  else if (key == "crop_margin_in") return set_double(value, c.crop_margin_in);
  else if (key == "stop_on_fail") return set_bool(value, c.stop_on_fail);
  else if (key == "gate_on_planarity") return set_bool(value, c.gate_on_planarity);
  else if (key == "projective_method") {
    if (value == "least_squares") c.projective_method = vision::ProjectiveMethod::LeastSquares;
    else if (value == "ransac") c.projective_method = vision::ProjectiveMethod::Ransac;
    else return false;
  }
  else if (key == "checkbox_margin_px") {
    long v = 0;
    if (!set_non_negative(value, v)) return false;
    c.checkbox_margin_px = static_cast<int>(v);
  }
  else if (key == "num_workers") {
    long v = 0;
    if (!set_non_negative(value, v)) return false;
    c.num_workers = static_cast<std::size_t>(v);
  }
  else if (key == "review_near_margin") return set_double(value, c.review_near_margin);
  return true;
}

}  // namespace

PipelineConfig default_config() {
  PipelineConfig c;
  c.template_path = "";
  c.classifier_path = "";
  c.fill_threshold = 0.115;
  c.page_dpi = 300.0;
  c.residual_ok_px = 4.5;
  c.residual_warn_px = 6.0;
  c.crop_margin_in = 0.125;
  return c;
}

std::expected<void, mc::PipelineError> validate(const PipelineConfig& c) {
  const bool ok = c.page_dpi > 0.0 && c.reference_dpi > 0.0 && c.shape_weight >= 0.0 &&
                  c.distance_weight >= 0.0 && c.shape_weight + c.distance_weight > 0.0 &&
                  c.anchor_min_area >= 0.0 && c.anchor_max_area > c.anchor_min_area &&
                  c.residual_ok_px >= 0.0 && c.residual_warn_px >= c.residual_ok_px &&
                  c.crop_margin_in >= 0.0 && c.fill_threshold >= 0.0 &&
                  c.fill_threshold <= 1.0 && c.review_near_margin >= 0.0;
  if (!ok) return std::unexpected(mc::PipelineError::InvalidConfig);
  return {};
}

std::expected<PipelineConfig, mc::PipelineError> load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  for (const auto& kv : detail::parse_key_values(f)) {
    if (!apply(c, kv.key, kv.value)) {
      return std::unexpected(mc::PipelineError::InvalidConfig);
    }
  }
  if (auto valid = validate(c); !valid) {
    return std::unexpected(valid.error());
  }
  return c;
}

}  // namespace markscan::app
