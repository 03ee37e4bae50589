#include <markscan/core/alignment_result.hpp>

namespace markscan::core {

std::string_view to_string(QualityTier tier) noexcept {
  switch (tier) {
    case QualityTier::Ok:
      return "ok";
    case QualityTier::Warn:
      return "warn";
    case QualityTier::Fail:
      return "fail";
  }
  return "unknown";
}

QualityTier classify_residual(double mean_residual_px,
                              const QualityThresholds& thresholds) noexcept {
  // NaN compares false everywhere and lands in Fail.
  if (mean_residual_px <= thresholds.ok_px) return QualityTier::Ok;
  if (mean_residual_px <= thresholds.warn_px) return QualityTier::Warn;
  return QualityTier::Fail;
}

}  // namespace markscan::core
