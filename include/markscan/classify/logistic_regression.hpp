#pragma once

#include <markscan/core/error.hpp>
#include <markscan/core/feature_vector.hpp>
#include <expected>
#include <span>

namespace markscan::classify {

struct LogisticRegressionOptions {
  /// Inverse regularization strength; the bias is not penalized.
  double c{1.0};
  int max_iterations{100};
  /// Stop once the largest Newton step component falls below this.
  double tolerance{1e-8};
};

struct LogisticFit {
  markscan::core::FeatureVector::Values weights{};
  double bias{0.0};
  int iterations{0};
  bool converged{false};

  [[nodiscard]] double decision(const markscan::core::FeatureVector::Values& x) const noexcept;
  [[nodiscard]] double probability(const markscan::core::FeatureVector::Values& x) const noexcept;
};

/// Weighted L2-regularized logistic regression fitted by Newton iterations:
/// minimizes 0.5*|w|^2 + C * sum_i s_i * logloss(y_i, w.x_i + b).
/// x is expected to be standardized already. labels are 0 or 1.
/// Empty or mismatched inputs yield CalibrationFailed.
[[nodiscard]] std::expected<LogisticFit, markscan::core::PipelineError>
fit_logistic_regression(std::span<const markscan::core::FeatureVector::Values> x,
                        std::span<const int> labels,
                        std::span<const double> sample_weights,
                        const LogisticRegressionOptions& options = {});

}  // namespace markscan::classify
