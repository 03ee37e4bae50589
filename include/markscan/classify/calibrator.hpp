#pragma once

#include <markscan/classify/classifier_parameters.hpp>
#include <markscan/classify/logistic_regression.hpp>
#include <markscan/core/error.hpp>
#include <markscan/core/feature_vector.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace markscan::classify {

/// One labeled checkbox from human review.
struct CalibrationExample {
  markscan::core::FeatureVector features;
  bool marked{false};
};

struct CalibratorConfig {
  std::size_t folds{5};
  std::uint32_t seed{42};
  double sweep_start{0.30};
  double sweep_stop{0.75};
  double sweep_step{0.05};
  double fp_cost{1.0};
  double fn_cost{1.0};
  std::size_t min_examples{10};
  LogisticRegressionOptions regression{};
};

struct Standardization {
  markscan::core::FeatureVector::Values mean{};
  markscan::core::FeatureVector::Values stddev{};

  [[nodiscard]] markscan::core::FeatureVector::Values apply(
      const markscan::core::FeatureVector& f) const noexcept;
};

/// Per-feature mean and population deviation; zero deviations become 1.
[[nodiscard]] Standardization fit_standardization(
    std::span<const CalibrationExample> examples);

/// Class-balanced weights n / (2 * n_class).
[[nodiscard]] std::vector<double> balanced_weights(std::span<const CalibrationExample> examples);

/// Fold index per example. Each class is shuffled with a seeded generator and
/// dealt round-robin so every fold holds both classes.
[[nodiscard]] std::vector<std::size_t> stratified_folds(
    std::span<const CalibrationExample> examples, std::size_t k, std::uint32_t seed);

struct ConfusionMatrix {
  std::size_t tp{0};
  std::size_t fp{0};
  std::size_t tn{0};
  std::size_t fn{0};

  [[nodiscard]] std::size_t total() const noexcept { return tp + fp + tn + fn; }
  [[nodiscard]] double accuracy() const noexcept {
    return total() == 0 ? 0.0
                        : static_cast<double>(tp + tn) / static_cast<double>(total());
  }
};

struct SweepPoint {
  double threshold{0.0};
  ConfusionMatrix confusion;
  double cost{0.0};
};

/// Evaluates every grid threshold start + i*step up to stop inclusive.
[[nodiscard]] std::vector<SweepPoint> sweep_thresholds(std::span<const double> scores,
                                                       std::span<const CalibrationExample> examples,
                                                       const CalibratorConfig& config);

/// Lowest cost; ties go to fewer false negatives, then the lower threshold.
/// The sweep must not be empty.
[[nodiscard]] const SweepPoint& choose_threshold(std::span<const SweepPoint> sweep);

struct FoldScore {
  std::size_t fold{0};
  std::size_t train_size{0};
  std::size_t test_size{0};
  double accuracy{0.0};
};

/// Discrimination of one feature on its own.
struct FeatureRank {
  markscan::core::Feature feature{markscan::core::Feature::FillRatio};
  /// Best accuracy of a single cutoff on this feature.
  double accuracy{0.0};
  double cutoff{0.0};
  /// True when values above the cutoff predict "marked".
  bool marked_above{true};
};

/// Best single-threshold accuracy per feature, both polarities, best first.
[[nodiscard]] std::vector<FeatureRank> rank_features(std::span<const CalibrationExample> examples);

struct CalibrationReport {
  std::size_t examples{0};
  std::size_t positives{0};
  std::vector<FoldScore> folds;
  double cv_mean_accuracy{0.0};
  double cv_std_accuracy{0.0};
  std::vector<SweepPoint> sweep;
  SweepPoint chosen;
  double training_accuracy{0.0};
  bool converged{false};
  std::vector<FeatureRank> ranking;
};

struct CalibrationOutcome {
  LinearModel parameters;
  CalibrationReport report;
};

/// Offline fitting of model-mode classifier parameters from labeled examples.
class Calibrator {
 public:
  explicit Calibrator(CalibratorConfig config = {});

  /// Fails with CalibrationFailed for fewer than min_examples examples, a
  /// missing class, or a class smaller than the fold count.
  [[nodiscard]] std::expected<CalibrationOutcome, markscan::core::PipelineError>
  calibrate(std::span<const CalibrationExample> examples) const;

  [[nodiscard]] const CalibratorConfig& config() const noexcept { return config_; }

 private:
  CalibratorConfig config_;
};

}  // namespace markscan::classify
