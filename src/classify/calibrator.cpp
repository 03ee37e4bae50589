#include <markscan/classify/calibrator.hpp>
#include <markscan/classify/checkbox_classifier.hpp>
#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

namespace markscan::classify {

namespace mc = markscan::core;

namespace {

constexpr double kCostEpsilon = 1e-12;
/// Sweep thresholds are snapped to this many steps per unit.
constexpr double kThresholdResolution = 1e9;

std::size_t count_positive(std::span<const CalibrationExample> examples) {
  return static_cast<std::size_t>(std::count_if(
      examples.begin(), examples.end(), [](const CalibrationExample& e) { return e.marked; }));
}

/// Fisher-Yates with raw engine output so the order only depends on mt19937.
void seeded_shuffle(std::vector<std::size_t>& v, std::mt19937& rng) {
  for (std::size_t i = v.size(); i > 1; --i) {
    const std::size_t j = static_cast<std::size_t>(rng()) % i;
    std::swap(v[i - 1], v[j]);
  }
}

struct TrainedModel {
  LinearModel model;
  bool converged{false};
};

std::expected<TrainedModel, mc::PipelineError> train(
    std::span<const CalibrationExample> examples,
    const LogisticRegressionOptions& options) {
  const Standardization norm = fit_standardization(examples);
  std::vector<mc::FeatureVector::Values> x;
  std::vector<int> y;
  x.reserve(examples.size());
  y.reserve(examples.size());
  for (const auto& e : examples) {
    x.push_back(norm.apply(e.features));
    y.push_back(e.marked ? 1 : 0);
  }
  const std::vector<double> w = balanced_weights(examples);
  auto fit = fit_logistic_regression(x, y, w, options);
  if (!fit) return std::unexpected(fit.error());

  TrainedModel out;
  out.model.mean = norm.mean;
  out.model.stddev = norm.stddev;
  out.model.weights = fit->weights;
  out.model.bias = fit->bias;
  out.model.threshold = 0.5;
  out.converged = fit->converged;
  return out;
}

double accuracy_at(const LinearModel& model, std::span<const CalibrationExample> examples) {
  if (examples.empty()) return 0.0;
  const CheckboxClassifier classifier(model);
  std::size_t correct = 0;
  for (const auto& e : examples) {
    if (classifier.classify(e.features).marked == e.marked) ++correct;
  }
  return static_cast<double>(correct) / static_cast<double>(examples.size());
}

}  // namespace

mc::FeatureVector::Values Standardization::apply(const mc::FeatureVector& f) const noexcept {
  mc::FeatureVector::Values out{};
  for (std::size_t j = 0; j < mc::kFeatureCount; ++j) {
    out[j] = (f.values()[j] - mean[j]) / stddev[j];
  }
  return out;
}

Standardization fit_standardization(std::span<const CalibrationExample> examples) {
  Standardization s;
  s.stddev.fill(1.0);
  if (examples.empty()) return s;

  const double n = static_cast<double>(examples.size());
  for (const auto& e : examples) {
    for (std::size_t j = 0; j < mc::kFeatureCount; ++j) s.mean[j] += e.features.values()[j];
  }
  for (double& m : s.mean) m /= n;

  mc::FeatureVector::Values var{};
  for (const auto& e : examples) {
    for (std::size_t j = 0; j < mc::kFeatureCount; ++j) {
      const double d = e.features.values()[j] - s.mean[j];
      var[j] += d * d;
    }
  }
  for (std::size_t j = 0; j < mc::kFeatureCount; ++j) {
    const double sd = std::sqrt(var[j] / n);
    s.stddev[j] = sd > 0.0 ? sd : 1.0;
  }
  return s;
}

std::vector<double> balanced_weights(std::span<const CalibrationExample> examples) {
  const std::size_t n = examples.size();
  const std::size_t pos = count_positive(examples);
  const std::size_t neg = n - pos;
  std::vector<double> w;
  w.reserve(n);
  for (const auto& e : examples) {
    const std::size_t n_class = e.marked ? pos : neg;
    w.push_back(static_cast<double>(n) / (2.0 * static_cast<double>(n_class)));
  }
  return w;
}

std::vector<std::size_t> stratified_folds(std::span<const CalibrationExample> examples,
                                          std::size_t k, std::uint32_t seed) {
  std::vector<std::size_t> fold(examples.size(), 0);
  if (k == 0) return fold;

  std::vector<std::size_t> positives;
  std::vector<std::size_t> negatives;
  for (std::size_t i = 0; i < examples.size(); ++i) {
    (examples[i].marked ? positives : negatives).push_back(i);
  }

  std::mt19937 rng(seed);
  seeded_shuffle(positives, rng);
  seeded_shuffle(negatives, rng);
  // Negatives continue the rotation where positives stopped so fold sizes
  // differ by at most one overall.
  std::size_t next = 0;
  for (const std::size_t i : positives) fold[i] = next++ % k;
  for (const std::size_t i : negatives) fold[i] = next++ % k;
  return fold;
}

std::vector<SweepPoint> sweep_thresholds(std::span<const double> scores,
                                         std::span<const CalibrationExample> examples,
                                         const CalibratorConfig& config) {
  std::vector<SweepPoint> sweep;
  if (config.sweep_step <= 0.0 || config.sweep_stop < config.sweep_start) return sweep;

  const auto steps = static_cast<std::size_t>(
      std::floor((config.sweep_stop - config.sweep_start) / config.sweep_step + 1e-9));
  sweep.reserve(steps + 1);
  for (std::size_t s = 0; s <= steps; ++s) {
    SweepPoint point;
    const double raw = config.sweep_start + static_cast<double>(s) * config.sweep_step;
    point.threshold = std::round(raw * kThresholdResolution) / kThresholdResolution;
    for (std::size_t i = 0; i < examples.size() && i < scores.size(); ++i) {
      const bool predicted = scores[i] >= point.threshold;
      if (predicted && examples[i].marked) ++point.confusion.tp;
      else if (predicted) ++point.confusion.fp;
      else if (examples[i].marked) ++point.confusion.fn;
      else ++point.confusion.tn;
    }
    point.cost = config.fp_cost * static_cast<double>(point.confusion.fp) +
                 config.fn_cost * static_cast<double>(point.confusion.fn);
    sweep.push_back(point);
  }
  return sweep;
}

const SweepPoint& choose_threshold(std::span<const SweepPoint> sweep) {
  const SweepPoint* best = &sweep.front();
  for (const SweepPoint& p : sweep.subspan(1)) {
    if (p.cost < best->cost - kCostEpsilon) {
      best = &p;
    } else if (std::abs(p.cost - best->cost) <= kCostEpsilon) {
      if (p.confusion.fn < best->confusion.fn ||
          (p.confusion.fn == best->confusion.fn && p.threshold < best->threshold)) {
        best = &p;
      }
    }
  }
  return *best;
}

std::vector<FeatureRank> rank_features(std::span<const CalibrationExample> examples) {
  std::vector<FeatureRank> ranking;
  const std::size_t n = examples.size();
  if (n == 0) return ranking;
  const std::size_t total_pos = count_positive(examples);

  for (std::size_t j = 0; j < mc::kFeatureCount; ++j) {
    std::vector<std::pair<double, bool>> v;
    v.reserve(n);
    for (const auto& e : examples) v.emplace_back(e.features.values()[j], e.marked);
    std::sort(v.begin(), v.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    FeatureRank rank;
    rank.feature = static_cast<mc::Feature>(j);
    std::size_t best_correct = 0;
    std::size_t left_pos = 0;
    // Split i puts v[0..i) below the cutoff.
    for (std::size_t i = 0; i <= n; ++i) {
      if (i > 0) left_pos += v[i - 1].second ? 1 : 0;
      if (i > 0 && i < n && v[i].first == v[i - 1].first) continue;

      const std::size_t left_neg = i - left_pos;
      const std::size_t right_pos = total_pos - left_pos;
      const std::size_t right_neg = (n - i) - right_pos;
      const double cutoff = i == 0   ? v.front().first - 0.5
                            : i == n ? v.back().first + 0.5
                                     : 0.5 * (v[i - 1].first + v[i].first);

      const std::size_t above = left_neg + right_pos;
      const std::size_t below = left_pos + right_neg;
      if (above > best_correct) {
        best_correct = above;
        rank.cutoff = cutoff;
        rank.marked_above = true;
      }
      if (below > best_correct) {
        best_correct = below;
        rank.cutoff = cutoff;
        rank.marked_above = false;
      }
    }
    rank.accuracy = static_cast<double>(best_correct) / static_cast<double>(n);
    ranking.push_back(rank);
  }

  std::stable_sort(ranking.begin(), ranking.end(),
                   [](const FeatureRank& a, const FeatureRank& b) {
                     return a.accuracy > b.accuracy;
                   });
  return ranking;
}

Calibrator::Calibrator(CalibratorConfig config) : config_(std::move(config)) {}

std::expected<CalibrationOutcome, mc::PipelineError> Calibrator::calibrate(
    std::span<const CalibrationExample> examples) const {
  const std::size_t n = examples.size();
  const std::size_t pos = count_positive(examples);
  const std::size_t neg = n - pos;
  if (n < config_.min_examples || config_.folds < 2 || pos < config_.folds ||
      neg < config_.folds) {
    return std::unexpected(mc::PipelineError::CalibrationFailed);
  }

  CalibrationOutcome out;
  CalibrationReport& report = out.report;
  report.examples = n;
  report.positives = pos;

  const std::vector<std::size_t> fold_of = stratified_folds(examples, config_.folds, config_.seed);
  for (std::size_t f = 0; f < config_.folds; ++f) {
    std::vector<CalibrationExample> train_set;
    std::vector<CalibrationExample> test_set;
    for (std::size_t i = 0; i < n; ++i) {
      (fold_of[i] == f ? test_set : train_set).push_back(examples[i]);
    }
    auto trained = train(train_set, config_.regression);
    if (!trained) return std::unexpected(trained.error());
    report.folds.push_back(FoldScore{f, train_set.size(), test_set.size(),
                                     accuracy_at(trained->model, test_set)});
  }

  double sum = 0.0;
  for (const auto& fs : report.folds) sum += fs.accuracy;
  report.cv_mean_accuracy = sum / static_cast<double>(report.folds.size());
  double sq = 0.0;
  for (const auto& fs : report.folds) {
    sq += (fs.accuracy - report.cv_mean_accuracy) * (fs.accuracy - report.cv_mean_accuracy);
  }
  report.cv_std_accuracy = std::sqrt(sq / static_cast<double>(report.folds.size()));

  auto final_model = train(examples, config_.regression);
  if (!final_model) return std::unexpected(final_model.error());
  report.converged = final_model->converged;

  const CheckboxClassifier scorer(final_model->model);
  std::vector<double> scores;
  scores.reserve(n);
  for (const auto& e : examples) scores.push_back(scorer.score(e.features));

  report.sweep = sweep_thresholds(scores, examples, config_);
  if (report.sweep.empty()) {
    return std::unexpected(mc::PipelineError::CalibrationFailed);
  }
  report.chosen = choose_threshold(report.sweep);

  out.parameters = final_model->model;
  out.parameters.threshold = report.chosen.threshold;
  report.training_accuracy = report.chosen.confusion.accuracy();
  report.ranking = rank_features(examples);
  return out;
}

}  // namespace markscan::classify
