#include <markscan/classify/calibrator.hpp>
#include <markscan/classify/checkbox_classifier.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <set>
#include <span>
#include <vector>

namespace mc = markscan::core;
namespace mk = markscan::classify;

namespace {

/// Two well separated clusters: marked boxes have ink and several strokes.
std::vector<mk::CalibrationExample> clustered(std::size_t per_class) {
  std::vector<mk::CalibrationExample> out;
  for (std::size_t i = 0; i < per_class; ++i) {
    const double jitter = 0.01 * static_cast<double>(i % 5);
    mc::FeatureVector::Values on{};
    on[mc::feature_index(mc::Feature::FillRatio)] = 0.40 + jitter;
    on[mc::feature_index(mc::Feature::ComponentCount)] = 2.0 + static_cast<double>(i % 3);
    on[mc::feature_index(mc::Feature::EdgeDensity)] = 0.30 + jitter;
    mc::FeatureVector::Values off{};
    off[mc::feature_index(mc::Feature::FillRatio)] = 0.01 + jitter;
    off[mc::feature_index(mc::Feature::ComponentCount)] = static_cast<double>(i % 2);
    off[mc::feature_index(mc::Feature::EdgeDensity)] = 0.02 + jitter;
    out.push_back({mc::FeatureVector(on), true});
    out.push_back({mc::FeatureVector(off), false});
  }
  return out;
}

mk::SweepPoint point(double threshold, std::size_t fp, std::size_t fn, double cost) {
  mk::SweepPoint p;
  p.threshold = threshold;
  p.confusion.fp = fp;
  p.confusion.fn = fn;
  p.cost = cost;
  return p;
}

}  // namespace

TEST(Calibrator, FitsSeparableData) {
  const auto data = clustered(20);
  const mk::Calibrator calibrator;
  auto outcome = calibrator.calibrate(data);
  ASSERT_TRUE(outcome.has_value());

  const auto& report = outcome->report;
  EXPECT_EQ(report.examples, 40u);
  EXPECT_EQ(report.positives, 20u);
  ASSERT_EQ(report.folds.size(), 5u);
  for (const auto& f : report.folds) {
    EXPECT_EQ(f.train_size + f.test_size, 40u);
    EXPECT_EQ(f.test_size, 8u);
  }
  EXPECT_GE(report.cv_mean_accuracy, 0.9);
  EXPECT_GE(report.training_accuracy, 0.95);
  EXPECT_TRUE(report.converged);
  EXPECT_EQ(report.ranking.size(), mc::kFeatureCount);
  ASSERT_EQ(report.sweep.size(), 10u);
  EXPECT_DOUBLE_EQ(outcome->parameters.threshold, report.chosen.threshold);

  const mk::CheckboxClassifier classifier(outcome->parameters);
  EXPECT_TRUE(classifier.classify(data[0].features).marked);
  EXPECT_FALSE(classifier.classify(data[1].features).marked);
  for (const double sd : outcome->parameters.stddev) EXPECT_GT(sd, 0.0);
}

TEST(Calibrator, SameInputGivesSameParameters) {
  const auto data = clustered(15);
  const mk::Calibrator calibrator;
  auto a = calibrator.calibrate(data);
  auto b = calibrator.calibrate(data);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(a->parameters, b->parameters);
  EXPECT_EQ(a->report.cv_mean_accuracy, b->report.cv_mean_accuracy);
}

TEST(Calibrator, RejectsTooFewExamples) {
  const auto data = clustered(20);
  const mk::Calibrator calibrator;
  auto r = calibrator.calibrate(std::span(data).first(9));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), mc::PipelineError::CalibrationFailed);
}

TEST(Calibrator, RejectsClassSmallerThanFoldCount) {
  auto data = clustered(20);
  // Keep four positives, all negatives.
  std::vector<mk::CalibrationExample> skewed;
  std::size_t positives = 0;
  for (const auto& e : data) {
    if (e.marked && positives++ >= 4) continue;
    skewed.push_back(e);
  }
  auto r = mk::Calibrator{}.calibrate(skewed);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), mc::PipelineError::CalibrationFailed);

  std::vector<mk::CalibrationExample> one_class;
  for (const auto& e : data) {
    if (!e.marked) one_class.push_back(e);
  }
  EXPECT_FALSE(mk::Calibrator{}.calibrate(one_class).has_value());
}

TEST(StratifiedFolds, EveryFoldHoldsBothClasses) {
  const auto data = clustered(13);
  const auto folds = mk::stratified_folds(data, 5, 42);
  ASSERT_EQ(folds.size(), data.size());

  std::vector<std::size_t> size(5, 0);
  std::vector<std::set<bool>> classes(5);
  for (std::size_t i = 0; i < data.size(); ++i) {
    ASSERT_LT(folds[i], 5u);
    ++size[folds[i]];
    classes[folds[i]].insert(data[i].marked);
  }
  for (const auto& c : classes) EXPECT_EQ(c.size(), 2u);
  const auto [lo, hi] = std::minmax_element(size.begin(), size.end());
  EXPECT_LE(*hi - *lo, 1u);

  EXPECT_EQ(folds, mk::stratified_folds(data, 5, 42));
}

TEST(BalancedWeights, InverseClassFrequency) {
  std::vector<mk::CalibrationExample> data(4);
  data[3].marked = true;
  const auto w = mk::balanced_weights(data);
  ASSERT_EQ(w.size(), 4u);
  EXPECT_DOUBLE_EQ(w[0], 4.0 / 6.0);
  EXPECT_DOUBLE_EQ(w[3], 2.0);
}

TEST(Standardization, ConstantFeatureKeepsUnitDeviation) {
  std::vector<mk::CalibrationExample> data;
  for (int i = 0; i < 4; ++i) {
    mc::FeatureVector::Values v{};
    v[0] = static_cast<double>(i);
    v[1] = 5.0;
    data.push_back({mc::FeatureVector(v), i % 2 == 0});
  }
  const auto s = mk::fit_standardization(data);
  EXPECT_DOUBLE_EQ(s.mean[0], 1.5);
  EXPECT_DOUBLE_EQ(s.stddev[0], std::sqrt(1.25));
  EXPECT_DOUBLE_EQ(s.mean[1], 5.0);
  EXPECT_DOUBLE_EQ(s.stddev[1], 1.0);
  EXPECT_DOUBLE_EQ(s.apply(data[0].features)[1], 0.0);
}

TEST(ThresholdSweep, CountsScoresAtOrAboveThreshold) {
  std::vector<mk::CalibrationExample> data(4);
  data[2].marked = true;
  data[3].marked = true;
  const std::vector<double> scores{0.1, 0.5, 0.5, 0.9};
  mk::CalibratorConfig cfg;
  cfg.sweep_start = 0.5;
  cfg.sweep_stop = 0.5;
  const auto sweep = mk::sweep_thresholds(scores, data, cfg);
  ASSERT_EQ(sweep.size(), 1u);
  EXPECT_EQ(sweep[0].confusion.tp, 2u);
  EXPECT_EQ(sweep[0].confusion.fp, 1u);
  EXPECT_EQ(sweep[0].confusion.tn, 1u);
  EXPECT_EQ(sweep[0].confusion.fn, 0u);
  EXPECT_DOUBLE_EQ(sweep[0].cost, 1.0);
}

TEST(ThresholdSweep, MissedMarksCanCostMore) {
  std::vector<mk::CalibrationExample> data(4);
  data[2].marked = true;
  data[3].marked = true;
  // One negative scores 0.55, one positive 0.45.
  const std::vector<double> scores{0.1, 0.55, 0.45, 0.9};
  mk::CalibratorConfig cfg;
  cfg.fn_cost = 5.0;
  const auto sweep = mk::sweep_thresholds(scores, data, cfg);
  const auto& chosen = mk::choose_threshold(sweep);
  EXPECT_EQ(chosen.confusion.fn, 0u);
  EXPECT_LE(chosen.threshold, 0.45);

  cfg.fn_cost = 1.0;
  cfg.fp_cost = 5.0;
  const auto strict = mk::sweep_thresholds(scores, data, cfg);
  EXPECT_EQ(mk::choose_threshold(strict).confusion.fp, 0u);
}

TEST(ThresholdSweep, TiesPreferFewerMissesThenLowerThreshold) {
  const std::vector<mk::SweepPoint> by_misses{point(0.4, 2, 1, 3.0), point(0.5, 3, 0, 3.0)};
  EXPECT_DOUBLE_EQ(mk::choose_threshold(by_misses).threshold, 0.5);

  const std::vector<mk::SweepPoint> by_threshold{point(0.6, 1, 1, 2.0), point(0.4, 1, 1, 2.0),
                                                 point(0.5, 1, 1, 2.0)};
  EXPECT_DOUBLE_EQ(mk::choose_threshold(by_threshold).threshold, 0.4);

  const std::vector<mk::SweepPoint> by_cost{point(0.3, 0, 0, 1.0), point(0.7, 0, 0, 0.5)};
  EXPECT_DOUBLE_EQ(mk::choose_threshold(by_cost).threshold, 0.7);
}

TEST(ThresholdSweep, GridIncludesBothEnds) {
  const std::vector<double> scores;
  const std::vector<mk::CalibrationExample> data;
  const auto sweep = mk::sweep_thresholds(scores, data, mk::CalibratorConfig{});
  ASSERT_EQ(sweep.size(), 10u);
  EXPECT_DOUBLE_EQ(sweep.front().threshold, 0.30);
  EXPECT_NEAR(sweep.back().threshold, 0.75, 1e-12);
}

TEST(ThresholdSweep, ThresholdsAreExactDecimals) {
  const std::vector<double> scores;
  const std::vector<mk::CalibrationExample> data;
  const auto sweep = mk::sweep_thresholds(scores, data, mk::CalibratorConfig{});
  ASSERT_EQ(sweep.size(), 10u);
  // 0.30 + 6 * 0.05 is 0.60000000000000009 before snapping.
  EXPECT_EQ(sweep[3].threshold, 0.45);
  EXPECT_EQ(sweep[6].threshold, 0.6);
  EXPECT_EQ(sweep.back().threshold, 0.75);

  mk::CalibratorConfig fine;
  fine.sweep_start = 0.1;
  fine.sweep_stop = 0.3;
  fine.sweep_step = 0.1;
  const auto coarse = mk::sweep_thresholds(scores, data, fine);
  ASSERT_EQ(coarse.size(), 3u);
  EXPECT_EQ(coarse[2].threshold, 0.3);
}
