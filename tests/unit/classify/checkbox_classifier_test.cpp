#include <markscan/classify/checkbox_classifier.hpp>
#include <markscan/classify/classification_stage.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <variant>

namespace mc = markscan::core;
namespace mk = markscan::classify;

namespace {

mc::FeatureVector with(mc::Feature f, double v) {
  mc::FeatureVector::Values values{};
  values[mc::feature_index(f)] = v;
  return mc::FeatureVector(values);
}

mk::LinearModel component_model() {
  mk::LinearModel m;
  m.mean.fill(0.0);
  m.stddev.fill(1.0);
  m.weights[mc::feature_index(mc::Feature::ComponentCount)] = 4.0;
  m.bias = -2.0;
  m.threshold = 0.5;
  return m;
}

}  // namespace

TEST(Sigmoid, StableAndSymmetric) {
  EXPECT_DOUBLE_EQ(mk::sigmoid(0.0), 0.5);
  EXPECT_DOUBLE_EQ(mk::sigmoid(1000.0), 1.0);
  EXPECT_DOUBLE_EQ(mk::sigmoid(-1000.0), 0.0);
  for (double z = -30.0; z <= 30.0; z += 0.75) {
    EXPECT_NEAR(mk::sigmoid(z) + mk::sigmoid(-z), 1.0, 1e-12);
  }
}

TEST(CheckboxClassifier, GlobalThresholdUsesFillRatio) {
  const mk::CheckboxClassifier c;
  EXPECT_DOUBLE_EQ(c.threshold_for("Q1"), 0.115);

  const auto at = c.classify(with(mc::Feature::FillRatio, 0.115));
  EXPECT_DOUBLE_EQ(at.score, 0.115);
  EXPECT_TRUE(at.marked);
  EXPECT_FALSE(c.classify(with(mc::Feature::FillRatio, 0.1149)).marked);
  // Other features are ignored in threshold mode.
  EXPECT_FALSE(c.classify(with(mc::Feature::ComponentCount, 9.0)).marked);
}

TEST(CheckboxClassifier, ScoreIsClampedToUnitInterval) {
  const mk::CheckboxClassifier c(mk::GlobalThreshold{0.5});
  EXPECT_DOUBLE_EQ(c.score(with(mc::Feature::FillRatio, 1.7)), 1.0);
  EXPECT_DOUBLE_EQ(c.score(with(mc::Feature::FillRatio, -0.2)), 0.0);
}

TEST(CheckboxClassifier, GroupThresholdsFallBackToDefault) {
  mk::GroupThresholds g;
  g.default_threshold = 0.2;
  g.thresholds = {{"Q1", 0.05}, {"Q2", 0.4}};
  const mk::CheckboxClassifier c(g);
  EXPECT_DOUBLE_EQ(c.threshold_for("Q1"), 0.05);
  EXPECT_DOUBLE_EQ(c.threshold_for("Q2"), 0.4);
  EXPECT_DOUBLE_EQ(c.threshold_for("Q9"), 0.2);

  const auto f = with(mc::Feature::FillRatio, 0.1);
  EXPECT_TRUE(c.classify(f, "Q1").marked);
  EXPECT_FALSE(c.classify(f, "Q2").marked);
  EXPECT_FALSE(c.classify(f, "Q9").marked);
}

TEST(CheckboxClassifier, LinearModelAppliesLogisticToStandardizedFeatures) {
  const mk::CheckboxClassifier c(component_model());
  const auto one = c.classify(with(mc::Feature::ComponentCount, 1.0));
  EXPECT_NEAR(one.score, 1.0 / (1.0 + std::exp(-2.0)), 1e-12);
  EXPECT_TRUE(one.marked);
  EXPECT_DOUBLE_EQ(one.threshold, 0.5);

  const auto none = c.classify(with(mc::Feature::ComponentCount, 0.0));
  EXPECT_NEAR(none.score, 1.0 / (1.0 + std::exp(2.0)), 1e-12);
  EXPECT_FALSE(none.marked);

  auto shifted = component_model();
  shifted.mean[mc::feature_index(mc::Feature::ComponentCount)] = 1.0;
  shifted.stddev[mc::feature_index(mc::Feature::ComponentCount)] = 2.0;
  const mk::CheckboxClassifier s(shifted);
  // (3 - 1) / 2 = 1 standardized unit.
  EXPECT_NEAR(s.score(with(mc::Feature::ComponentCount, 3.0)), mk::sigmoid(2.0), 1e-12);
}

TEST(CheckboxClassifier, DecisionIsMonotonicInScoreAndThreshold) {
  const mk::CheckboxClassifier c(component_model());
  double previous = -1.0;
  for (int k = 0; k <= 10; ++k) {
    const double s = c.score(with(mc::Feature::ComponentCount, 0.5 * k));
    EXPECT_GE(s, previous);
    EXPECT_GE(s, 0.0);
    EXPECT_LE(s, 1.0);
    previous = s;
  }
  const auto f = with(mc::Feature::FillRatio, 0.3);
  for (double t = 0.0; t <= 1.0; t += 0.05) {
    if (mk::CheckboxClassifier(mk::GlobalThreshold{t}).classify(f).marked) {
      EXPECT_TRUE(mk::CheckboxClassifier(mk::GlobalThreshold{t * 0.5}).classify(f).marked);
    }
  }
}

namespace {

mc::FormTemplate two_box_template() {
  mc::FormTemplate t;
  t.canvas = {100, 100};
  t.checkboxes = {mc::CheckboxSpec{{1, 1}, {0.1, 0.1, 0.1, 0.1}, "Q1"},
                  mc::CheckboxSpec{{1, 2}, {0.3, 0.1, 0.1, 0.1}, "Q1"}};
  return t;
}

mc::PageState aligned_state() {
  mc::PageState s;
  s.page_id = 3;
  s.alignment = mc::AlignmentResult{};
  s.features = {mc::CheckboxFeatures{{1, 1}, with(mc::Feature::FillRatio, 0.4)},
                mc::CheckboxFeatures{{1, 2}, std::nullopt}};
  return s;
}

}  // namespace

TEST(ClassificationStage, DecidesEveryCheckbox) {
  const mk::ClassificationStage stage(two_box_template(), mk::CheckboxClassifier{});
  auto out = stage.process(aligned_state());
  ASSERT_TRUE(out.has_value());
  ASSERT_TRUE(std::holds_alternative<mc::PageResult>(*out));
  const auto& r = std::get<mc::PageResult>(*out);
  EXPECT_EQ(r.status, mc::PageStatus::Classified);
  EXPECT_EQ(r.page_id, 3u);
  ASSERT_EQ(r.checkboxes.size(), 2u);

  EXPECT_EQ(r.checkboxes[0].id, (mc::CheckboxId{1, 1}));
  EXPECT_EQ(r.checkboxes[0].group, "Q1");
  EXPECT_DOUBLE_EQ(r.checkboxes[0].score, 0.4);
  EXPECT_TRUE(r.checkboxes[0].marked);
  EXPECT_FALSE(r.checkboxes[0].degenerate);
  ASSERT_TRUE(r.checkboxes[0].features.has_value());

  EXPECT_TRUE(r.checkboxes[1].degenerate);
  EXPECT_FALSE(r.checkboxes[1].marked);
  EXPECT_DOUBLE_EQ(r.checkboxes[1].score, 0.0);
  EXPECT_DOUBLE_EQ(r.checkboxes[1].threshold, 0.115);
  EXPECT_FALSE(r.checkboxes[1].features.has_value());
}

TEST(ClassificationStage, NeedsAlignmentAndMatchingFeatures) {
  const mk::ClassificationStage stage(two_box_template(), mk::CheckboxClassifier{});

  auto unaligned = aligned_state();
  unaligned.alignment.reset();
  auto a = stage.process(unaligned);
  ASSERT_FALSE(a.has_value());
  EXPECT_EQ(a.error(), mc::PipelineError::InvalidConfig);

  auto short_features = aligned_state();
  short_features.features.pop_back();
  auto b = stage.process(short_features);
  ASSERT_FALSE(b.has_value());
  EXPECT_EQ(b.error(), mc::PipelineError::InvalidConfig);
}
