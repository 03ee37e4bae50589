#include <markscan/app/config.hpp>
#include <markscan/app/pipeline_factory.hpp>
#include <markscan/app/pipeline_runner.hpp>
#include <markscan/app/run_report.hpp>
#include <markscan/classify/classifier_parameters.hpp>
#include <markscan/core/pipeline.hpp>
#include <markscan/vision/load_image.hpp>
#include <support/synthetic_page.hpp>
#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <utility>
#include <vector>

namespace {

using namespace markscan::core;
using namespace markscan::app;
namespace mk = markscan::classify;
namespace mt = markscan::testing;

constexpr CheckboxId kMarked{3, 2};

Pipeline build(const mt::SyntheticForm& form, const mk::ClassifierParameters& params) {
  auto p = build_pipeline(default_config(), form.tpl, params);
  EXPECT_TRUE(p.has_value());
  return std::move(*p);
}

/// The form with three strokes in one box, slightly rotated and shifted.
cv::Mat skewed_scan(const mt::SyntheticForm& form) {
  cv::Mat filled = form.canonical.clone();
  mt::draw_bars(filled, mt::checkbox_rect(form.tpl, kMarked), 3);
  return mt::simulate_scan(filled, 1.0, cv::Point2d(10.0, -6.0));
}

void expect_single_mark(const PageResult& result) {
  EXPECT_EQ(result.status, PageStatus::Classified);
  ASSERT_TRUE(result.alignment.has_value());
  EXPECT_EQ(result.alignment->anchors_used, 4u);
  EXPECT_EQ(result.alignment->tier, QualityTier::Ok);
  EXPECT_EQ(found_count(result.anchors), 4u);
  ASSERT_EQ(result.checkboxes.size(), 25u);
  for (const auto& cb : result.checkboxes) {
    EXPECT_FALSE(cb.degenerate);
    EXPECT_EQ(cb.marked, cb.id == kMarked) << cb.id.row << "," << cb.id.col << " score "
                                            << cb.score;
  }
}

}  // namespace

TEST(FullPipeline, ThresholdModeFindsTheMarkedBoxOnASkewedScan) {
  const auto form = mt::make_grid_form();
  const Pipeline pipeline = build(form, mk::GlobalThreshold{0.115});

  auto result = run_page(pipeline, PageInput{1, "skewed", mt::page_of(skewed_scan(form))});
  ASSERT_TRUE(result.has_value()) << "Pipeline run failed";
  expect_single_mark(*result);
  EXPECT_TRUE(result->issues.empty());
}

TEST(FullPipeline, ModelModeFindsTheMarkedBoxOnASkewedScan) {
  const auto form = mt::make_grid_form();
  mk::LinearModel model;
  model.mean.fill(0.0);
  model.stddev.fill(1.0);
  model.weights[feature_index(Feature::ComponentCount)] = 4.0;
  model.bias = -2.0;
  model.threshold = 0.5;
  const Pipeline pipeline = build(form, model);

  auto result = run_page(pipeline, PageInput{2, "skewed", mt::page_of(skewed_scan(form))});
  ASSERT_TRUE(result.has_value());
  expect_single_mark(*result);
}

TEST(FullPipeline, ImageFileThroughReport) {
  const auto form = mt::make_grid_form();
  const Pipeline pipeline = build(form, mk::GlobalThreshold{});
  const auto path = std::filesystem::temp_directory_path() / "markscan_full_pipeline_scan.png";
  ASSERT_TRUE(cv::imwrite(path.string(), skewed_scan(form)));
  auto page = markscan::vision::load_page_image(path.string(), mt::kDpi);
  std::filesystem::remove(path);
  ASSERT_TRUE(page.has_value());

  std::vector<PageInput> pages;
  pages.push_back(PageInput{0, "scan", std::move(*page)});
  pages.push_back(PageInput{1, "blank", mt::page_of(mt::blank_canvas())});

  RunReport report;
  run_pages(pipeline, pages, [&report](const PageInput& in, const PageOutcome& out) {
    ASSERT_TRUE(out.has_value()) << in.page_name;
    report.add(*out);
    if (in.page_id == 0) expect_single_mark(*out);
  });

  EXPECT_EQ(report.pages(), 2u);
  EXPECT_EQ(report.ok(), 1u);
  EXPECT_EQ(report.unaligned(), 1u);
  // Blank page: four missing anchors, then too few to align.
  EXPECT_EQ(report.issues().size(), 5u);

  std::size_t missing = 0;
  for (const auto& item : report.review_queue()) {
    if (item.reason == ReviewReason::MissingAnswer) ++missing;
  }
  // Only question 3 is answered on the scan.
  EXPECT_EQ(missing, 4u);
}
