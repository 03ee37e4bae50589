#include <markscan/app/run_report.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <sstream>
#include <string>

namespace mc = markscan::core;
namespace ma = markscan::app;

namespace {

mc::ClassificationResult box(int row, int col, const std::string& group, double score,
                             double threshold = 0.115) {
  mc::ClassificationResult r;
  r.id = {row, col};
  r.group = group;
  r.score = score;
  r.threshold = threshold;
  r.marked = score >= threshold;
  return r;
}

mc::PageResult classified(std::uint64_t id, mc::QualityTier tier = mc::QualityTier::Ok) {
  mc::PageResult r;
  r.page_id = id;
  r.page_name = "page_" + std::to_string(id);
  r.status = mc::PageStatus::Classified;
  r.alignment = mc::AlignmentResult{};
  r.alignment->tier = tier;
  r.alignment->mean_residual_px = tier == mc::QualityTier::Ok ? 0.5 : 5.0;
  r.alignment->graded_residual_px = r.alignment->mean_residual_px;
  return r;
}

}  // namespace

TEST(ConfidenceLevel, BandsByDistanceFromThreshold) {
  EXPECT_EQ(ma::confidence_level(0.5, 0.115, 0.03), ma::ConfidenceLevel::High);
  EXPECT_EQ(ma::confidence_level(0.2, 0.115, 0.03), ma::ConfidenceLevel::Medium);
  EXPECT_EQ(ma::confidence_level(0.14, 0.115, 0.03), ma::ConfidenceLevel::Low);
  EXPECT_EQ(ma::confidence_level(0.12, 0.115, 0.03), ma::ConfidenceLevel::VeryLow);
  EXPECT_EQ(ma::confidence_level(0.09, 0.115, 0.03), ma::ConfidenceLevel::Low);
  EXPECT_EQ(ma::to_string(ma::ConfidenceLevel::VeryLow), "very_low");
}

TEST(RunReport, CleanPageNeedsNoReview) {
  ma::RunReport report;
  auto page = classified(1);
  page.checkboxes = {box(1, 1, "Q1", 0.6), box(1, 2, "Q1", 0.0), box(2, 1, "Q2", 0.0),
                     box(2, 2, "Q2", 0.8)};
  report.add(page);
  EXPECT_EQ(report.pages(), 1u);
  EXPECT_EQ(report.ok(), 1u);
  EXPECT_TRUE(report.review_queue().empty());
  EXPECT_TRUE(report.issues().empty());
}

TEST(RunReport, FlagsGroupConflictsMissingAnswersAndNearThreshold) {
  ma::RunReport report;
  auto page = classified(2);
  page.checkboxes = {box(1, 1, "Q1", 0.6), box(1, 2, "Q1", 0.5),   // two marks
                     box(2, 1, "Q2", 0.0), box(2, 2, "Q2", 0.0),   // none
                     box(3, 1, "Q3", 0.12), box(3, 2, "Q3", 0.0)};  // one, barely
  report.add(page);

  const auto& q = report.review_queue();
  ASSERT_EQ(q.size(), 3u);
  EXPECT_EQ(q[0].reason, ma::ReviewReason::GroupConflict);
  EXPECT_EQ(q[0].group, "Q1");
  EXPECT_EQ(q[1].reason, ma::ReviewReason::MissingAnswer);
  EXPECT_EQ(q[1].group, "Q2");
  EXPECT_EQ(q[2].reason, ma::ReviewReason::NearThreshold);
  ASSERT_TRUE(q[2].checkbox.has_value());
  EXPECT_EQ(*q[2].checkbox, (mc::CheckboxId{3, 1}));
}

TEST(RunReport, DegenerateCheckboxIsNotNearThreshold) {
  ma::RunReport report;
  auto page = classified(3);
  auto degenerate = box(1, 2, "Q1", 0.0, 0.01);
  degenerate.degenerate = true;
  page.checkboxes = {box(1, 1, "Q1", 0.9), degenerate};
  report.add(page);
  EXPECT_TRUE(report.review_queue().empty());
}

TEST(RunReport, CountsTiersAndUnalignedPages) {
  ma::RunReport report;
  report.add(classified(1, mc::QualityTier::Warn));

  auto failed = classified(2, mc::QualityTier::Fail);
  failed.status = mc::PageStatus::Halted;
  report.add(failed);

  mc::PageResult unaligned;
  unaligned.page_id = 3;
  unaligned.page_name = "page_3";
  unaligned.status = mc::PageStatus::Unaligned;
  unaligned.issues.push_back(mc::PageIssue{mc::IssueKind::InsufficientAnchors, std::nullopt,
                                           std::nullopt, "2 of 4 anchors found"});
  report.add(unaligned);

  report.add_failure(4, "page_4", mc::PipelineError::LoadFailed);

  EXPECT_EQ(report.pages(), 4u);
  EXPECT_EQ(report.warn(), 1u);
  EXPECT_EQ(report.fail(), 1u);
  EXPECT_EQ(report.halted(), 1u);
  EXPECT_EQ(report.unaligned(), 1u);
  EXPECT_EQ(report.failed(), 1u);
  EXPECT_EQ(report.issues().size(), 1u);

  const auto& q = report.review_queue();
  ASSERT_EQ(q.size(), 4u);
  EXPECT_EQ(q[0].reason, ma::ReviewReason::AlignmentWarn);
  EXPECT_EQ(q[1].reason, ma::ReviewReason::AlignmentFail);
  EXPECT_EQ(q[2].reason, ma::ReviewReason::Unaligned);
  EXPECT_EQ(q[3].reason, ma::ReviewReason::PipelineFailure);
}

TEST(RunReport, SortOrdersByPageKeepingPageOrder) {
  ma::RunReport report;
  auto later = classified(9);
  later.checkboxes = {box(1, 1, "Q1", 0.0), box(2, 1, "Q2", 0.0)};
  report.add(later);
  report.add_failure(1, "page_1", mc::PipelineError::InvalidPage);
  report.sort();

  const auto& q = report.review_queue();
  ASSERT_EQ(q.size(), 3u);
  EXPECT_EQ(q[0].page_id, 1u);
  EXPECT_EQ(q[1].group, "Q1");
  EXPECT_EQ(q[2].group, "Q2");
}

TEST(RunReport, WritesSummaryAndResultRows) {
  ma::RunReport report;
  auto page = classified(5);
  page.checkboxes = {box(1, 1, "Q1", 0.5), box(1, 2, "Q1", 0.0)};
  report.add(page);

  std::ostringstream text;
  report.write(text);
  EXPECT_NE(text.str().find("pages: 1"), std::string::npos);
  EXPECT_NE(text.str().find("review queue: 0"), std::string::npos);

  std::ostringstream csv;
  ma::write_results_header(csv);
  ma::write_results_rows(csv, page);
  EXPECT_EQ(csv.str(),
            "page,row,col,group,score,threshold,marked,degenerate,tier\n"
            "page_5,1,1,Q1,0.500000,0.115000,1,0,ok\n"
            "page_5,1,2,Q1,0.000000,0.115000,0,0,ok\n");

  std::ostringstream summary;
  ma::write_page_summary(summary, page);
  EXPECT_NE(summary.str().find("status: classified"), std::string::npos);
  EXPECT_NE(summary.str().find("anchor top_left: not found"), std::string::npos);
  EXPECT_NE(summary.str().find("Q1: 1\n"), std::string::npos);
}
