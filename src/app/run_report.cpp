#include <markscan/app/run_report.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <utility>

namespace markscan::app {

namespace mc = markscan::core;

namespace {

constexpr double kHighConfidence = 0.10;
constexpr double kLowConfidence = 0.015;

std::string fixed(double v, int digits) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.*f", digits, v);
  return buf;
}

std::string describe(const mc::PageIssue& issue) {
  std::string s(mc::to_string(issue.kind));
  if (issue.corner) s += " [" + std::string(mc::to_string(*issue.corner)) + "]";
  if (issue.checkbox) {
    s += " [" + std::to_string(issue.checkbox->row) + "," +
         std::to_string(issue.checkbox->col) + "]";
  }
  if (!issue.detail.empty()) s += ": " + issue.detail;
  return s;
}

}  // namespace

std::string_view to_string(ConfidenceLevel level) noexcept {
  switch (level) {
    case ConfidenceLevel::High:
      return "high";
    case ConfidenceLevel::Medium:
      return "medium";
    case ConfidenceLevel::Low:
      return "low";
    case ConfidenceLevel::VeryLow:
      return "very_low";
  }
  return "unknown";
}

ConfidenceLevel confidence_level(double score, double threshold, double near_margin) noexcept {
  const double d = std::abs(score - threshold);
  if (d > kHighConfidence) return ConfidenceLevel::High;
  if (d > near_margin) return ConfidenceLevel::Medium;
  if (d > kLowConfidence) return ConfidenceLevel::Low;
  return ConfidenceLevel::VeryLow;
}

std::string_view to_string(ReviewReason reason) noexcept {
  switch (reason) {
    case ReviewReason::AlignmentWarn:
      return "alignment_warn";
    case ReviewReason::AlignmentFail:
      return "alignment_fail";
    case ReviewReason::Unaligned:
      return "unaligned";
    case ReviewReason::PipelineFailure:
      return "pipeline_failure";
    case ReviewReason::GroupConflict:
      return "group_conflict";
    case ReviewReason::MissingAnswer:
      return "missing_answer";
    case ReviewReason::NearThreshold:
      return "near_threshold";
  }
  return "unknown";
}

RunReport::RunReport(double near_margin) : near_margin_(near_margin) {}

void RunReport::add(const mc::PageResult& result) {
  ++pages_;
  for (const auto& issue : result.issues) {
    issues_.push_back(IssueRecord{result.page_id, result.page_name, issue});
  }

  auto queue = [&](ReviewReason reason, std::string detail) {
    review_.push_back(ReviewItem{result.page_id, result.page_name, reason, {}, std::nullopt,
                                 std::move(detail)});
  };

  if (result.status == mc::PageStatus::Unaligned || !result.alignment) {
    ++unaligned_;
    queue(ReviewReason::Unaligned,
          std::to_string(mc::found_count(result.anchors)) + " of 4 anchors found");
    return;
  }

  const mc::AlignmentResult& a = *result.alignment;
  const std::string residual = "residual " + fixed(a.graded_residual_px, 2) + " px";
  switch (a.tier) {
    case mc::QualityTier::Ok:
      ++ok_;
      break;
    case mc::QualityTier::Warn:
      ++warn_;
      queue(ReviewReason::AlignmentWarn, residual);
      break;
    case mc::QualityTier::Fail:
      ++fail_;
      queue(ReviewReason::AlignmentFail, residual);
      break;
  }
  if (result.status == mc::PageStatus::Halted) {
    ++halted_;
    return;
  }
  review_groups(result);
}

void RunReport::review_groups(const mc::PageResult& result) {
  // Groups in first-seen order.
  std::vector<std::string> order;
  std::map<std::string, std::size_t> marks;
  for (const auto& cb : result.checkboxes) {
    if (marks.emplace(cb.group, 0).second) order.push_back(cb.group);
    if (cb.marked) ++marks[cb.group];
  }
  for (const auto& group : order) {
    const std::size_t n = marks[group];
    if (n == 1) continue;
    review_.push_back(ReviewItem{
        result.page_id, result.page_name,
        n == 0 ? ReviewReason::MissingAnswer : ReviewReason::GroupConflict, group,
        std::nullopt, std::to_string(n) + " marked"});
  }

  for (const auto& cb : result.checkboxes) {
    if (cb.degenerate) continue;
    const ConfidenceLevel level = confidence_level(cb.score, cb.threshold, near_margin_);
    if (level != ConfidenceLevel::Low && level != ConfidenceLevel::VeryLow) continue;
    review_.push_back(ReviewItem{result.page_id, result.page_name,
                                 ReviewReason::NearThreshold, cb.group, cb.id,
                                 "score " + fixed(cb.score, 3) + " vs " +
                                     fixed(cb.threshold, 3) + " (" +
                                     std::string(to_string(level)) + ")"});
  }
}

void RunReport::add_failure(std::uint64_t page_id, const std::string& page_name,
                            mc::PipelineError error) {
  ++pages_;
  ++failed_;
  review_.push_back(ReviewItem{page_id, page_name, ReviewReason::PipelineFailure, {},
                               std::nullopt, std::string(mc::to_string(error))});
}

void RunReport::sort() {
  std::stable_sort(issues_.begin(), issues_.end(),
                   [](const IssueRecord& a, const IssueRecord& b) {
                     return a.page_id < b.page_id;
                   });
  std::stable_sort(review_.begin(), review_.end(),
                   [](const ReviewItem& a, const ReviewItem& b) {
                     return a.page_id < b.page_id;
                   });
}

void RunReport::write(std::ostream& out) const {
  out << "pages: " << pages_ << "\n"
      << "  ok: " << ok_ << "  warn: " << warn_ << "  fail: " << fail_
      << "  unaligned: " << unaligned_ << "  halted: " << halted_
      << "  failed: " << failed_ << "\n";

  out << "issues: " << issues_.size() << "\n";
  for (const auto& rec : issues_) {
    out << "  " << rec.page_name << ": " << describe(rec.issue) << "\n";
  }

  out << "review queue: " << review_.size() << "\n";
  for (const auto& item : review_) {
    out << "  " << item.page_name << ": " << to_string(item.reason);
    if (!item.group.empty()) out << " " << item.group;
    if (item.checkbox) out << " (" << item.checkbox->row << "," << item.checkbox->col << ")";
    if (!item.detail.empty()) out << " - " << item.detail;
    out << "\n";
  }
}

void write_page_summary(std::ostream& out, const mc::PageResult& result) {
  out << "page: " << result.page_name << "\n"
      << "status: " << mc::to_string(result.status) << "\n";

  for (const mc::Corner c : mc::kCorners) {
    out << "anchor " << mc::to_string(c) << ": ";
    if (const auto& a = result.anchors[mc::corner_index(c)]) {
      out << fixed(a->position.x, 1) << ", " << fixed(a->position.y, 1)
          << " confidence " << fixed(a->confidence, 3) << "\n";
    } else {
      out << "not found\n";
    }
  }

  if (result.alignment) {
    const auto& a = *result.alignment;
    out << "alignment: " << (a.transform.kind() == mc::TransformKind::Affine ? "affine" : "projective")
        << " (" << a.anchors_used << " anchors), tier " << mc::to_string(a.tier)
        << ", mean residual " << fixed(a.mean_residual_px, 2) << " px, max "
        << fixed(a.max_residual_px, 2) << " px, planarity " << fixed(a.planarity_px, 2)
        << " px\n"
        << "crop: " << a.crop.x0 << "," << a.crop.y0 << " - " << a.crop.x1 << ","
        << a.crop.y1 << "\n";
  }

  for (const auto& issue : result.issues) {
    out << "issue: " << describe(issue) << "\n";
  }

  std::string group;
  for (const auto& cb : result.checkboxes) {
    if (cb.group != group) {
      if (!group.empty()) out << "\n";
      group = cb.group;
      out << group << ":";
    }
    if (cb.marked) out << " " << cb.id.col;
  }
  if (!group.empty()) out << "\n";
}

void write_results_header(std::ostream& out) {
  out << "page,row,col,group,score,threshold,marked,degenerate,tier\n";
}

void write_results_rows(std::ostream& out, const mc::PageResult& result) {
  const std::string_view tier =
      result.alignment ? mc::to_string(result.alignment->tier) : std::string_view("none");
  for (const auto& cb : result.checkboxes) {
    out << result.page_name << ',' << cb.id.row << ',' << cb.id.col << ',' << cb.group << ','
        << fixed(cb.score, 6) << ',' << fixed(cb.threshold, 6) << ',' << (cb.marked ? 1 : 0)
        << ',' << (cb.degenerate ? 1 : 0) << ',' << tier << '\n';
  }
}

}  // namespace markscan::app
