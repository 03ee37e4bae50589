#pragma once

#include <markscan/core/error.hpp>
#include <markscan/core/form_template.hpp>
#include <markscan/core/page_result.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace markscan::app {

enum class ConfidenceLevel : std::uint8_t { High, Medium, Low, VeryLow };

[[nodiscard]] std::string_view to_string(ConfidenceLevel level) noexcept;

/// Level by distance d = |score - threshold|: high above 0.10, medium above
/// near_margin, low above 0.015, otherwise very low.
[[nodiscard]] ConfidenceLevel confidence_level(double score, double threshold,
                                               double near_margin) noexcept;

enum class ReviewReason : std::uint8_t {
  AlignmentWarn,
  AlignmentFail,
  Unaligned,
  PipelineFailure,
  GroupConflict,   // more than one mark in a group
  MissingAnswer,   // no mark in a group
  NearThreshold,
};

[[nodiscard]] std::string_view to_string(ReviewReason reason) noexcept;

struct ReviewItem {
  std::uint64_t page_id{0};
  std::string page_name;
  ReviewReason reason{ReviewReason::Unaligned};
  std::string group;
  std::optional<markscan::core::CheckboxId> checkbox;
  std::string detail;
};

struct IssueRecord {
  std::uint64_t page_id{0};
  std::string page_name;
  markscan::core::PageIssue issue;
};

/// Aggregates page results of one run. Not thread-safe; parallel runners
/// should feed it under a lock and call sort() before writing.
class RunReport {
 public:
  explicit RunReport(double near_margin = 0.03);

  void add(const markscan::core::PageResult& result);
  /// A page whose pipeline returned an error (e.g. an unreadable image).
  void add_failure(std::uint64_t page_id, const std::string& page_name,
                   markscan::core::PipelineError error);

  /// Orders issues and review items by page id, keeping per-page order.
  void sort();

  [[nodiscard]] std::size_t pages() const noexcept { return pages_; }
  [[nodiscard]] std::size_t ok() const noexcept { return ok_; }
  [[nodiscard]] std::size_t warn() const noexcept { return warn_; }
  [[nodiscard]] std::size_t fail() const noexcept { return fail_; }
  [[nodiscard]] std::size_t unaligned() const noexcept { return unaligned_; }
  [[nodiscard]] std::size_t halted() const noexcept { return halted_; }
  [[nodiscard]] std::size_t failed() const noexcept { return failed_; }

  [[nodiscard]] const std::vector<IssueRecord>& issues() const noexcept { return issues_; }
  [[nodiscard]] const std::vector<ReviewItem>& review_queue() const noexcept {
    return review_;
  }

  void write(std::ostream& out) const;

 private:
  void review_groups(const markscan::core::PageResult& result);

  double near_margin_;
  std::size_t pages_{0};
  std::size_t ok_{0};
  std::size_t warn_{0};
  std::size_t fail_{0};
  std::size_t unaligned_{0};
  std::size_t halted_{0};
  std::size_t failed_{0};
  std::vector<IssueRecord> issues_;
  std::vector<ReviewItem> review_;
};

/// Human-readable per-page summary: status, anchors, alignment and marks.
void write_page_summary(std::ostream& out, const markscan::core::PageResult& result);

/// `page,row,col,group,score,threshold,marked,degenerate,tier` rows.
void write_results_header(std::ostream& out);
void write_results_rows(std::ostream& out, const markscan::core::PageResult& result);

}  // namespace markscan::app
