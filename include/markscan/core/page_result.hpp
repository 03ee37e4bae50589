#pragma once

#include <markscan/core/alignment_result.hpp>
#include <markscan/core/anchor.hpp>
#include <markscan/core/classification_result.hpp>
#include <markscan/core/error.hpp>
#include <markscan/core/feature_vector.hpp>
#include <markscan/core/form_template.hpp>
#include <markscan/core/page_image.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace markscan::core {

/// One page- or checkbox-scoped condition collected during processing.
struct PageIssue {
  IssueKind kind{IssueKind::AnchorNotFound};
  std::optional<Corner> corner;
  std::optional<CheckboxId> checkbox;
  std::string detail;
};

enum class PageStatus : std::uint8_t {
  Classified,  // aligned and every checkbox decided
  Unaligned,   // fewer than three anchors; nothing classified
  Halted,      // fail tier with stop_on_fail; aligned image kept
};

[[nodiscard]] std::string_view to_string(PageStatus status) noexcept;

/// Terminal output of the page pipeline.
struct PageResult {
  std::uint64_t page_id{0};
  std::string page_name;
  PageStatus status{PageStatus::Unaligned};
  AnchorSet anchors{};
  std::optional<AlignmentResult> alignment;
  std::vector<ClassificationResult> checkboxes;
  std::vector<PageIssue> issues;

  [[nodiscard]] bool needs_review() const noexcept {
    return status != PageStatus::Classified ||
           (alignment && alignment->tier == QualityTier::Fail);
  }
};

/// Features of one checkbox, or nullopt when its ROI is degenerate.
struct CheckboxFeatures {
  CheckboxId id{};
  std::optional<FeatureVector> features;
};

/// Intermediate state handed from stage to stage. Stages never modify their
/// input; each returns a new state (the image buffer is shared, not copied).
struct PageState {
  std::uint64_t page_id{0};
  std::string page_name;
  PageImage image{};
  AnchorSet anchors{};
  std::optional<AlignmentResult> alignment;
  std::vector<CheckboxFeatures> features;
  std::vector<PageIssue> issues;
};

/// Terminal result carrying everything gathered in state so far.
[[nodiscard]] PageResult finish(const PageState& state, PageStatus status);

}  // namespace markscan::core
