#pragma once

#include <markscan/core/error.hpp>
#include <markscan/core/page_result.hpp>
#include <markscan/core/pipeline_stage.hpp>
#include <markscan/vision/geometric_aligner.hpp>
#include <expected>

namespace markscan::vision {

/// Pipeline stage: align the page to the template.
/// Fewer than three usable anchors ends the page as Unaligned. A fail tier is
/// flagged for review; with stop_on_fail the page ends as Halted.
class AlignmentStage : public markscan::core::IPipelineStage {
 public:
  explicit AlignmentStage(GeometricAligner aligner, bool stop_on_fail = false);

  [[nodiscard]] std::expected<markscan::core::StageOutput,
                              markscan::core::PipelineError>
  process(const markscan::core::PageState& input) const override;

 private:
  GeometricAligner aligner_;
  bool stop_on_fail_;
};

}  // namespace markscan::vision
