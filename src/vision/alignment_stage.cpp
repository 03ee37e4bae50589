#include <markscan/vision/alignment_stage.hpp>
#include <cstdio>
#include <string>
#include <utility>

namespace markscan::vision {

namespace mc = markscan::core;

AlignmentStage::AlignmentStage(GeometricAligner aligner, bool stop_on_fail)
    : aligner_(std::move(aligner)), stop_on_fail_(stop_on_fail) {}

std::expected<mc::StageOutput, mc::PipelineError> AlignmentStage::process(
    const mc::PageState& input) const {
  auto aligned = aligner_.align(input.image, input.anchors);
  if (!aligned) {
    const mc::PipelineError err = aligned.error();
    if (err != mc::PipelineError::InsufficientAnchors &&
        err != mc::PipelineError::TransformFailed) {
      return std::unexpected(err);
    }
    mc::PageState state = input;
    state.issues.push_back(mc::PageIssue{
        mc::IssueKind::InsufficientAnchors, std::nullopt, std::nullopt,
        err == mc::PipelineError::InsufficientAnchors
            ? std::to_string(mc::found_count(input.anchors)) + " of 4 anchors found"
            : "anchor geometry is degenerate"});
    return mc::StageOutput{mc::finish(state, mc::PageStatus::Unaligned)};
  }

  mc::PageState out = input;
  if (aligned->tier == mc::QualityTier::Fail) {
    char detail[96];
    std::snprintf(detail, sizeof(detail), "residual %.2f px exceeds %.2f px",
                  aligned->graded_residual_px, aligned->thresholds.warn_px);
    out.issues.push_back(mc::PageIssue{mc::IssueKind::AlignmentQualityFail,
                                       std::nullopt, std::nullopt, detail});
  }
  const bool halt = stop_on_fail_ && aligned->tier == mc::QualityTier::Fail;
  out.alignment = std::move(*aligned);
  if (halt) {
    return mc::StageOutput{mc::finish(out, mc::PageStatus::Halted)};
  }
  return mc::StageOutput{std::move(out)};
}

}  // namespace markscan::vision
