#include <markscan/vision/anchor_detection_stage.hpp>
#include <string>
#include <utility>

namespace markscan::vision {

namespace mc = markscan::core;

AnchorDetectionStage::AnchorDetectionStage(mc::FormTemplate tpl,
                                           AnchorDetector detector)
    : tpl_(std::move(tpl)), detector_(std::move(detector)) {}

std::expected<mc::StageOutput, mc::PipelineError> AnchorDetectionStage::process(
    const mc::PageState& input) const {
  if (!input.image.valid()) {
    return std::unexpected(mc::PipelineError::InvalidPage);
  }

  mc::PageState out = input;
  out.anchors = detector_.detect_all(input.image, tpl_);
  for (const mc::Corner corner : mc::kCorners) {
    if (out.anchors[mc::corner_index(corner)]) continue;
    out.issues.push_back(mc::PageIssue{
        mc::IssueKind::AnchorNotFound, corner, std::nullopt,
        "no admissible contour near " + std::string(mc::to_string(corner))});
  }
  return mc::StageOutput{std::move(out)};
}

}  // namespace markscan::vision
