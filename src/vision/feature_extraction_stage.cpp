#include <markscan/vision/feature_extraction_stage.hpp>
#include <utility>

namespace markscan::vision {

namespace mc = markscan::core;

FeatureExtractionStage::FeatureExtractionStage(mc::FormTemplate tpl,
                                               FeatureExtractor extractor)
    : tpl_(std::move(tpl)), extractor_(std::move(extractor)) {}

std::expected<mc::StageOutput, mc::PipelineError> FeatureExtractionStage::process(
    const mc::PageState& input) const {
  if (!input.alignment) {
    return std::unexpected(mc::PipelineError::InvalidConfig);
  }

  mc::PageState out = input;
  out.features = extractor_.extract(input.alignment->canonical_image,
                                    input.alignment->crop, tpl_);
  for (const auto& entry : out.features) {
    if (entry.features) continue;
    out.issues.push_back(mc::PageIssue{mc::IssueKind::FeatureExtractionDegenerate,
                                       std::nullopt, entry.id,
                                       "checkbox ROI lies outside the crop"});
  }
  return mc::StageOutput{std::move(out)};
}

}  // namespace markscan::vision
