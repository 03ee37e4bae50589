#pragma once

#include <markscan/core/error.hpp>
#include <markscan/core/form_template.hpp>
#include <markscan/core/page_result.hpp>
#include <markscan/core/pipeline_stage.hpp>
#include <markscan/vision/feature_extractor.hpp>
#include <expected>

namespace markscan::vision {

/// Pipeline stage: features for every template checkbox on the aligned crop.
/// Requires a preceding AlignmentStage.
class FeatureExtractionStage : public markscan::core::IPipelineStage {
 public:
  FeatureExtractionStage(markscan::core::FormTemplate tpl, FeatureExtractor extractor);

  [[nodiscard]] std::expected<markscan::core::StageOutput,
                              markscan::core::PipelineError>
  process(const markscan::core::PageState& input) const override;

 private:
  markscan::core::FormTemplate tpl_;
  FeatureExtractor extractor_;
};

}  // namespace markscan::vision
