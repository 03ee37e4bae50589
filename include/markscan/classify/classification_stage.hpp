#pragma once

#include <markscan/classify/checkbox_classifier.hpp>
#include <markscan/core/error.hpp>
#include <markscan/core/form_template.hpp>
#include <markscan/core/page_result.hpp>
#include <markscan/core/pipeline_stage.hpp>
#include <expected>

namespace markscan::classify {

/// Final pipeline stage: decides every checkbox and emits the PageResult.
/// Checkboxes without features are reported unmarked with zero score.
class ClassificationStage : public markscan::core::IPipelineStage {
 public:
  ClassificationStage(markscan::core::FormTemplate tpl, CheckboxClassifier classifier);

  [[nodiscard]] std::expected<markscan::core::StageOutput,
                              markscan::core::PipelineError>
  process(const markscan::core::PageState& input) const override;

 private:
  markscan::core::FormTemplate tpl_;
  CheckboxClassifier classifier_;
};

}  // namespace markscan::classify
