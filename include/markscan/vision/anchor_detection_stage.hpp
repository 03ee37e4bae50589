#pragma once

#include <markscan/core/error.hpp>
#include <markscan/core/form_template.hpp>
#include <markscan/core/page_result.hpp>
#include <markscan/core/pipeline_stage.hpp>
#include <markscan/vision/anchor_detector.hpp>
#include <expected>

namespace markscan::vision {

/// Pipeline stage: detect the four registration marks. A missing corner is
/// recorded as an AnchorNotFound issue, never as an error.
class AnchorDetectionStage : public markscan::core::IPipelineStage {
 public:
  AnchorDetectionStage(markscan::core::FormTemplate tpl, AnchorDetector detector);

  [[nodiscard]] std::expected<markscan::core::StageOutput,
                              markscan::core::PipelineError>
  process(const markscan::core::PageState& input) const override;

 private:
  markscan::core::FormTemplate tpl_;
  AnchorDetector detector_;
};

}  // namespace markscan::vision
