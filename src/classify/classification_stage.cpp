#include <markscan/classify/classification_stage.hpp>
#include <utility>

namespace markscan::classify {

namespace mc = markscan::core;

ClassificationStage::ClassificationStage(mc::FormTemplate tpl, CheckboxClassifier classifier)
    : tpl_(std::move(tpl)), classifier_(std::move(classifier)) {}

std::expected<mc::StageOutput, mc::PipelineError> ClassificationStage::process(
    const mc::PageState& input) const {
  if (!input.alignment || input.features.size() != tpl_.checkboxes.size()) {
    return std::unexpected(mc::PipelineError::InvalidConfig);
  }

  mc::PageResult result = mc::finish(input, mc::PageStatus::Classified);
  result.checkboxes.reserve(tpl_.checkboxes.size());
  for (std::size_t i = 0; i < tpl_.checkboxes.size(); ++i) {
    const mc::CheckboxSpec& spec = tpl_.checkboxes[i];
    mc::ClassificationResult r;
    r.id = spec.id;
    r.group = spec.group;
    r.threshold = classifier_.threshold_for(spec.group);
    if (const auto& features = input.features[i].features) {
      const Decision d = classifier_.classify(*features, spec.group);
      r.score = d.score;
      r.marked = d.marked;
      r.features = *features;
    } else {
      r.degenerate = true;
    }
    result.checkboxes.push_back(std::move(r));
  }
  return mc::StageOutput{std::move(result)};
}

}  // namespace markscan::classify
