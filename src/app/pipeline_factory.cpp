#include <markscan/app/pipeline_factory.hpp>
#include <markscan/app/classifier_io.hpp>
#include <markscan/classify/classification_stage.hpp>
#include <markscan/vision/alignment_stage.hpp>
#include <markscan/vision/anchor_detection_stage.hpp>
#include <markscan/vision/feature_extraction_stage.hpp>
#include <memory>

namespace markscan::app {

namespace mc = markscan::core;
namespace mv = markscan::vision;

mv::AnchorDetectorConfig detector_config(const PipelineConfig& config) {
  mv::AnchorDetectorConfig c;
  c.shape_weight = config.shape_weight;
  c.distance_weight = config.distance_weight;
  c.min_area = config.anchor_min_area;
  c.max_area = config.anchor_max_area;
  c.min_contrast = config.anchor_min_contrast;
  c.reference_dpi = config.reference_dpi;
  return c;
}

mv::AlignerConfig aligner_config(const PipelineConfig& config) {
  mv::AlignerConfig c;
  c.thresholds = mc::QualityThresholds{config.residual_ok_px, config.residual_warn_px};
  c.reference_dpi = config.reference_dpi;
  c.crop_margin_in = config.crop_margin_in;
  c.projective_method = config.projective_method;
  c.gate_on_planarity = config.gate_on_planarity;
  return c;
}

std::expected<mc::Pipeline, mc::PipelineError> build_pipeline(
    const PipelineConfig& config,
    const mc::FormTemplate& tpl,
    const classify::ClassifierParameters& params) {
  if (auto valid = validate(config); !valid) return std::unexpected(valid.error());
  if (auto valid = mc::validate(tpl); !valid) return std::unexpected(valid.error());

  mv::FeatureExtractorConfig extractor;
  extractor.inner_margin_px = config.checkbox_margin_px;

  mc::Pipeline p;
  p.add_stage(std::make_unique<mv::AnchorDetectionStage>(
      tpl, mv::AnchorDetector(detector_config(config))));
  p.add_stage(std::make_unique<mv::AlignmentStage>(
      mv::GeometricAligner(tpl, aligner_config(config)), config.stop_on_fail));
  p.add_stage(std::make_unique<mv::FeatureExtractionStage>(
      tpl, mv::FeatureExtractor(extractor)));
  p.add_stage(std::make_unique<classify::ClassificationStage>(
      tpl, classify::CheckboxClassifier(params)));
  return p;
}

std::expected<classify::ClassifierParameters, mc::PipelineError> classifier_parameters_for(
    const PipelineConfig& config) {
  if (config.classifier_path.empty()) {
    return classify::ClassifierParameters{classify::GlobalThreshold{config.fill_threshold}};
  }
  return load_classifier(config.classifier_path);
}

}  // namespace markscan::app
