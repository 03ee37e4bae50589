#pragma once

#include <markscan/app/config.hpp>
#include <markscan/classify/classifier_parameters.hpp>
#include <markscan/core/error.hpp>
#include <markscan/core/form_template.hpp>
#include <markscan/core/pipeline.hpp>
#include <markscan/vision/anchor_detector.hpp>
#include <markscan/vision/geometric_aligner.hpp>
#include <expected>

namespace markscan::app {

/// Detector, aligner and extractor settings derived from the config.
[[nodiscard]] markscan::vision::AnchorDetectorConfig detector_config(const PipelineConfig& config);
[[nodiscard]] markscan::vision::AlignerConfig aligner_config(const PipelineConfig& config);

/// Anchor detection, alignment, feature extraction and classification for
/// one template. InvalidConfig or InvalidTemplate when either fails
/// validation.
[[nodiscard]] std::expected<markscan::core::Pipeline, markscan::core::PipelineError>
build_pipeline(const PipelineConfig& config,
               const markscan::core::FormTemplate& tpl,
               const markscan::classify::ClassifierParameters& params);

/// Classifier parameters for a config: the file at classifier_path, or a
/// global fill threshold when no path is set.
[[nodiscard]] std::expected<markscan::classify::ClassifierParameters,
                            markscan::core::PipelineError>
classifier_parameters_for(const PipelineConfig& config);

}  // namespace markscan::app
