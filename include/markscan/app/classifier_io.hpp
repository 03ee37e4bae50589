#pragma once

#include <markscan/classify/classifier_parameters.hpp>
#include <markscan/core/error.hpp>
#include <expected>
#include <istream>
#include <ostream>
#include <string>

namespace markscan::app {

/// Writes parameters as key=value text. Doubles carry 17 significant digits
/// so a reload reproduces them exactly. InvalidConfig, with nothing written,
/// if a group name could not be read back as a key (see is_valid_group_name).
[[nodiscard]] std::expected<void, markscan::core::PipelineError> write_classifier(
    std::ostream& out, const markscan::classify::ClassifierParameters& params);

/// ParseError for unknown modes, missing model features or bad numbers.
[[nodiscard]] std::expected<markscan::classify::ClassifierParameters,
                            markscan::core::PipelineError>
parse_classifier(std::istream& in);

[[nodiscard]] std::expected<void, markscan::core::PipelineError> save_classifier(
    const std::string& path, const markscan::classify::ClassifierParameters& params);

/// LoadFailed if the file cannot be opened, otherwise as parse_classifier.
[[nodiscard]] std::expected<markscan::classify::ClassifierParameters,
                            markscan::core::PipelineError>
load_classifier(const std::string& path);

}  // namespace markscan::app
