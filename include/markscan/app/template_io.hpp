#pragma once

#include <markscan/core/error.hpp>
#include <markscan/core/form_template.hpp>
#include <expected>
#include <istream>
#include <string>

namespace markscan::app {

/// Parse a key=value template definition: canvas, four anchors, an optional
/// checkbox grid and explicit `checkbox.<row>.<col> = x, y, w, h` entries
/// (1-based, overriding grid cells with the same id). Checkboxes come back
/// sorted by (row, col). Malformed or incomplete input is InvalidTemplate.
[[nodiscard]] std::expected<markscan::core::FormTemplate,
                            markscan::core::PipelineError>
parse_template(std::istream& in);

/// LoadFailed if the file cannot be opened, otherwise as parse_template.
[[nodiscard]] std::expected<markscan::core::FormTemplate,
                            markscan::core::PipelineError>
load_template(const std::string& path);

}  // namespace markscan::app
