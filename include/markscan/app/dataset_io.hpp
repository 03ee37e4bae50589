#pragma once

#include <markscan/classify/calibrator.hpp>
#include <markscan/core/error.hpp>
#include <markscan/core/form_template.hpp>
#include <expected>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace markscan::app {

/// One CSV row of a labeled dataset; page and id are empty when the file
/// has no page,row,col prefix.
struct DatasetRow {
  std::string page;
  markscan::core::CheckboxId id{};
  markscan::classify::CalibrationExample example;
};

/// Header `[page,row,col,]fill_ratio,...,variance,label`. ParseError for a
/// wrong header, a bad number or a label other than 0/1.
[[nodiscard]] std::expected<std::vector<DatasetRow>, markscan::core::PipelineError>
parse_dataset(std::istream& in);

[[nodiscard]] std::expected<std::vector<DatasetRow>, markscan::core::PipelineError>
load_dataset(const std::string& path);

/// Always writes the page,row,col prefix.
void write_dataset(std::ostream& out, const std::vector<DatasetRow>& rows);

[[nodiscard]] std::vector<markscan::classify::CalibrationExample> examples_of(
    const std::vector<DatasetRow>& rows);

}  // namespace markscan::app
