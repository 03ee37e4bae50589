#include <markscan/app/dataset_io.hpp>
#include "key_value.hpp"
#include <fstream>
#include <string_view>
#include <utility>

namespace markscan::app {

namespace mc = markscan::core;

namespace {

constexpr std::size_t kPrefixColumns = 3;  // page,row,col

std::vector<std::string> expected_header(bool with_prefix) {
  std::vector<std::string> header;
  if (with_prefix) header = {"page", "row", "col"};
  for (const auto name : mc::kFeatureNames) header.emplace_back(name);
  header.emplace_back("label");
  return header;
}

}  // namespace

std::expected<std::vector<DatasetRow>, mc::PipelineError> parse_dataset(std::istream& in) {
  std::string line;
  if (!std::getline(in, line)) return std::unexpected(mc::PipelineError::ParseError);
  detail::trim(line);
  const auto header = detail::split_list(line);
  bool with_prefix = false;
  if (header == expected_header(true)) {
    with_prefix = true;
  } else if (header != expected_header(false)) {
    return std::unexpected(mc::PipelineError::ParseError);
  }

  const std::size_t offset = with_prefix ? kPrefixColumns : 0;
  std::vector<DatasetRow> rows;
  while (std::getline(in, line)) {
    detail::trim(line);
    if (line.empty()) continue;
    const auto cells = detail::split_list(line);
    if (cells.size() != header.size()) return std::unexpected(mc::PipelineError::ParseError);

    DatasetRow row;
    if (with_prefix) {
      const auto r = detail::parse_long(cells[1]);
      const auto c = detail::parse_long(cells[2]);
      if (!r || !c) return std::unexpected(mc::PipelineError::ParseError);
      row.page = cells[0];
      row.id = mc::CheckboxId{static_cast<int>(*r), static_cast<int>(*c)};
    }
    mc::FeatureVector::Values values{};
    for (std::size_t j = 0; j < mc::kFeatureCount; ++j) {
      const auto v = detail::parse_double(cells[offset + j]);
      if (!v) return std::unexpected(mc::PipelineError::ParseError);
      values[j] = *v;
    }
    const std::string& label = cells[offset + mc::kFeatureCount];
    if (label != "0" && label != "1") return std::unexpected(mc::PipelineError::ParseError);
    row.example = classify::CalibrationExample{mc::FeatureVector(values), label == "1"};
    rows.push_back(std::move(row));
  }
  return rows;
}

std::expected<std::vector<DatasetRow>, mc::PipelineError> load_dataset(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::unexpected(mc::PipelineError::LoadFailed);
  return parse_dataset(f);
}

void write_dataset(std::ostream& out, const std::vector<DatasetRow>& rows) {
  const auto header = expected_header(true);
  for (std::size_t i = 0; i < header.size(); ++i) {
    out << (i ? "," : "") << header[i];
  }
  out << '\n';
  for (const auto& row : rows) {
    out << row.page << ',' << row.id.row << ',' << row.id.col;
    for (const double v : row.example.features.values()) {
      out << ',' << detail::format_double(v);
    }
    out << ',' << (row.example.marked ? 1 : 0) << '\n';
  }
}

std::vector<classify::CalibrationExample> examples_of(const std::vector<DatasetRow>& rows) {
  std::vector<classify::CalibrationExample> out;
  out.reserve(rows.size());
  for (const auto& row : rows) out.push_back(row.example);
  return out;
}

}  // namespace markscan::app
