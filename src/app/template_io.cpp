#include <markscan/app/template_io.hpp>
#include "key_value.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <map>
#include <optional>
#include <string_view>
#include <utility>

namespace markscan::app {

namespace mc = markscan::core;

namespace {

std::optional<mc::Corner> corner_from_name(std::string_view name) {
  for (const mc::Corner c : mc::kCorners) {
    if (mc::to_string(c) == name) return c;
  }
  return std::nullopt;
}

/// "3.2" -> {3, 2}
std::optional<mc::CheckboxId> parse_checkbox_id(std::string_view text) {
  const auto dot = text.find('.');
  if (dot == std::string_view::npos) return std::nullopt;
  const auto row = detail::parse_long(text.substr(0, dot));
  const auto col = detail::parse_long(text.substr(dot + 1));
  if (!row || !col || *row < 1 || *col < 1) return std::nullopt;
  return mc::CheckboxId{static_cast<int>(*row), static_cast<int>(*col)};
}

/// Canvas sides become cv::Size ints; anything past this is not a page.
constexpr long kMaxCanvasExtentPx = 100000;

std::optional<std::uint32_t> parse_extent(const std::string& value) {
  const auto v = detail::parse_long(value);
  if (!v || *v <= 0 || *v > kMaxCanvasExtentPx) return std::nullopt;
  return static_cast<std::uint32_t>(*v);
}

struct TemplateBuilder {
  mc::FormTemplate tpl;
  std::array<bool, 4> have_anchor{};
  double search_px{80.0};
  mc::CheckboxGrid grid;
  std::map<mc::CheckboxId, mc::NormalizedRect> explicit_boxes;

  bool apply(const std::string& key, const std::string& value);
  std::expected<mc::FormTemplate, mc::PipelineError> build();
};

bool TemplateBuilder::apply(const std::string& key, const std::string& value) {
  constexpr std::string_view kAnchor = "anchor.";
  constexpr std::string_view kCheckbox = "checkbox.";
  constexpr std::string_view kGrid = "grid.";
  const std::string_view k = key;

  if (k == "name") {
    tpl.name = value;
  } else if (k == "canvas_width_px") {
    const auto v = parse_extent(value);
    if (!v) return false;
    tpl.canvas.width = *v;
  } else if (k == "canvas_height_px") {
    const auto v = parse_extent(value);
    if (!v) return false;
    tpl.canvas.height = *v;
  } else if (k == "dpi") {
    const auto v = detail::parse_double(value);
    if (!v) return false;
    tpl.dpi = *v;
  } else if (k == "anchor_search_px") {
    const auto v = detail::parse_double(value);
    if (!v || *v <= 0.0) return false;
    search_px = *v;
  } else if (k.starts_with(kAnchor)) {
    const auto corner = corner_from_name(k.substr(kAnchor.size()));
    const auto xy = detail::parse_doubles(value, 2);
    if (!corner || !xy) return false;
    auto& spec = tpl.anchors[mc::corner_index(*corner)];
    spec.corner = *corner;
    spec.position = mc::NormalizedPoint{(*xy)[0], (*xy)[1]};
    have_anchor[mc::corner_index(*corner)] = true;
  } else if (k.starts_with(kCheckbox)) {
    const auto id = parse_checkbox_id(k.substr(kCheckbox.size()));
    const auto r = detail::parse_doubles(value, 4);
    if (!id || !r) return false;
    explicit_boxes[*id] = mc::NormalizedRect{(*r)[0], (*r)[1], (*r)[2], (*r)[3]};
  } else if (k.starts_with(kGrid)) {
    const std::string_view field = k.substr(kGrid.size());
    if (field == "labels") {
      grid.labels = detail::split_list(value);
      return true;
    }
    if (field == "rows" || field == "cols") {
      const auto v = detail::parse_long(value);
      if (!v || *v < 0) return false;
      (field == "rows" ? grid.rows : grid.cols) = static_cast<int>(*v);
      return true;
    }
    if (field == "origin" || field == "cell" || field == "roi_fraction") {
      const auto xy = detail::parse_doubles(value, 2);
      if (!xy) return false;
      if (field == "origin") {
        grid.origin = mc::NormalizedPoint{(*xy)[0], (*xy)[1]};
      } else if (field == "cell") {
        grid.cell_width = (*xy)[0];
        grid.cell_height = (*xy)[1];
      } else {
        grid.roi_fraction_w = (*xy)[0];
        grid.roi_fraction_h = (*xy)[1];
      }
      return true;
    }
    const auto v = detail::parse_double(value);
    if (!v) return false;
    if (field == "row_spacing") grid.row_spacing = *v;
    else if (field == "col_spacing") grid.col_spacing = *v;
    else return false;
  } else {
    return false;
  }
  return true;
}

std::expected<mc::FormTemplate, mc::PipelineError> TemplateBuilder::build() {
  if (!std::all_of(have_anchor.begin(), have_anchor.end(), [](bool b) { return b; })) {
    return std::unexpected(mc::PipelineError::InvalidTemplate);
  }
  for (auto& a : tpl.anchors) a.search_half_extent_px = search_px;

  tpl.checkboxes = mc::expand_grid(grid);
  for (const auto& [id, rect] : explicit_boxes) {
    auto it = std::find_if(tpl.checkboxes.begin(), tpl.checkboxes.end(),
                           [id](const mc::CheckboxSpec& s) { return s.id == id; });
    if (it != tpl.checkboxes.end()) {
      it->rect = rect;
      continue;
    }
    const auto row = static_cast<std::size_t>(id.row);
    mc::CheckboxSpec spec;
    spec.id = id;
    spec.rect = rect;
    spec.group = row <= grid.labels.size() ? grid.labels[row - 1]
                                           : "Q" + std::to_string(id.row);
    tpl.checkboxes.push_back(std::move(spec));
  }
  std::sort(tpl.checkboxes.begin(), tpl.checkboxes.end(),
            [](const mc::CheckboxSpec& a, const mc::CheckboxSpec& b) { return a.id < b.id; });

  if (auto valid = mc::validate(tpl); !valid) {
    return std::unexpected(valid.error());
  }
  return std::move(tpl);
}

}  // namespace

std::expected<mc::FormTemplate, mc::PipelineError> parse_template(std::istream& in) {
  TemplateBuilder builder;
  for (const auto& kv : detail::parse_key_values(in)) {
    if (!builder.apply(kv.key, kv.value)) {
      return std::unexpected(mc::PipelineError::InvalidTemplate);
    }
  }
  return builder.build();
}

std::expected<mc::FormTemplate, mc::PipelineError> load_template(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::unexpected(mc::PipelineError::LoadFailed);
  return parse_template(f);
}

}  // namespace markscan::app
