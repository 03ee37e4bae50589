#include <markscan/core/form_template.hpp>
#include <set>
#include <utility>

namespace markscan::core {

std::string_view to_string(Corner c) noexcept {
  switch (c) {
    case Corner::TopLeft:
      return "top_left";
    case Corner::TopRight:
      return "top_right";
    case Corner::BottomRight:
      return "bottom_right";
    case Corner::BottomLeft:
      return "bottom_left";
  }
  return "unknown";
}

std::string checkbox_label(const CheckboxSpec& spec) {
  return spec.group + "_" + std::to_string(spec.id.col);
}

std::vector<CheckboxSpec> expand_grid(const CheckboxGrid& grid) {
  std::vector<CheckboxSpec> out;
  if (grid.rows <= 0 || grid.cols <= 0) return out;
  out.reserve(static_cast<std::size_t>(grid.rows) * grid.cols);

  const double roi_w = grid.cell_width * grid.roi_fraction_w;
  const double roi_h = grid.cell_height * grid.roi_fraction_h;
  for (int r = 0; r < grid.rows; ++r) {
    const std::string group =
        static_cast<std::size_t>(r) < grid.labels.size()
            ? grid.labels[static_cast<std::size_t>(r)]
            : "Q" + std::to_string(r + 1);
    for (int c = 0; c < grid.cols; ++c) {
      const double cell_x = grid.origin.x + c * grid.col_spacing;
      const double cell_y = grid.origin.y + r * grid.row_spacing;
      CheckboxSpec spec;
      spec.id = CheckboxId{r + 1, c + 1};
      spec.rect = NormalizedRect{cell_x + (grid.cell_width - roi_w) / 2.0,
                                 cell_y + (grid.cell_height - roi_h) / 2.0,
                                 roi_w, roi_h};
      spec.group = group;
      out.push_back(std::move(spec));
    }
  }
  return out;
}

namespace {

bool in_unit_range(double v) noexcept { return v >= 0.0 && v <= 1.0; }

bool inside_unit_square(const NormalizedRect& r) noexcept {
  return in_unit_range(r.x) && in_unit_range(r.y) && r.w > 0.0 && r.h > 0.0 &&
         r.x + r.w <= 1.0 && r.y + r.h <= 1.0;
}

}  // namespace

bool is_valid_group_name(std::string_view name) noexcept {
  if (name.empty()) return false;
  if (name.find_first_of("#=,\r\n") != std::string_view::npos) return false;
  const auto blank = [](char c) { return c == ' ' || c == '\t'; };
  return !blank(name.front()) && !blank(name.back());
}

std::expected<void, PipelineError> validate(const FormTemplate& tpl) {
  if (tpl.canvas.width == 0 || tpl.canvas.height == 0 || !(tpl.dpi > 0.0)) {
    return std::unexpected(PipelineError::InvalidTemplate);
  }
  for (std::size_t i = 0; i < tpl.anchors.size(); ++i) {
    const AnchorSpec& a = tpl.anchors[i];
    if (corner_index(a.corner) != i || !(a.search_half_extent_px > 0.0) ||
        !in_unit_range(a.position.x) || !in_unit_range(a.position.y)) {
      return std::unexpected(PipelineError::InvalidTemplate);
    }
  }
  std::set<CheckboxId> seen;
  for (const CheckboxSpec& cb : tpl.checkboxes) {
    if (!inside_unit_square(cb.rect) || !is_valid_group_name(cb.group) ||
        cb.id.row < 1 || cb.id.col < 1 || !seen.insert(cb.id).second) {
      return std::unexpected(PipelineError::InvalidTemplate);
    }
  }
  return {};
}

}  // namespace markscan::core
