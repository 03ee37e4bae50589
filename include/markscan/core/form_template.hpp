#pragma once

#include <markscan/core/error.hpp>
#include <markscan/core/geometry.hpp>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace markscan::core {

/// The four registration marks, in the order used throughout (TL, TR, BR, BL).
enum class Corner : std::uint8_t {
  TopLeft,
  TopRight,
  BottomRight,
  BottomLeft,
};

inline constexpr std::array<Corner, 4> kCorners{
    Corner::TopLeft, Corner::TopRight, Corner::BottomRight, Corner::BottomLeft};

[[nodiscard]] constexpr std::size_t corner_index(Corner c) noexcept {
  return static_cast<std::size_t>(c);
}

[[nodiscard]] std::string_view to_string(Corner c) noexcept;

/// Expected placement of one registration mark.
struct AnchorSpec {
  Corner corner{Corner::TopLeft};
  NormalizedPoint position{};
  /// Half side of the square search window, in template-dpi pixels.
  double search_half_extent_px{80.0};
};

/// 1-based row / column of a checkbox in the template grid.
struct CheckboxId {
  int row{0};
  int col{0};

  friend auto operator<=>(const CheckboxId&, const CheckboxId&) = default;
};

struct CheckboxSpec {
  CheckboxId id{};
  NormalizedRect rect{};
  /// Question / group label; selects per-group thresholds and review rules.
  std::string group;
};

/// Display form "<group>_<col>", e.g. "Q3_2".
[[nodiscard]] std::string checkbox_label(const CheckboxSpec& spec);

/// Regular checkbox grid in normalized template coordinates.
struct CheckboxGrid {
  int rows{0};
  int cols{0};
  NormalizedPoint origin{};
  double cell_width{0.0};
  double cell_height{0.0};
  double row_spacing{0.0};
  double col_spacing{0.0};
  double roi_fraction_w{0.28};
  double roi_fraction_h{0.60};
  std::vector<std::string> labels;  // one per row; default "Q<row>"
};

/// ROI rectangles centred in each grid cell, row-major.
[[nodiscard]] std::vector<CheckboxSpec> expand_grid(const CheckboxGrid& grid);

/// Immutable per-template geometry, loaded once per run and shared read-only.
struct FormTemplate {
  std::string name;
  CanvasSize canvas{};
  double dpi{300.0};
  std::array<AnchorSpec, 4> anchors{};
  std::vector<CheckboxSpec> checkboxes;

  [[nodiscard]] const AnchorSpec& anchor(Corner c) const noexcept {
    return anchors[corner_index(c)];
  }
  [[nodiscard]] CanonicalPoint canonical_anchor(Corner c) const noexcept {
    return denormalize(anchor(c).position, canvas);
  }
};

/// Group names end up as keys in key=value files, so they must be non-empty,
/// carry no surrounding whitespace and contain none of '#', '=', ',' or a
/// line break.
[[nodiscard]] bool is_valid_group_name(std::string_view name) noexcept;

/// Checks canvas, dpi, anchor order, group names and that anchors and
/// checkbox rectangles lie inside the unit square.
[[nodiscard]] std::expected<void, PipelineError> validate(
    const FormTemplate& tpl);

}  // namespace markscan::core
