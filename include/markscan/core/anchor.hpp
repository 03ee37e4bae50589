#pragma once

#include <markscan/core/form_template.hpp>
#include <markscan/core/geometry.hpp>
#include <array>
#include <cstddef>
#include <optional>

namespace markscan::core {

/// Detected registration mark on one page.
struct AnchorCandidate {
  Corner corner{Corner::TopLeft};
  RawPixelPoint position{};
  double shape_score{0.0};
  double distance_score{0.0};
  double confidence{0.0};
  /// Euclidean distance to the expected position, in page pixels.
  double distance_px{0.0};
  double area{0.0};
};

/// One optional candidate per corner, indexed by corner_index().
using AnchorSet = std::array<std::optional<AnchorCandidate>, 4>;

[[nodiscard]] inline std::size_t found_count(const AnchorSet& set) noexcept {
  std::size_t n = 0;
  for (const auto& a : set) {
    if (a) ++n;
  }
  return n;
}

}  // namespace markscan::core
