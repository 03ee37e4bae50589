#pragma once

#include <markscan/core/feature_vector.hpp>
#include <markscan/core/form_template.hpp>
#include <optional>
#include <string>

namespace markscan::core {

/// Decision for one checkbox on one page.
struct ClassificationResult {
  CheckboxId id{};
  std::string group;
  /// Continuous marked-ness in [0, 1].
  double score{0.0};
  bool marked{false};
  /// Cutoff the score was compared against.
  double threshold{0.0};
  /// ROI fell outside the crop; reported as unmarked with zero score.
  bool degenerate{false};
  /// Features the score came from; kept for dataset export.
  std::optional<FeatureVector> features;
};

}  // namespace markscan::core
