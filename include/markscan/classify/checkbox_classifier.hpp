#pragma once

#include <markscan/classify/classifier_parameters.hpp>
#include <markscan/core/feature_vector.hpp>
#include <string_view>

namespace markscan::classify {

struct Decision {
  double score{0.0};
  bool marked{false};
  double threshold{0.0};
};

/// Logistic function, numerically stable for large |z|.
[[nodiscard]] double sigmoid(double z) noexcept;

/// Maps a FeatureVector to a score in [0, 1] and a marked decision.
/// Stateless beyond its parameters; safe to share across threads.
class CheckboxClassifier {
 public:
  explicit CheckboxClassifier(ClassifierParameters params = GlobalThreshold{});

  [[nodiscard]] double score(const markscan::core::FeatureVector& features) const;

  /// Cutoff applied to checkboxes of the given group.
  [[nodiscard]] double threshold_for(std::string_view group) const;

  [[nodiscard]] Decision classify(const markscan::core::FeatureVector& features,
                                  std::string_view group = {}) const;

  [[nodiscard]] const ClassifierParameters& parameters() const noexcept {
    return params_;
  }

 private:
  ClassifierParameters params_;
};

}  // namespace markscan::classify
