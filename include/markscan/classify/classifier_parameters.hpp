#pragma once

#include <markscan/core/feature_vector.hpp>
#include <map>
#include <string>
#include <variant>

namespace markscan::classify {

/// Threshold mode: score = fill ratio, one cutoff for every checkbox.
struct GlobalThreshold {
  double threshold{0.115};

  friend bool operator==(const GlobalThreshold&, const GlobalThreshold&) = default;
};

/// Threshold mode with a cutoff per checkbox group. Groups without an entry
/// use default_threshold.
struct GroupThresholds {
  double default_threshold{0.115};
  std::map<std::string, double> thresholds;

  friend bool operator==(const GroupThresholds&, const GroupThresholds&) = default;
};

/// Model mode: standardized features, linear combination, logistic squash.
struct LinearModel {
  markscan::core::FeatureVector::Values mean{};
  /// Never zero; a constant feature is stored with deviation 1.
  markscan::core::FeatureVector::Values stddev{};
  markscan::core::FeatureVector::Values weights{};
  double bias{0.0};
  /// Decision threshold on the probability.
  double threshold{0.5};

  friend bool operator==(const LinearModel&, const LinearModel&) = default;
};

using ClassifierParameters = std::variant<GlobalThreshold, GroupThresholds, LinearModel>;

}  // namespace markscan::classify
