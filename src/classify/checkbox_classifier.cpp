#include <markscan/classify/checkbox_classifier.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <type_traits>
#include <utility>

namespace markscan::classify {

namespace mc = markscan::core;

double sigmoid(double z) noexcept {
  if (z >= 0.0) {
    return 1.0 / (1.0 + std::exp(-z));
  }
  const double e = std::exp(z);
  return e / (1.0 + e);
}

CheckboxClassifier::CheckboxClassifier(ClassifierParameters params)
    : params_(std::move(params)) {}

double CheckboxClassifier::score(const mc::FeatureVector& features) const {
  return std::visit(
      [&features](const auto& p) -> double {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, LinearModel>) {
          double z = p.bias;
          for (std::size_t i = 0; i < mc::kFeatureCount; ++i) {
            z += p.weights[i] * (features.values()[i] - p.mean[i]) / p.stddev[i];
          }
          return sigmoid(z);
        } else {
          return std::clamp(features.fill_ratio(), 0.0, 1.0);
        }
      },
      params_);
}

double CheckboxClassifier::threshold_for(std::string_view group) const {
  return std::visit(
      [group](const auto& p) -> double {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, GroupThresholds>) {
          const auto it = p.thresholds.find(std::string(group));
          return it != p.thresholds.end() ? it->second : p.default_threshold;
        } else {
          return p.threshold;
        }
      },
      params_);
}

Decision CheckboxClassifier::classify(const mc::FeatureVector& features,
                                      std::string_view group) const {
  Decision d;
  d.score = score(features);
  d.threshold = threshold_for(group);
  d.marked = d.score >= d.threshold;
  return d;
}

}  // namespace markscan::classify
