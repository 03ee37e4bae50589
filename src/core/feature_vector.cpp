#include <markscan/core/feature_vector.hpp>

namespace markscan::core {

std::optional<Feature> feature_from_name(std::string_view name) noexcept {
  for (std::size_t i = 0; i < kFeatureNames.size(); ++i) {
    if (kFeatureNames[i] == name) return static_cast<Feature>(i);
  }
  return std::nullopt;
}

}  // namespace markscan::core
