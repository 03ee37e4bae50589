#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace markscan::core {

/// Feature order is fixed; classifier weights and stored datasets rely on it.
enum class Feature : std::uint8_t {
  FillRatio,
  EdgeDensity,
  StrokeLength,
  CornerCount,
  ComponentCount,
  HvRatio,
  Variance,
};

inline constexpr std::size_t kFeatureCount = 7;

inline constexpr std::array<std::string_view, kFeatureCount> kFeatureNames{
    "fill_ratio",      "edge_density", "stroke_length", "corner_count",
    "component_count", "hv_ratio",     "variance"};

[[nodiscard]] constexpr std::size_t feature_index(Feature f) noexcept {
  return static_cast<std::size_t>(f);
}

[[nodiscard]] std::optional<Feature> feature_from_name(std::string_view name) noexcept;

/// Features of one checkbox crop. Immutable once built.
class FeatureVector {
 public:
  using Values = std::array<double, kFeatureCount>;

  FeatureVector() = default;
  explicit FeatureVector(const Values& values) : values_(values) {}

  [[nodiscard]] double operator[](Feature f) const noexcept {
    return values_[feature_index(f)];
  }
  [[nodiscard]] const Values& values() const noexcept { return values_; }

  [[nodiscard]] double fill_ratio() const noexcept { return (*this)[Feature::FillRatio]; }
  [[nodiscard]] double edge_density() const noexcept { return (*this)[Feature::EdgeDensity]; }
  [[nodiscard]] double stroke_length() const noexcept { return (*this)[Feature::StrokeLength]; }
  [[nodiscard]] double corner_count() const noexcept { return (*this)[Feature::CornerCount]; }
  [[nodiscard]] double component_count() const noexcept { return (*this)[Feature::ComponentCount]; }
  [[nodiscard]] double hv_ratio() const noexcept { return (*this)[Feature::HvRatio]; }
  [[nodiscard]] double variance() const noexcept { return (*this)[Feature::Variance]; }

  friend bool operator==(const FeatureVector&, const FeatureVector&) = default;

 private:
  Values values_{};
};

}  // namespace markscan::core
