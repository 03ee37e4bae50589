#include <markscan/app/classifier_io.hpp>
#include <markscan/core/form_template.hpp>
#include "key_value.hpp"
#include <array>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <utility>

namespace markscan::app {

namespace mc = markscan::core;
namespace cl = markscan::classify;

namespace {

constexpr std::string_view kFeaturePrefix = "feature.";
constexpr std::string_view kGroupPrefix = "group.";

enum class Mode { Threshold, Grouped, Model };

struct ModelFields {
  std::array<bool, mc::kFeatureCount> mean{};
  std::array<bool, mc::kFeatureCount> stddev{};
  std::array<bool, mc::kFeatureCount> weight{};
  bool bias{false};
};

void write_line(std::ostream& out, std::string_view key, double v) {
  out << key << " = " << detail::format_double(v) << '\n';
}

}  // namespace

std::expected<void, mc::PipelineError> write_classifier(std::ostream& out,
                                                        const cl::ClassifierParameters& params) {
  if (const auto* g = std::get_if<cl::GroupThresholds>(&params)) {
    for (const auto& entry : g->thresholds) {
      if (!mc::is_valid_group_name(entry.first)) {
        return std::unexpected(mc::PipelineError::InvalidConfig);
      }
    }
  }
  std::visit(
      [&out](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, cl::GlobalThreshold>) {
          out << "mode = threshold\n";
          write_line(out, "threshold", p.threshold);
        } else if constexpr (std::is_same_v<T, cl::GroupThresholds>) {
          out << "mode = grouped\n";
          write_line(out, "threshold", p.default_threshold);
          for (const auto& [group, t] : p.thresholds) {
            write_line(out, std::string(kGroupPrefix) + group, t);
          }
        } else {
          out << "mode = model\n";
          write_line(out, "threshold", p.threshold);
          write_line(out, "bias", p.bias);
          for (std::size_t j = 0; j < mc::kFeatureCount; ++j) {
            const std::string base = std::string(kFeaturePrefix) + std::string(mc::kFeatureNames[j]);
            write_line(out, base + ".mean", p.mean[j]);
            write_line(out, base + ".std", p.stddev[j]);
            write_line(out, base + ".weight", p.weights[j]);
          }
        }
      },
      params);
  return {};
}

std::expected<cl::ClassifierParameters, mc::PipelineError> parse_classifier(std::istream& in) {
  std::optional<Mode> mode;
  std::optional<double> threshold;
  cl::GroupThresholds grouped;
  cl::LinearModel model;
  ModelFields seen;

  for (const auto& kv : detail::parse_key_values(in)) {
    const std::string_view key = kv.key;
    if (key == "mode") {
      if (kv.value == "threshold") mode = Mode::Threshold;
      else if (kv.value == "grouped") mode = Mode::Grouped;
      else if (kv.value == "model") mode = Mode::Model;
      else return std::unexpected(mc::PipelineError::ParseError);
      continue;
    }

    const auto v = detail::parse_double(kv.value);
    if (!v || !std::isfinite(*v)) return std::unexpected(mc::PipelineError::ParseError);

    if (key == "threshold") {
      threshold = *v;
    } else if (key == "bias") {
      model.bias = *v;
      seen.bias = true;
    } else if (key.starts_with(kGroupPrefix)) {
      grouped.thresholds[std::string(key.substr(kGroupPrefix.size()))] = *v;
    } else if (key.starts_with(kFeaturePrefix)) {
      const std::string_view rest = key.substr(kFeaturePrefix.size());
      const auto dot = rest.rfind('.');
      if (dot == std::string_view::npos) return std::unexpected(mc::PipelineError::ParseError);
      const auto feature = mc::feature_from_name(rest.substr(0, dot));
      const std::string_view field = rest.substr(dot + 1);
      if (!feature) return std::unexpected(mc::PipelineError::ParseError);
      const std::size_t j = mc::feature_index(*feature);
      if (field == "mean") {
        model.mean[j] = *v;
        seen.mean[j] = true;
      } else if (field == "std") {
        if (*v == 0.0) return std::unexpected(mc::PipelineError::ParseError);
        model.stddev[j] = *v;
        seen.stddev[j] = true;
      } else if (field == "weight") {
        model.weights[j] = *v;
        seen.weight[j] = true;
      } else {
        return std::unexpected(mc::PipelineError::ParseError);
      }
    } else {
      return std::unexpected(mc::PipelineError::ParseError);
    }
  }

  if (!mode || !threshold) return std::unexpected(mc::PipelineError::ParseError);
  switch (*mode) {
    case Mode::Threshold:
      return cl::ClassifierParameters{cl::GlobalThreshold{*threshold}};
    case Mode::Grouped:
      grouped.default_threshold = *threshold;
      return cl::ClassifierParameters{std::move(grouped)};
    case Mode::Model:
      for (std::size_t j = 0; j < mc::kFeatureCount; ++j) {
        if (!seen.mean[j] || !seen.stddev[j] || !seen.weight[j]) {
          return std::unexpected(mc::PipelineError::ParseError);
        }
      }
      if (!seen.bias) return std::unexpected(mc::PipelineError::ParseError);
      model.threshold = *threshold;
      return cl::ClassifierParameters{model};
  }
  return std::unexpected(mc::PipelineError::ParseError);
}

std::expected<void, mc::PipelineError> save_classifier(const std::string& path,
                                                       const cl::ClassifierParameters& params) {
  std::ostringstream text;
  if (auto written = write_classifier(text, params); !written) return written;
  std::ofstream f(path);
  if (!f) return std::unexpected(mc::PipelineError::WriteFailed);
  f << text.str();
  f.flush();
  if (!f) return std::unexpected(mc::PipelineError::WriteFailed);
  return {};
}

std::expected<cl::ClassifierParameters, mc::PipelineError> load_classifier(
    const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::unexpected(mc::PipelineError::LoadFailed);
  return parse_classifier(f);
}

}  // namespace markscan::app
