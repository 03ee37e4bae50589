#pragma once

#include <cstdint>
#include <string_view>

namespace markscan::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidPage,
  LoadFailed,
  ParseError,
  InvalidTemplate,
  InvalidConfig,
  InsufficientAnchors,
  TransformFailed,
  CalibrationFailed,
  WriteFailed,
};

/// Page- or checkbox-scoped conditions. None of them stops a batch.
enum class IssueKind : std::uint8_t {
  AnchorNotFound,
  InsufficientAnchors,
  AlignmentQualityFail,
  FeatureExtractionDegenerate,
};

[[nodiscard]] std::string_view to_string(PipelineError error) noexcept;
[[nodiscard]] std::string_view to_string(IssueKind kind) noexcept;

}  // namespace markscan::core
