#include <markscan/core/error.hpp>

namespace markscan::core {

std::string_view to_string(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidPage:
      return "InvalidPage";
    case PipelineError::LoadFailed:
      return "LoadFailed";
    case PipelineError::ParseError:
      return "ParseError";
    case PipelineError::InvalidTemplate:
      return "InvalidTemplate";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::InsufficientAnchors:
      return "InsufficientAnchors";
    case PipelineError::TransformFailed:
      return "TransformFailed";
    case PipelineError::CalibrationFailed:
      return "CalibrationFailed";
    case PipelineError::WriteFailed:
      return "WriteFailed";
  }
  return "Unknown";
}

std::string_view to_string(IssueKind kind) noexcept {
  switch (kind) {
    case IssueKind::AnchorNotFound:
      return "AnchorNotFound";
    case IssueKind::InsufficientAnchors:
      return "InsufficientAnchors";
    case IssueKind::AlignmentQualityFail:
      return "AlignmentQualityFail";
    case IssueKind::FeatureExtractionDegenerate:
      return "FeatureExtractionDegenerate";
  }
  return "Unknown";
}

}  // namespace markscan::core
