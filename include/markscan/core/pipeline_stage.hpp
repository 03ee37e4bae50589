#pragma once

#include <markscan/core/error.hpp>
#include <markscan/core/page_result.hpp>
#include <expected>
#include <variant>

namespace markscan::core {

/// Output of a pipeline stage: either the next PageState or the final PageResult.
using StageOutput = std::variant<PageState, PageResult>;

/// Abstract pipeline stage: process one PageState, return PageState (continue)
/// or PageResult (done).
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<StageOutput, PipelineError> process(
      const PageState& input) const = 0;
};

}  // namespace markscan::core
