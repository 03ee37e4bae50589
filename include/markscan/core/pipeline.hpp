#pragma once

#include <markscan/core/error.hpp>
#include <markscan/core/page_result.hpp>
#include <markscan/core/pipeline_stage.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace markscan::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages; passes PageState through until a stage returns PageResult.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run pipeline on one page; returns the first PageResult or error.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// Thread-safe: stages are const and hold only read-only template and
  /// classifier parameters, so run() may be called from many threads.
  [[nodiscard]] std::expected<PageResult, PipelineError> run(
      const PageState& input,
      StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace markscan::core
