#include <markscan/core/pipeline.hpp>
#include <chrono>
#include <utility>

namespace markscan::core {

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<PageResult, PipelineError> Pipeline::run(
    const PageState& input,
    StageTimingCallback* timing_cb) const {
  StageOutput current = input;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const PageState* state = std::get_if<PageState>(&current);
    if (!state) {
      return std::get<PageResult>(current);
    }

    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(*state);
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-3 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::microseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      return std::unexpected(result.error());
    }

    current = std::move(*result);
  }

  if (const auto* result = std::get_if<PageResult>(&current)) {
    return *result;
  }
  return std::unexpected(PipelineError::InvalidConfig);
}

}  // namespace markscan::core
