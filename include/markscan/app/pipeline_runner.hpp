#pragma once

#include <markscan/core/error.hpp>
#include <markscan/core/page_image.hpp>
#include <markscan/core/page_result.hpp>
#include <markscan/core/pipeline.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace markscan::app {

/// One page to process.
struct PageInput {
  std::uint64_t page_id{0};
  std::string page_name;
  markscan::core::PageImage image;
};

using PageOutcome = std::expected<markscan::core::PageResult, markscan::core::PipelineError>;

/// Callback for each page; may be invoked from worker threads.
/// Must be thread-safe if using run_pages_parallel or run_pages_tbb.
using PageOutcomeCallback = std::function<void(const PageInput&, const PageOutcome&)>;

/// Optional per-stage timing: (stage_index, duration_ms). Pass to run_page to get timings.
using StageTimingCallback = markscan::core::StageTimingCallback;

[[nodiscard]] markscan::core::PageState make_page_state(const PageInput& page);

/// Page names for a batch of image paths: the file stem, or stem_<index>
/// when several paths share a stem, so per-page outputs never overwrite
/// each other. Index is the path's position in the batch.
[[nodiscard]] std::vector<std::string> page_names(const std::vector<std::string>& paths);

/// Runs pipeline on a single page. No threading; direct call.
/// If timing_cb is non-null, it is invoked for each stage with (stage_index, duration_ms).
[[nodiscard]] PageOutcome run_page(const markscan::core::Pipeline& pipeline,
                                   const PageInput& page,
                                   StageTimingCallback* timing_cb = nullptr);

/// Runs pipeline on multiple pages sequentially; calls callback for each
/// page, in order, errors included.
void run_pages(const markscan::core::Pipeline& pipeline,
               const std::vector<PageInput>& pages,
               const PageOutcomeCallback& callback);

/// Runs pipeline on multiple pages in parallel using a thread pool.
/// Pipeline::run() is called from worker threads; callback may be invoked
/// from any worker (must be thread-safe). num_workers 0 = use hardware concurrency.
void run_pages_parallel(const markscan::core::Pipeline& pipeline,
                        const std::vector<PageInput>& pages,
                        const PageOutcomeCallback& callback,
                        std::size_t num_workers = 0);

}  // namespace markscan::app
