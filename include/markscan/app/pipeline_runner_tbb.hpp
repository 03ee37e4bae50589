#pragma once

#include <markscan/app/pipeline_runner.hpp>
#include <markscan/core/pipeline.hpp>
#include <vector>

#ifdef MARKSCAN_HAS_TBB

namespace markscan::app {

/// Runs the pipeline on a batch of pages in parallel using TBB.
///
/// The pipeline is shared by every task; its stages are const and hold only
/// read-only template and classifier parameters. callback receives every
/// page, errors included, and may run on any TBB worker thread, so it must
/// be thread-safe.
void run_pages_tbb(const markscan::core::Pipeline& pipeline,
                   const std::vector<PageInput>& pages,
                   const PageOutcomeCallback& callback);

}  // namespace markscan::app

#endif  // MARKSCAN_HAS_TBB
