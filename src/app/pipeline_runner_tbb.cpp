#include <markscan/app/pipeline_runner_tbb.hpp>

#ifdef MARKSCAN_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace markscan::app {

void run_pages_tbb(const markscan::core::Pipeline& pipeline,
                   const std::vector<PageInput>& pages,
                   const PageOutcomeCallback& callback) {
  if (pages.empty() || !callback) return;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, pages.size()),
      [&pipeline, &pages, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const PageOutcome outcome = run_page(pipeline, pages[i]);
          callback(pages[i], outcome);
        }
      });
}

}  // namespace markscan::app

#endif  // MARKSCAN_HAS_TBB
