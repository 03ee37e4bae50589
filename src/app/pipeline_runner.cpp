#include <markscan/app/pipeline_runner.hpp>
#include <algorithm>
#include <filesystem>
#include <map>
#include <mutex>
#include <queue>
#include <set>
#include <thread>
#include <vector>

namespace markscan::app {

namespace mc = markscan::core;

mc::PageState make_page_state(const PageInput& page) {
  mc::PageState state;
  state.page_id = page.page_id;
  state.page_name = page.page_name;
  state.image = page.image;
  return state;
}

std::vector<std::string> page_names(const std::vector<std::string>& paths) {
  std::vector<std::string> names;
  names.reserve(paths.size());
  std::map<std::string, std::size_t> stem_count;
  for (const auto& p : paths) {
    names.push_back(std::filesystem::path(p).stem().string());
    ++stem_count[names.back()];
  }
  std::set<std::string> taken;
  for (const auto& name : names) {
    if (stem_count[name] == 1) taken.insert(name);
  }
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (stem_count[names[i]] == 1) continue;
    const std::string suffix = "_" + std::to_string(i);
    std::string name = names[i] + suffix;
    while (!taken.insert(name).second) name += suffix;
    names[i] = std::move(name);
  }
  return names;
}

PageOutcome run_page(const mc::Pipeline& pipeline,
                     const PageInput& page,
                     StageTimingCallback* timing_cb) {
  return pipeline.run(make_page_state(page), timing_cb);
}

void run_pages(const mc::Pipeline& pipeline,
               const std::vector<PageInput>& pages,
               const PageOutcomeCallback& callback) {
  for (const auto& page : pages) {
    const PageOutcome outcome = run_page(pipeline, page);
    if (callback) callback(page, outcome);
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_pages_parallel(const mc::Pipeline& pipeline,
                        const std::vector<PageInput>& pages,
                        const PageOutcomeCallback& callback,
                        std::size_t num_workers) {
  const std::size_t n = pages.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_pages(pipeline, pages, callback);
    return;
  }

  // Every index is queued before the workers start; they drain the queue
  // and exit once it is empty.
  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      const PageOutcome outcome = run_page(pipeline, pages[idx]);
      callback(pages[idx], outcome);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace markscan::app
