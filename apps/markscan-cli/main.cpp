/**
 * markscan-cli: Align scanned form pages to a template and read their checkboxes.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/markscan_cli --config scan.conf [--template form.tpl] [--output out] page1.png ...
 * Writes <output>/<page>.txt per page (the image stem, suffixed with _<index> when
 * two inputs share a stem), <output>/results.csv and <output>/features.csv
 * (features.csv uses the calibration dataset layout; correct its label column and
 * feed it to markscan_calibrate).
 */

#include <markscan/app/config.hpp>
#include <markscan/app/dataset_io.hpp>
#include <markscan/app/pipeline_factory.hpp>
#include <markscan/app/pipeline_runner.hpp>
#include <markscan/app/run_report.hpp>
#include <markscan/app/template_io.hpp>
#include <markscan/core/page_result.hpp>
#include <markscan/core/pipeline.hpp>
#include <markscan/vision/load_image.hpp>
#ifdef MARKSCAN_HAS_TBB
#include <markscan/app/pipeline_runner_tbb.hpp>
#endif

#include <algorithm>
#include <cstdint>
#include <exception>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

namespace ma = markscan::app;
namespace mc = markscan::core;

struct Options {
  std::string config_path;
  std::string template_path;
  std::string classifier_path;
  std::string output_dir{"output"};
  long workers{-1};
  bool use_tbb{false};
  std::vector<std::string> images;
};

void print_usage() {
  std::cout << "Usage: markscan_cli [options] <image>...\n"
            << "  --config <path>      Pipeline config (key=value file); default: built-in\n"
            << "  --template <path>    Template file (overrides template_path)\n"
            << "  --classifier <path>  Classifier parameters (overrides classifier_path)\n"
            << "  --output <dir>       Output directory (default: output)\n"
            << "  --workers <n>        Worker threads, 0 = hardware concurrency\n"
#ifdef MARKSCAN_HAS_TBB
            << "  --tbb                Run pages with oneTBB instead of the thread pool\n"
#endif
            ;
}

/// Images are loaded and processed in chunks so memory stays bounded.
constexpr std::size_t kPagesPerWorker = 4;

}  // namespace

int main(int argc, char* argv[]) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      opt.config_path = argv[++i];
    } else if (arg == "--template" && i + 1 < argc) {
      opt.template_path = argv[++i];
    } else if (arg == "--classifier" && i + 1 < argc) {
      opt.classifier_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      opt.output_dir = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      const std::string value = argv[++i];
      try {
        std::size_t used = 0;
        opt.workers = std::stol(value, &used);
        if (used != value.size() || opt.workers < 0) throw std::invalid_argument(value);
      } catch (const std::exception&) {
        std::cerr << "Invalid --workers value " << value << "\n";
        return 1;
      }
    } else if (arg == "--tbb") {
      opt.use_tbb = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option " << arg << "\n";
      print_usage();
      return 1;
    } else {
      opt.images.push_back(arg);
    }
  }

  auto cfg = opt.config_path.empty() ? std::expected<ma::PipelineConfig, mc::PipelineError>(
                                           ma::default_config())
                                     : ma::load_config(opt.config_path);
  if (!cfg) {
    std::cerr << "Invalid config " << opt.config_path << ": " << mc::to_string(cfg.error())
              << "\n";
    return 1;
  }
  if (!opt.template_path.empty()) cfg->template_path = opt.template_path;
  if (!opt.classifier_path.empty()) cfg->classifier_path = opt.classifier_path;
  if (opt.workers >= 0) cfg->num_workers = static_cast<std::size_t>(opt.workers);

  if (cfg->template_path.empty()) {
    std::cerr << "No template: set template_path in the config or pass --template\n";
    return 1;
  }
  auto tpl = ma::load_template(cfg->template_path);
  if (!tpl) {
    std::cerr << "Failed to load template " << cfg->template_path << ": "
              << mc::to_string(tpl.error()) << "\n";
    return 1;
  }
  auto params = ma::classifier_parameters_for(*cfg);
  if (!params) {
    std::cerr << "Failed to load classifier " << cfg->classifier_path << ": "
              << mc::to_string(params.error()) << "\n";
    return 1;
  }
  auto pipeline = ma::build_pipeline(*cfg, *tpl, *params);
  if (!pipeline) {
    std::cerr << "Failed to build pipeline: " << mc::to_string(pipeline.error()) << "\n";
    return 1;
  }
  if (opt.images.empty()) {
    print_usage();
    return 1;
  }

  const std::filesystem::path out_dir(opt.output_dir);
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    std::cerr << "Cannot create output directory " << out_dir << ": " << ec.message() << "\n";
    return 1;
  }

  std::cout << "template " << tpl->name << ": " << tpl->checkboxes.size() << " checkboxes, "
            << opt.images.size() << " page(s)\n";

  ma::RunReport report(cfg->review_near_margin);
  std::map<std::uint64_t, mc::PageResult> results;
  std::mutex mutex;

  auto on_page = [&](const ma::PageInput& page, const ma::PageOutcome& outcome) {
    std::ostringstream text;
    if (outcome) {
      ma::write_page_summary(text, *outcome);
    } else {
      text << "page: " << page.page_name << "\nerror: " << mc::to_string(outcome.error())
           << "\n";
    }
    std::ofstream f(out_dir / (page.page_name + ".txt"));
    if (f) f << text.str();

    std::lock_guard lock(mutex);
    if (!f) std::cerr << "Warning: could not write " << page.page_name << ".txt\n";
    if (outcome) {
      report.add(*outcome);
      std::cout << page.page_name << ": " << mc::to_string(outcome->status);
      if (outcome->alignment) std::cout << " (" << mc::to_string(outcome->alignment->tier) << ")";
      std::cout << "\n";
      results.emplace(page.page_id, *outcome);
    } else {
      report.add_failure(page.page_id, page.page_name, outcome.error());
      std::cout << page.page_name << ": error " << mc::to_string(outcome.error()) << "\n";
    }
  };

  const std::size_t workers = cfg->num_workers > 0
                                  ? cfg->num_workers
                                  : std::max(1u, std::thread::hardware_concurrency());
  const std::size_t chunk = workers * kPagesPerWorker;
  const std::vector<std::string> names = ma::page_names(opt.images);
  for (std::size_t start = 0; start < opt.images.size(); start += chunk) {
    std::vector<ma::PageInput> pages;
    const std::size_t end = std::min(opt.images.size(), start + chunk);
    for (std::size_t i = start; i < end; ++i) {
      const std::filesystem::path path(opt.images[i]);
      auto image = markscan::vision::load_page_image(path.string(), cfg->page_dpi,
                                                     cfg->color_fusion);
      if (!image) {
        std::cerr << "Failed to load image: " << path << "\n";
        report.add_failure(i, names[i], image.error());
        continue;
      }
      pages.push_back(ma::PageInput{i, names[i], std::move(*image)});
    }

#ifdef MARKSCAN_HAS_TBB
    if (opt.use_tbb) {
      ma::run_pages_tbb(*pipeline, pages, on_page);
      continue;
    }
#endif
    ma::run_pages_parallel(*pipeline, pages, on_page, cfg->num_workers);
  }
  report.sort();

  std::ofstream csv(out_dir / "results.csv");
  std::ofstream features(out_dir / "features.csv");
  if (!csv || !features) {
    std::cerr << "Warning: could not write results under " << out_dir << "\n";
  } else {
    ma::write_results_header(csv);
    std::vector<ma::DatasetRow> rows;
    for (const auto& [id, result] : results) {
      ma::write_results_rows(csv, result);
      for (const auto& cb : result.checkboxes) {
        if (!cb.features) continue;
        rows.push_back(ma::DatasetRow{result.page_name, cb.id, {*cb.features, cb.marked}});
      }
    }
    ma::write_dataset(features, rows);
  }

  std::cout << "\n";
  report.write(std::cout);
  return 0;
}
