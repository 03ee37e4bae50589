/**
 * markscan-calibrate: Fit model-mode classifier parameters from a labeled dataset.
 * Run: ./build/markscan_calibrate --data labeled.csv --out classifier.params [--fp-cost 1] [--fn-cost 2]
 * The dataset is the features.csv written by markscan_cli with reviewed labels.
 */

#include <markscan/app/classifier_io.hpp>
#include <markscan/app/dataset_io.hpp>
#include <markscan/classify/calibrator.hpp>
#include <markscan/core/feature_vector.hpp>

#include <cstdio>
#include <exception>
#include <iostream>
#include <string>

namespace {

namespace ma = markscan::app;
namespace mk = markscan::classify;
namespace mc = markscan::core;

std::string fmt(double v, const char* spec = "%.4f") {
  char buf[48];
  std::snprintf(buf, sizeof(buf), spec, v);
  return buf;
}

void print_report(const mk::CalibrationReport& r, const mk::LinearModel& model) {
  std::cout << "examples: " << r.examples << " (" << r.positives << " marked)\n\n";

  std::cout << "cross-validation:\n";
  for (const auto& f : r.folds) {
    std::cout << "  fold " << f.fold + 1 << ": accuracy " << fmt(f.accuracy) << " (train "
              << f.train_size << ", test " << f.test_size << ")\n";
  }
  std::cout << "  mean " << fmt(r.cv_mean_accuracy) << " +/- " << fmt(r.cv_std_accuracy)
            << "\n\n";

  std::cout << "threshold sweep:\n  threshold    tp    fp    tn    fn    cost\n";
  for (const auto& p : r.sweep) {
    std::cout << "  " << fmt(p.threshold, "%9.2f") << fmt(static_cast<double>(p.confusion.tp), "%6.0f")
              << fmt(static_cast<double>(p.confusion.fp), "%6.0f")
              << fmt(static_cast<double>(p.confusion.tn), "%6.0f")
              << fmt(static_cast<double>(p.confusion.fn), "%6.0f") << fmt(p.cost, "%8.2f")
              << (p.threshold == r.chosen.threshold ? "  <" : "") << "\n";
  }

  const auto& c = r.chosen.confusion;
  std::cout << "\nchosen threshold " << fmt(r.chosen.threshold, "%.2f") << "\n"
            << "confusion matrix (rows: actual, cols: predicted)\n"
            << "               unmarked  marked\n"
            << "  unmarked " << fmt(static_cast<double>(c.tn), "%10.0f")
            << fmt(static_cast<double>(c.fp), "%8.0f") << "\n"
            << "  marked   " << fmt(static_cast<double>(c.fn), "%10.0f")
            << fmt(static_cast<double>(c.tp), "%8.0f") << "\n"
            << "training accuracy " << fmt(r.training_accuracy) << "\n\n";

  std::cout << "coefficients (standardized):\n";
  for (std::size_t j = 0; j < mc::kFeatureCount; ++j) {
    std::cout << "  " << mc::kFeatureNames[j] << ": " << fmt(model.weights[j], "%+.4f") << "\n";
  }
  std::cout << "  bias: " << fmt(model.bias, "%+.4f") << "\n\n";

  std::cout << "single-feature discrimination:\n";
  for (const auto& rank : r.ranking) {
    std::cout << "  " << mc::kFeatureNames[mc::feature_index(rank.feature)] << ": accuracy "
              << fmt(rank.accuracy) << " (marked " << (rank.marked_above ? "above " : "below ")
              << fmt(rank.cutoff, "%.4g") << ")\n";
  }
  if (!r.converged) {
    std::cerr << "Warning: logistic regression did not converge\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string data_path;
  std::string out_path;
  mk::CalibratorConfig config;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    try {
      if (arg == "--data" && i + 1 < argc) {
        data_path = argv[++i];
      } else if (arg == "--out" && i + 1 < argc) {
        out_path = argv[++i];
      } else if (arg == "--fp-cost" && i + 1 < argc) {
        config.fp_cost = std::stod(argv[++i]);
      } else if (arg == "--fn-cost" && i + 1 < argc) {
        config.fn_cost = std::stod(argv[++i]);
      } else if (arg == "--help" || arg == "-h") {
        std::cout << "Usage: markscan_calibrate --data <csv> --out <params> [options]\n"
                  << "  --fp-cost <x>  Cost of a false positive in the threshold sweep (default 1)\n"
                  << "  --fn-cost <y>  Cost of a false negative in the threshold sweep (default 1)\n";
        return 0;
      } else {
        std::cerr << "Unknown argument " << arg << "\n";
        return 1;
      }
    } catch (const std::exception&) {
      std::cerr << "Invalid value for " << arg << "\n";
      return 1;
    }
  }
  if (data_path.empty() || out_path.empty()) {
    std::cerr << "--data and --out are required\n";
    return 1;
  }

  auto rows = ma::load_dataset(data_path);
  if (!rows) {
    std::cerr << "Failed to read dataset " << data_path << ": " << mc::to_string(rows.error())
              << "\n";
    return 1;
  }
  const auto examples = ma::examples_of(*rows);

  const mk::Calibrator calibrator(config);
  auto outcome = calibrator.calibrate(examples);
  if (!outcome) {
    std::cerr << "Calibration failed: need at least " << config.min_examples
              << " examples and " << config.folds << " of each class\n";
    return 1;
  }
  print_report(outcome->report, outcome->parameters);

  if (auto saved = ma::save_classifier(out_path, outcome->parameters); !saved) {
    std::cerr << "Failed to write " << out_path << ": " << mc::to_string(saved.error()) << "\n";
    return 1;
  }
  std::cout << "\nwrote " << out_path << "\n";
  return 0;
}
