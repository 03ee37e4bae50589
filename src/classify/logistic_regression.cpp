#include <markscan/classify/checkbox_classifier.hpp>
#include <markscan/classify/logistic_regression.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace markscan::classify {

namespace mc = markscan::core;

namespace {

constexpr int kDims = static_cast<int>(mc::kFeatureCount) + 1;  // weights + bias
constexpr int kBias = static_cast<int>(mc::kFeatureCount);
constexpr int kMaxHalvings = 30;

double linear(const cv::Mat& beta, const mc::FeatureVector::Values& x) {
  double z = beta.at<double>(kBias);
  for (int j = 0; j < kBias; ++j) z += beta.at<double>(j) * x[static_cast<std::size_t>(j)];
  return z;
}

/// log(1 + exp(-m)) without overflow.
double log1p_exp_neg(double m) {
  return m > 0.0 ? std::log1p(std::exp(-m)) : -m + std::log1p(std::exp(m));
}

double objective(const cv::Mat& beta,
                 std::span<const mc::FeatureVector::Values> x,
                 std::span<const int> labels,
                 std::span<const double> weights,
                 double c) {
  double penalty = 0.0;
  for (int j = 0; j < kBias; ++j) penalty += beta.at<double>(j) * beta.at<double>(j);
  double loss = 0.0;
  for (std::size_t i = 0; i < x.size(); ++i) {
    const double sign = labels[i] != 0 ? 1.0 : -1.0;
    loss += weights[i] * log1p_exp_neg(sign * linear(beta, x[i]));
  }
  return 0.5 * penalty + c * loss;
}

}  // namespace

double LogisticFit::decision(const mc::FeatureVector::Values& x) const noexcept {
  double z = bias;
  for (std::size_t j = 0; j < mc::kFeatureCount; ++j) z += weights[j] * x[j];
  return z;
}

double LogisticFit::probability(const mc::FeatureVector::Values& x) const noexcept {
  return sigmoid(decision(x));
}

std::expected<LogisticFit, mc::PipelineError> fit_logistic_regression(
    std::span<const mc::FeatureVector::Values> x,
    std::span<const int> labels,
    std::span<const double> sample_weights,
    const LogisticRegressionOptions& options) {
  if (x.empty() || labels.size() != x.size() || sample_weights.size() != x.size() ||
      options.c <= 0.0 || options.max_iterations <= 0) {
    return std::unexpected(mc::PipelineError::CalibrationFailed);
  }

  cv::Mat beta = cv::Mat::zeros(kDims, 1, CV_64F);
  double current = objective(beta, x, labels, sample_weights, options.c);
  LogisticFit fit;

  for (int iter = 1; iter <= options.max_iterations; ++iter) {
    fit.iterations = iter;

    // Gradient and Hessian of the objective; the bias row carries no penalty.
    cv::Mat grad = cv::Mat::zeros(kDims, 1, CV_64F);
    cv::Mat hess = cv::Mat::zeros(kDims, kDims, CV_64F);
    for (int j = 0; j < kBias; ++j) {
      grad.at<double>(j) = beta.at<double>(j);
      hess.at<double>(j, j) = 1.0;
    }
    cv::Mat row(1, kDims, CV_64F);
    for (std::size_t i = 0; i < x.size(); ++i) {
      const double p = sigmoid(linear(beta, x[i]));
      const double y = labels[i] != 0 ? 1.0 : 0.0;
      const double s = options.c * sample_weights[i];
      for (int j = 0; j < kBias; ++j) row.at<double>(j) = x[i][static_cast<std::size_t>(j)];
      row.at<double>(kBias) = 1.0;
      grad += (s * (p - y)) * row.t();
      hess += (s * p * (1.0 - p)) * (row.t() * row);
    }

    cv::Mat step;
    if (!cv::solve(hess, grad, step, cv::DECOMP_CHOLESKY) &&
        !cv::solve(hess, grad, step, cv::DECOMP_SVD)) {
      return std::unexpected(mc::PipelineError::CalibrationFailed);
    }

    // Backtracking keeps each iteration non-increasing on the objective.
    double scale = 1.0;
    cv::Mat candidate = beta - step;
    double next = objective(candidate, x, labels, sample_weights, options.c);
    for (int h = 0; h < kMaxHalvings && next > current; ++h) {
      scale *= 0.5;
      candidate = beta - scale * step;
      next = objective(candidate, x, labels, sample_weights, options.c);
    }
    if (!std::isfinite(next)) {
      return std::unexpected(mc::PipelineError::CalibrationFailed);
    }

    const double max_step = cv::norm(scale * step, cv::NORM_INF);
    beta = candidate;
    current = next;
    if (max_step < options.tolerance) {
      fit.converged = true;
      break;
    }
  }

  for (int j = 0; j < kBias; ++j) fit.weights[static_cast<std::size_t>(j)] = beta.at<double>(j);
  fit.bias = beta.at<double>(kBias);
  return fit;
}

}  // namespace markscan::classify
