#include <markscan/vision/load_image.hpp>
#include <markscan/vision/cv_interop.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace markscan::vision {

namespace mc = markscan::core;

cv::Mat fuse_channels(const cv::Mat& bgr, bool color_fusion) {
  if (bgr.channels() == 1) return bgr;

  cv::Mat gray;
  cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
  if (!color_fusion || bgr.channels() != 3) return gray;

  // A grey image stored as BGR has identical channels.
  std::vector<cv::Mat> channels;
  cv::split(bgr, channels);
  cv::Mat spread;
  cv::absdiff(channels[0], channels[2], spread);
  cv::Scalar mean;
  cv::Scalar stddev;
  cv::meanStdDev(spread, mean, stddev);
  if (mean[0] < 1.0 && stddev[0] < 1.0) return gray;

  cv::Mat fused;
  cv::min(gray, channels[0], fused);
  return fused;
}

std::expected<mc::PageImage, mc::PipelineError> load_page_image(
    const std::string& path, double dpi, bool color_fusion) {
  if (!(dpi > 0.0)) return std::unexpected(mc::PipelineError::InvalidConfig);

  cv::Mat mat = cv::imread(path, cv::IMREAD_COLOR);
  if (mat.empty()) return std::unexpected(mc::PipelineError::LoadFailed);

  mc::PageImage page = to_page_image(fuse_channels(mat, color_fusion), dpi);
  if (!page.valid()) return std::unexpected(mc::PipelineError::LoadFailed);
  return page;
}

}  // namespace markscan::vision
