#include <markscan/vision/cv_interop.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

namespace markscan::vision {

namespace mc = markscan::core;

cv::Mat as_mat(const mc::PageImage& page) {
  if (!page.valid()) return cv::Mat();
  return cv::Mat(static_cast<int>(page.height()), static_cast<int>(page.width()),
                 CV_8UC1, const_cast<std::uint8_t*>(page.data().data()),
                 static_cast<std::size_t>(page.width()));
}

mc::PageImage to_page_image(const cv::Mat& mat, double dpi) {
  if (mat.empty() || mat.depth() != CV_8U) return mc::PageImage();

  cv::Mat gray;
  switch (mat.channels()) {
    case 1:
      gray = mat;
      break;
    case 3:
      cv::cvtColor(mat, gray, cv::COLOR_BGR2GRAY);
      break;
    case 4:
      cv::cvtColor(mat, gray, cv::COLOR_BGRA2GRAY);
      break;
    default:
      return mc::PageImage();
  }

  const auto w = static_cast<std::uint32_t>(gray.cols);
  const auto h = static_cast<std::uint32_t>(gray.rows);
  std::vector<std::uint8_t> buffer(mc::PageImage::min_bytes(w, h));
  for (int y = 0; y < gray.rows; ++y) {
    std::memcpy(buffer.data() + static_cast<std::size_t>(y) * w, gray.ptr(y), w);
  }
  return mc::PageImage(w, h, dpi, std::move(buffer));
}

}  // namespace markscan::vision
