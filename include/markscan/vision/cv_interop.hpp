#pragma once

#include <markscan/core/page_image.hpp>
#include <opencv2/core/mat.hpp>

namespace markscan::vision {

/// Read-only CV_8UC1 view over the page buffer (no copy). Empty if the page is
/// not valid. The view must not be written to and must not outlive the page.
cv::Mat as_mat(const markscan::core::PageImage& page);

/// Copy an 8-bit image into a PageImage. Multi-channel input is converted to
/// grayscale first.
markscan::core::PageImage to_page_image(const cv::Mat& mat, double dpi);

}  // namespace markscan::vision
