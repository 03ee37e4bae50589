#pragma once

#include <markscan/core/error.hpp>
#include <markscan/core/page_image.hpp>
#include <opencv2/core/mat.hpp>
#include <expected>
#include <string>

namespace markscan::vision {

/// Load an image file as a grayscale page at the given resolution.
/// With color_fusion, colour scans keep blue ink dark (see fuse_channels).
[[nodiscard]] std::expected<markscan::core::PageImage,
                            markscan::core::PipelineError>
load_page_image(const std::string& path, double dpi, bool color_fusion = true);

/// Grayscale of a BGR image; with color_fusion the per-pixel minimum of gray
/// and the blue channel, unless blue and red differ by less than one grey
/// level on average (a grey image stored as colour).
cv::Mat fuse_channels(const cv::Mat& bgr, bool color_fusion);

}  // namespace markscan::vision
