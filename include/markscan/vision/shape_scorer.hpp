#pragma once

#include <opencv2/core/types.hpp>
#include <optional>
#include <vector>

namespace markscan::vision {

/// Isoperimetric ratio 4*pi*area / perimeter^2 of a closed contour, in (0, 1].
/// A disc scores 1; thin or concave outlines such as an L-mark score low.
/// Returns nullopt for degenerate contours (area or perimeter below one pixel).
[[nodiscard]] std::optional<double> compactness(
    const std::vector<cv::Point>& contour);

/// How L-mark-like a contour is: 1 - compactness. nullopt if degenerate.
[[nodiscard]] std::optional<double> l_mark_score(
    const std::vector<cv::Point>& contour);

}  // namespace markscan::vision
