#include <markscan/core/geometry.hpp>
#include <cmath>
#include <limits>

namespace markscan::core {

namespace {

template <typename To, typename From>
Point<To> apply(const PageTransform::Matrix& m, const Point<From>& p) noexcept {
  const double w = m[6] * p.x + m[7] * p.y + m[8];
  if (std::abs(w) < std::numeric_limits<double>::epsilon()) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    return Point<To>{nan, nan};
  }
  return Point<To>{(m[0] * p.x + m[1] * p.y + m[2]) / w,
                   (m[3] * p.x + m[4] * p.y + m[5]) / w};
}

}  // namespace

CanonicalPoint denormalize(NormalizedPoint p, CanvasSize canvas) noexcept {
  return CanonicalPoint{p.x * canvas.width, p.y * canvas.height};
}

CanonicalRect denormalize(const NormalizedRect& r, CanvasSize canvas) noexcept {
  return CanonicalRect{r.x * canvas.width, r.y * canvas.height,
                       r.w * canvas.width, r.h * canvas.height};
}

CroppedPoint to_cropped(CanonicalPoint p, const CropBounds& crop) noexcept {
  return CroppedPoint{p.x - crop.x0, p.y - crop.y0};
}

CroppedRect to_cropped(const CanonicalRect& r, const CropBounds& crop) noexcept {
  return CroppedRect{r.x - crop.x0, r.y - crop.y0, r.w, r.h};
}

CanonicalPoint from_cropped(CroppedPoint p, const CropBounds& crop) noexcept {
  return CanonicalPoint{p.x + crop.x0, p.y + crop.y0};
}

RawPixelPoint expected_raw_position(NormalizedPoint p,
                                    std::uint32_t page_width,
                                    std::uint32_t page_height) noexcept {
  return RawPixelPoint{p.x * page_width, p.y * page_height};
}

PageTransform::PageTransform(TransformKind kind, const Matrix& raw_to_canonical)
    : kind_(kind), m_(raw_to_canonical) {
  const Matrix& a = m_;
  // Adjugate (transposed cofactors) divided by the determinant.
  const double c00 = a[4] * a[8] - a[5] * a[7];
  const double c01 = a[5] * a[6] - a[3] * a[8];
  const double c02 = a[3] * a[7] - a[4] * a[6];
  const double det = a[0] * c00 + a[1] * c01 + a[2] * c02;
  if (!std::isfinite(det) || std::abs(det) < 1e-12) {
    invertible_ = false;
    return;
  }
  const double s = 1.0 / det;
  inv_ = {c00 * s,
          (a[2] * a[7] - a[1] * a[8]) * s,
          (a[1] * a[5] - a[2] * a[4]) * s,
          c01 * s,
          (a[0] * a[8] - a[2] * a[6]) * s,
          (a[2] * a[3] - a[0] * a[5]) * s,
          c02 * s,
          (a[1] * a[6] - a[0] * a[7]) * s,
          (a[0] * a[4] - a[1] * a[3]) * s};
  invertible_ = true;
}

CanonicalPoint PageTransform::to_canonical(RawPixelPoint p) const noexcept {
  return apply<CanonicalSpace>(m_, p);
}

RawPixelPoint PageTransform::to_raw(CanonicalPoint p) const noexcept {
  return apply<RawSpace>(inv_, p);
}

}  // namespace markscan::core
