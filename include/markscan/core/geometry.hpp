#pragma once

#include <array>
#include <cmath>
#include <cstdint>

namespace markscan::core {

/// Coordinate-space tags. A point or rect carries its space in its type, so a
/// checkbox rectangle cannot be applied in the wrong space without an explicit
/// conversion below.
struct RawSpace {};         // scanned page pixels
struct CanonicalSpace {};   // template canvas pixels at template dpi
struct CroppedSpace {};     // pixels inside the canonical crop
struct NormalizedSpace {};  // fractions of template width / height

template <typename Space>
struct Point {
  double x{0.0};
  double y{0.0};

  friend bool operator==(const Point&, const Point&) = default;
};

template <typename Space>
struct Rect {
  double x{0.0};
  double y{0.0};
  double w{0.0};
  double h{0.0};

  [[nodiscard]] double right() const noexcept { return x + w; }
  [[nodiscard]] double bottom() const noexcept { return y + h; }

  friend bool operator==(const Rect&, const Rect&) = default;
};

using RawPixelPoint = Point<RawSpace>;
using CanonicalPoint = Point<CanonicalSpace>;
using CroppedPoint = Point<CroppedSpace>;
using NormalizedPoint = Point<NormalizedSpace>;

using CanonicalRect = Rect<CanonicalSpace>;
using CroppedRect = Rect<CroppedSpace>;
using NormalizedRect = Rect<NormalizedSpace>;

template <typename Space>
[[nodiscard]] double distance(const Point<Space>& a,
                              const Point<Space>& b) noexcept {
  return std::hypot(a.x - b.x, a.y - b.y);
}

/// Template canvas dimensions in canonical pixels.
struct CanvasSize {
  std::uint32_t width{0};
  std::uint32_t height{0};
};

/// Integer crop window in canonical pixels: [x0, x1) x [y0, y1).
struct CropBounds {
  int x0{0};
  int y0{0};
  int x1{0};
  int y1{0};

  [[nodiscard]] int width() const noexcept { return x1 - x0; }
  [[nodiscard]] int height() const noexcept { return y1 - y0; }
  [[nodiscard]] bool empty() const noexcept { return x1 <= x0 || y1 <= y0; }

  friend bool operator==(const CropBounds&, const CropBounds&) = default;
};

[[nodiscard]] CanonicalPoint denormalize(NormalizedPoint p,
                                         CanvasSize canvas) noexcept;
[[nodiscard]] CanonicalRect denormalize(const NormalizedRect& r,
                                        CanvasSize canvas) noexcept;

[[nodiscard]] CroppedPoint to_cropped(CanonicalPoint p,
                                      const CropBounds& crop) noexcept;
[[nodiscard]] CroppedRect to_cropped(const CanonicalRect& r,
                                     const CropBounds& crop) noexcept;
[[nodiscard]] CanonicalPoint from_cropped(CroppedPoint p,
                                          const CropBounds& crop) noexcept;

/// Position on a scanned page of the given size where a normalized template
/// position is expected before any alignment.
[[nodiscard]] RawPixelPoint expected_raw_position(
    NormalizedPoint p,
    std::uint32_t page_width,
    std::uint32_t page_height) noexcept;

enum class TransformKind : std::uint8_t {
  Affine,      // exactly three correspondences
  Projective,  // four correspondences
};

/// Homogeneous 3x3 transform from raw scan pixels to canonical pixels,
/// row-major. The inverse is computed once on construction.
class PageTransform {
 public:
  using Matrix = std::array<double, 9>;

  PageTransform() = default;
  PageTransform(TransformKind kind, const Matrix& raw_to_canonical);

  [[nodiscard]] TransformKind kind() const noexcept { return kind_; }
  [[nodiscard]] const Matrix& matrix() const noexcept { return m_; }
  [[nodiscard]] const Matrix& inverse_matrix() const noexcept { return inv_; }
  [[nodiscard]] bool invertible() const noexcept { return invertible_; }

  [[nodiscard]] CanonicalPoint to_canonical(RawPixelPoint p) const noexcept;
  /// Maps a canonical point back onto the scan. Meaningless if !invertible().
  [[nodiscard]] RawPixelPoint to_raw(CanonicalPoint p) const noexcept;

 private:
  TransformKind kind_{TransformKind::Affine};
  Matrix m_{1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
  Matrix inv_{1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
  bool invertible_{true};
};

}  // namespace markscan::core
