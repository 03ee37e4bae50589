#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <vector>

namespace markscan::core {

/// Memory: PageImage shares one immutable 8-bit single-channel buffer
/// (row-major, stride == width). Copies are cheap and never alias mutable
/// state, so distinct threads may read the same PageImage without locking.

/// Grayscale page raster at a known resolution (pixels per inch).
class PageImage {
 public:
  PageImage() = default;

  PageImage(std::uint32_t width,
            std::uint32_t height,
            double dpi,
            std::vector<std::uint8_t> pixels)
      : width_(width),
        height_(height),
        dpi_(dpi),
        pixels_(std::make_shared<const std::vector<std::uint8_t>>(
            std::move(pixels))) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] double dpi() const noexcept { return dpi_; }

  [[nodiscard]] std::span<const std::uint8_t> data() const noexcept {
    if (!pixels_) return {};
    return std::span<const std::uint8_t>(pixels_->data(), pixels_->size());
  }

  [[nodiscard]] bool empty() const noexcept {
    return !pixels_ || pixels_->empty();
  }
  [[nodiscard]] std::size_t size_bytes() const noexcept {
    return pixels_ ? pixels_->size() : 0;
  }

  /// Pixel value at (x, y); caller guarantees bounds.
  [[nodiscard]] std::uint8_t at(std::uint32_t x, std::uint32_t y) const noexcept {
    return (*pixels_)[static_cast<std::size_t>(y) * width_ + x];
  }

  /// True if the buffer holds exactly width * height bytes and dpi > 0.
  [[nodiscard]] bool valid() const noexcept;

  /// Bytes required for given dimensions.
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  double dpi_{0.0};
  std::shared_ptr<const std::vector<std::uint8_t>> pixels_;
};

}  // namespace markscan::core
