#include <markscan/core/page_image.hpp>
#include <cstddef>

namespace markscan::core {

std::size_t PageImage::min_bytes(std::uint32_t width,
                                 std::uint32_t height) noexcept {
  return static_cast<std::size_t>(width) * height;
}

bool PageImage::valid() const noexcept {
  return !empty() && width_ > 0 && height_ > 0 && dpi_ > 0.0 &&
         size_bytes() == min_bytes(width_, height_);
}

}  // namespace markscan::core
