#include <liveview/render/ImageBuffer.hpp>

#include <stdexcept>

namespace LV::Render {

auto ImageBuffer::allocate(int width_px, int height_px) -> ImageBuffer {
    if (width_px < 0 || height_px < 0) {
        throw std::invalid_argument("image dimensions must be non-negative");
    }
    ImageBuffer image;
    image.width = width_px;
    image.height = height_px;
    image.pixels.resize(image.expected_bytes());
    return image;
}

auto ImageBuffer::row(int y) -> std::span<std::uint8_t> {
    if (y < 0 || y >= height) {
        throw std::out_of_range("image row out of range");
    }
    return std::span<std::uint8_t>{pixels}.subspan(static_cast<std::size_t>(y) * stride_bytes(), stride_bytes());
}

auto ImageBuffer::row(int y) const -> std::span<std::uint8_t const> {
    if (y < 0 || y >= height) {
        throw std::out_of_range("image row out of range");
    }
    return std::span<std::uint8_t const>{pixels}.subspan(static_cast<std::size_t>(y) * stride_bytes(), stride_bytes());
}

} // namespace LV::Render
