#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace LV::Render {

// Tightly packed RGBA8 pixels.
struct ImageBuffer {
    static constexpr std::size_t kBytesPerPixel = 4u;

    int                       width = 0;
    int                       height = 0;
    std::vector<std::uint8_t> pixels;

    // Throws std::invalid_argument on negative dimensions.
    [[nodiscard]] static auto allocate(int width_px, int height_px) -> ImageBuffer;

    [[nodiscard]] auto stride_bytes() const -> std::size_t {
        return static_cast<std::size_t>(width) * kBytesPerPixel;
    }
    [[nodiscard]] auto expected_bytes() const -> std::size_t {
        return stride_bytes() * static_cast<std::size_t>(height);
    }
    [[nodiscard]] auto empty() const -> bool { return width == 0 || height == 0; }
    [[nodiscard]] auto is_consistent() const -> bool { return pixels.size() == expected_bytes(); }

    [[nodiscard]] auto row(int y) -> std::span<std::uint8_t>;
    [[nodiscard]] auto row(int y) const -> std::span<std::uint8_t const>;
};

} // namespace LV::Render
