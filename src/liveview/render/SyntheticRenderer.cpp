#include <liveview/render/SyntheticRenderer.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <thread>

namespace LV::Render {

namespace {

auto to_byte(double value) -> std::uint8_t {
    return static_cast<std::uint8_t>(std::clamp(value, 0.0, 1.0) * 255.0 + 0.5);
}

} // namespace

SyntheticRenderer::SyntheticRenderer(SyntheticRendererOptions options)
    : options_(options) {}

auto SyntheticRenderer::render_pass(CameraPose const& pose, QualityLevel level, QualityLevelSpec const& spec)
    -> Expected<RenderPassOutput> {
    if (spec.width <= 0 || spec.height <= 0) {
        return std::unexpected(Error{Error::Code::RenderFailed, "synthetic renderer needs a positive image size"});
    }

    auto const pixel_count = static_cast<std::uint64_t>(spec.width) * static_cast<std::uint64_t>(spec.height);
    if (level == 0) {
        base_pixel_count_.store(pixel_count, std::memory_order_relaxed);
    }
    if (options_.pass_delay.count() > 0) {
        auto delay = options_.pass_delay;
        auto const base = base_pixel_count_.load(std::memory_order_relaxed);
        if (options_.scale_delay_with_pixels && base > 0) {
            delay *= static_cast<std::int64_t>(std::max<std::uint64_t>(1, pixel_count / base));
        }
        std::this_thread::sleep_for(delay);
    }

    auto const c2w = camera_to_world(pose);
    auto const aspect = static_cast<double>(spec.width) / static_cast<double>(spec.height);
    auto const half_height = std::tan(static_cast<double>(spec.fov_degrees) * std::numbers::pi / 360.0);
    auto const half_width = half_height * aspect;
    auto const band = 0.5 + 0.5 * std::sin(static_cast<double>(c2w[3] + c2w[7] + c2w[11]));

    auto image = ImageBuffer::allocate(spec.width, spec.height);
    for (int y = 0; y < spec.height; ++y) {
        auto row = image.row(y);
        auto const cy = (1.0 - 2.0 * (static_cast<double>(y) + 0.5) / spec.height) * half_height;
        for (int x = 0; x < spec.width; ++x) {
            auto const cx = (2.0 * (static_cast<double>(x) + 0.5) / spec.width - 1.0) * half_width;
            // Camera looks down -z.
            double dir[3];
            for (int r = 0; r < 3; ++r) {
                dir[r] = c2w[r * 4 + 0] * cx + c2w[r * 4 + 1] * cy - c2w[r * 4 + 2];
            }
            auto const length = std::sqrt(dir[0] * dir[0] + dir[1] * dir[1] + dir[2] * dir[2]);
            auto* px = row.data() + static_cast<std::size_t>(x) * ImageBuffer::kBytesPerPixel;
            px[0] = to_byte(0.5 + 0.5 * dir[0] / length);
            px[1] = to_byte(0.5 + 0.5 * dir[1] / length);
            px[2] = to_byte(0.25 + 0.5 * band * (0.5 + 0.5 * dir[2] / length));
            px[3] = 255;
        }
    }

    passes_rendered_.fetch_add(1, std::memory_order_acq_rel);
    bool const converged = options_.converge_at && level >= *options_.converge_at;
    return RenderPassOutput{.image = std::move(image), .converged = converged};
}

} // namespace LV::Render
