#pragma once

#include <liveview/render/Renderer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace LV::Render {

struct SyntheticRendererOptions {
    // Simulated cost of one pass; scaled by the level's pixel count relative
    // to the first level when scale_delay_with_pixels is set.
    std::chrono::milliseconds pass_delay{0};
    bool                      scale_delay_with_pixels = false;
    // Report convergence once this level has been rendered.
    std::optional<QualityLevel> converge_at;
};

// Deterministic stand-in for a scene renderer: shades each pixel from the
// world-space view direction, so different poses give different images.
class SyntheticRenderer final : public Renderer {
public:
    explicit SyntheticRenderer(SyntheticRendererOptions options = {});

    auto render_pass(CameraPose const& pose, QualityLevel level, QualityLevelSpec const& spec)
        -> Expected<RenderPassOutput> override;

    [[nodiscard]] auto passes_rendered() const -> std::uint64_t {
        return passes_rendered_.load(std::memory_order_acquire);
    }

private:
    SyntheticRendererOptions   options_;
    std::atomic<std::uint64_t> passes_rendered_{0};
    std::atomic<std::uint64_t> base_pixel_count_{0};
};

} // namespace LV::Render
