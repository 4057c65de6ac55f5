#pragma once

#include <liveview/core/Error.hpp>
#include <liveview/render/Renderer.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace LV::Render {

struct RenderQueueConfig {
    // Rendered in order for every generation, cheapest first.
    std::vector<QualityLevelSpec> quality_levels;
    // Identical consecutive poses do not start a new generation.
    bool skip_duplicate_poses = true;
};

// Five levels from 0.05x to 1x of a 1280x720 viewport, 60 degree horizontal fov.
[[nodiscard]] auto default_render_queue_config() -> RenderQueueConfig;

[[nodiscard]] auto validate_render_queue_config(RenderQueueConfig const& config) -> Expected<void>;

// Accepts either a bare array of {"width", "height", "fov"} objects or an
// object {"quality_levels": [...], "skip_duplicate_poses": bool}.
[[nodiscard]] auto parse_render_queue_config(std::string_view json_text) -> Expected<RenderQueueConfig>;

[[nodiscard]] auto load_render_queue_config(std::filesystem::path const& path) -> Expected<RenderQueueConfig>;

} // namespace LV::Render
