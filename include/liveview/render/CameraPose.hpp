#pragma once

#include <array>
#include <cstdint>

namespace LV::Render {

using Generation   = std::uint64_t;
using QualityLevel = std::uint32_t;

// Generation 0 is reserved for "no pose accepted yet".
inline constexpr Generation kNoGeneration = 0;

struct CameraPose {
    std::array<float, 3> position{};
    std::array<float, 3> rotation{}; // Euler XYZ, degrees

    auto operator==(CameraPose const&) const -> bool = default;
};

struct PoseSnapshot {
    Generation generation = kNoGeneration;
    CameraPose pose{};
};

// Row-major 4x4 camera-to-world transform.
using Matrix4 = std::array<float, 16>;

[[nodiscard]] auto is_finite(CameraPose const& pose) -> bool;

// Converts a viewer-space pose (y up, -z forward) into the renderer's world
// frame (z up): world position is (z, -x, y) and the orientation is rebuilt
// from the viewing direction.
[[nodiscard]] auto camera_to_world(CameraPose const& pose) -> Matrix4;

} // namespace LV::Render
