#pragma once

#include <liveview/core/Error.hpp>
#include <liveview/render/CameraPose.hpp>
#include <liveview/render/ImageBuffer.hpp>

namespace LV::Render {

// One rung of the quality ladder. Level i of a generation renders with
// ladder entry i.
struct QualityLevelSpec {
    int   width = 0;
    int   height = 0;
    float fov_degrees = 0.0f; // vertical

    auto operator==(QualityLevelSpec const&) const -> bool = default;
};

struct RenderPassOutput {
    ImageBuffer image;
    // Set when further levels would not improve the image.
    bool converged = false;
};

struct RenderResult {
    Generation   generation = kNoGeneration;
    QualityLevel quality = 0;
    ImageBuffer  image;
};

// Image synthesis collaborator. render_pass is synchronous, may take
// arbitrarily long and is never interrupted once started. Failures are
// reported through the Expected error (Error::Code::RenderFailed); thrown
// std::exceptions are tolerated as well.
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual auto render_pass(CameraPose const& pose, QualityLevel level, QualityLevelSpec const& spec)
        -> Expected<RenderPassOutput> = 0;
};

} // namespace LV::Render
