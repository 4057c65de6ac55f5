#pragma once

#include <liveview/core/Error.hpp>
#include <liveview/render/RenderQueue.hpp>

#include <array>
#include <optional>
#include <variant>

namespace LV::Render {

struct UpdateCameraRequest {
    std::array<float, 3> position{};
    std::array<float, 3> rotation{};
};

struct GetImageRequest {};

struct StatusRequest {};

using RenderQueueRequest = std::variant<UpdateCameraRequest, GetImageRequest, StatusRequest>;

struct UpdateCameraResponse {
    Expected<Generation> result;
};

struct GetImageResponse {
    // Empty when no new image is available.
    std::optional<ImageBuffer> image;
    Generation                 generation = kNoGeneration;
    QualityLevel               quality = 0;
};

struct StatusResponse {
    Generation       latest_generation = kNoGeneration;
    Generation       delivered_generation = kNoGeneration;
    WorkerPhase      phase = WorkerPhase::NotStarted;
    RenderQueueStats stats{};
};

using RenderQueueResponse = std::variant<UpdateCameraResponse, GetImageResponse, StatusResponse>;

// Message front for a transport layer. Every response owns its payload, so
// nothing handed across the boundary aliases queue state.
class RenderQueueService {
public:
    explicit RenderQueueService(RenderQueue& queue);

    auto handle(RenderQueueRequest const& request) -> RenderQueueResponse;

    auto update_camera(UpdateCameraRequest const& request) -> UpdateCameraResponse;
    auto get_image(GetImageRequest const& request) -> GetImageResponse;
    auto status(StatusRequest const& request) const -> StatusResponse;

private:
    RenderQueue& queue_;
};

} // namespace LV::Render
