#include <liveview/render/RenderQueueService.hpp>

#include <utility>

namespace LV::Render {

namespace {

template <typename... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};

} // namespace

RenderQueueService::RenderQueueService(RenderQueue& queue)
    : queue_(queue) {}

auto RenderQueueService::handle(RenderQueueRequest const& request) -> RenderQueueResponse {
    return std::visit(Overloaded{
                          [this](UpdateCameraRequest const& req) -> RenderQueueResponse { return update_camera(req); },
                          [this](GetImageRequest const& req) -> RenderQueueResponse { return get_image(req); },
                          [this](StatusRequest const& req) -> RenderQueueResponse { return status(req); },
                      },
                      request);
}

auto RenderQueueService::update_camera(UpdateCameraRequest const& request) -> UpdateCameraResponse {
    return UpdateCameraResponse{.result = queue_.update_camera(request.position, request.rotation)};
}

auto RenderQueueService::get_image(GetImageRequest const&) -> GetImageResponse {
    auto result = queue_.get_result();
    if (!result) {
        return GetImageResponse{};
    }
    return GetImageResponse{
        .image = std::move(result->image),
        .generation = result->generation,
        .quality = result->quality,
    };
}

auto RenderQueueService::status(StatusRequest const&) const -> StatusResponse {
    return StatusResponse{
        .latest_generation = queue_.generation(),
        .delivered_generation = queue_.delivered_generation(),
        .phase = queue_.phase(),
        .stats = queue_.stats(),
    };
}

} // namespace LV::Render
