#include <liveview/render/RenderQueue.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>

namespace LV::Render {

auto RenderQueue::create(std::shared_ptr<Renderer> renderer, RenderQueueConfig config)
    -> Expected<std::unique_ptr<RenderQueue>> {
    if (!renderer) {
        return std::unexpected(Error{Error::Code::InvalidConfig, "render queue requires a renderer"});
    }
    if (auto valid = validate_render_queue_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    std::unique_ptr<RenderQueue> queue{new RenderQueue(std::move(renderer), std::move(config))};
    if (auto started = queue->worker_.start(); !started) {
        return std::unexpected(started.error());
    }
    return queue;
}

RenderQueue::RenderQueue(std::shared_ptr<Renderer> renderer, RenderQueueConfig config)
    : config_(std::move(config))
    , renderer_(std::move(renderer))
    , store_(config_.skip_duplicate_poses)
    , worker_(store_, arbiter_, *renderer_, config_.quality_levels, counters_) {
    lv_log("RenderQueue constructed with " + std::to_string(config_.quality_levels.size()) + " quality levels",
           "RenderQueue");
}

RenderQueue::~RenderQueue() {
    shutdown();
}

auto RenderQueue::update_camera(std::array<float, 3> const& position, std::array<float, 3> const& rotation)
    -> Expected<Generation> {
    return update_camera(CameraPose{.position = position, .rotation = rotation});
}

auto RenderQueue::update_camera(CameraPose const& pose) -> Expected<Generation> {
    auto update = store_.update(pose);
    if (!update) {
        counters_.poses_rejected.fetch_add(1, std::memory_order_relaxed);
        return std::unexpected(update.error());
    }
    if (update->deduplicated) {
        counters_.poses_deduplicated.fetch_add(1, std::memory_order_relaxed);
    } else {
        counters_.poses_accepted.fetch_add(1, std::memory_order_relaxed);
    }
    return update->generation;
}

auto RenderQueue::get_image() -> std::optional<ImageBuffer> {
    auto result = get_result();
    if (!result) {
        return std::nullopt;
    }
    return std::move(result->image);
}

auto RenderQueue::get_result() -> std::optional<RenderResult> {
    auto result = arbiter_.consume();
    if (result) {
        counters_.images_delivered.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

auto RenderQueue::shutdown() -> void {
    store_.close();
    worker_.stop();
}

} // namespace LV::Render
