#pragma once

#include <liveview/core/Error.hpp>
#include <liveview/render/PoseStore.hpp>
#include <liveview/render/RenderQueueConfig.hpp>
#include <liveview/render/RenderQueueStats.hpp>
#include <liveview/render/RenderWorker.hpp>
#include <liveview/render/Renderer.hpp>
#include <liveview/render/ResultArbiter.hpp>

#include <array>
#include <memory>
#include <optional>

namespace LV::Render {

// Progressive render queue for one camera stream. Producers push poses with
// update_camera, consumers poll get_image; neither call waits on rendering.
// Images handed out never go back to an older generation.
class RenderQueue {
public:
    // Validates the config and starts the worker thread.
    [[nodiscard]] static auto create(std::shared_ptr<Renderer> renderer,
                                     RenderQueueConfig config = default_render_queue_config())
        -> Expected<std::unique_ptr<RenderQueue>>;

    ~RenderQueue();

    RenderQueue(RenderQueue const&)                    = delete;
    auto operator=(RenderQueue const&) -> RenderQueue& = delete;

    auto update_camera(std::array<float, 3> const& position, std::array<float, 3> const& rotation)
        -> Expected<Generation>;
    auto update_camera(CameraPose const& pose) -> Expected<Generation>;

    // nullopt means "nothing new since the last retrieval", not a failure.
    auto get_image() -> std::optional<ImageBuffer>;
    // Same as get_image, keeping the generation and quality tags.
    auto get_result() -> std::optional<RenderResult>;

    [[nodiscard]] auto generation() const -> Generation { return store_.generation(); }
    [[nodiscard]] auto delivered_generation() const -> Generation { return arbiter_.high_watermark(); }
    [[nodiscard]] auto phase() const -> WorkerPhase { return worker_.phase(); }
    [[nodiscard]] auto stats() const -> RenderQueueStats { return counters_.snapshot(); }
    [[nodiscard]] auto config() const -> RenderQueueConfig const& { return config_; }

    // Stops the worker and refuses further pose updates. Results already in
    // the slot stay retrievable.
    auto shutdown() -> void;

private:
    RenderQueue(std::shared_ptr<Renderer> renderer, RenderQueueConfig config);

    RenderQueueConfig         config_;
    std::shared_ptr<Renderer> renderer_;
    RenderQueueCounters       counters_;
    PoseStore                 store_;
    ResultArbiter             arbiter_;
    RenderWorker              worker_;
};

} // namespace LV::Render
