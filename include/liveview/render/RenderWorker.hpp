#pragma once

#include <liveview/core/Error.hpp>
#include <liveview/render/PoseStore.hpp>
#include <liveview/render/RenderQueueStats.hpp>
#include <liveview/render/Renderer.hpp>
#include <liveview/render/ResultArbiter.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace LV::Render {

enum class WorkerPhase : std::uint8_t {
    NotStarted = 0,
    Idle,
    Rendering,
    Stopped,
};

[[nodiscard]] auto workerPhaseToString(WorkerPhase phase) -> char const*;

// Single background thread that walks the quality ladder for the newest
// pose. Supersession is checked between passes only; a pass in flight always
// runs to completion and its result is still offered to the arbiter.
class RenderWorker {
public:
    RenderWorker(PoseStore& store,
                 ResultArbiter& arbiter,
                 Renderer& renderer,
                 std::vector<QualityLevelSpec> levels,
                 RenderQueueCounters& counters);
    ~RenderWorker();

    RenderWorker(RenderWorker const&)                    = delete;
    auto operator=(RenderWorker const&) -> RenderWorker& = delete;

    auto start() -> Expected<void>;
    // Idempotent. Waits for the pass in flight, if any.
    auto stop() -> void;

    [[nodiscard]] auto phase() const -> WorkerPhase { return phase_.load(std::memory_order_acquire); }
    // Generation of the pose most recently picked up.
    [[nodiscard]] auto working_generation() const -> Generation {
        return working_generation_.load(std::memory_order_acquire);
    }

private:
    auto run(std::stop_token stop) -> void;
    auto render_generation(PoseSnapshot const& snapshot, std::stop_token const& stop) -> void;
    auto render_level(PoseSnapshot const& snapshot, QualityLevel level) -> std::optional<RenderPassOutput>;

    PoseStore&                    store_;
    ResultArbiter&                arbiter_;
    Renderer&                     renderer_;
    std::vector<QualityLevelSpec> levels_;
    RenderQueueCounters&          counters_;

    std::atomic<WorkerPhase> phase_{WorkerPhase::NotStarted};
    std::atomic<Generation>  working_generation_{kNoGeneration};
    std::jthread             thread_;
};

} // namespace LV::Render
