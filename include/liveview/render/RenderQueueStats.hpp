#pragma once

#include <atomic>
#include <cstdint>

namespace LV::Render {

struct RenderQueueStats {
    std::uint64_t poses_accepted = 0;
    std::uint64_t poses_rejected = 0;
    std::uint64_t poses_deduplicated = 0;
    std::uint64_t passes_rendered = 0;
    std::uint64_t passes_failed = 0;
    std::uint64_t publishes_accepted = 0;
    std::uint64_t publishes_rejected = 0;
    std::uint64_t generations_superseded = 0;
    std::uint64_t generations_converged = 0;
    std::uint64_t images_delivered = 0;
};

struct RenderQueueCounters {
    std::atomic<std::uint64_t> poses_accepted{0};
    std::atomic<std::uint64_t> poses_rejected{0};
    std::atomic<std::uint64_t> poses_deduplicated{0};
    std::atomic<std::uint64_t> passes_rendered{0};
    std::atomic<std::uint64_t> passes_failed{0};
    std::atomic<std::uint64_t> publishes_accepted{0};
    std::atomic<std::uint64_t> publishes_rejected{0};
    std::atomic<std::uint64_t> generations_superseded{0};
    std::atomic<std::uint64_t> generations_converged{0};
    std::atomic<std::uint64_t> images_delivered{0};

    [[nodiscard]] auto snapshot() const -> RenderQueueStats {
        auto load = [](std::atomic<std::uint64_t> const& value) { return value.load(std::memory_order_relaxed); };
        return RenderQueueStats{
            .poses_accepted = load(poses_accepted),
            .poses_rejected = load(poses_rejected),
            .poses_deduplicated = load(poses_deduplicated),
            .passes_rendered = load(passes_rendered),
            .passes_failed = load(passes_failed),
            .publishes_accepted = load(publishes_accepted),
            .publishes_rejected = load(publishes_rejected),
            .generations_superseded = load(generations_superseded),
            .generations_converged = load(generations_converged),
            .images_delivered = load(images_delivered),
        };
    }
};

} // namespace LV::Render
