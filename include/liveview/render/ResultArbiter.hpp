#pragma once

#include <liveview/render/Renderer.hpp>

#include <mutex>
#include <optional>

namespace LV::Render {

struct SlotState {
    Generation   generation = kNoGeneration;
    QualityLevel quality = 0;
    bool         ready = false;
    Generation   high_watermark = kNoGeneration;
};

// Owns the single visible result and the generation of the last result
// handed out. A candidate replaces the slot only when it is not older than
// anything already delivered and is strictly fresher than the slot:
// a newer generation, or the same generation at a higher quality.
class ResultArbiter {
public:
    ResultArbiter() = default;

    ResultArbiter(ResultArbiter const&)                    = delete;
    auto operator=(ResultArbiter const&) -> ResultArbiter& = delete;

    // Rejected candidates are dropped before returning.
    auto publish(RenderResult candidate) -> bool;

    // Moves the ready result out and raises the high watermark to its
    // generation. Returns nullopt when nothing new arrived since the last call.
    auto consume() -> std::optional<RenderResult>;

    [[nodiscard]] auto high_watermark() const -> Generation;
    [[nodiscard]] auto peek() const -> SlotState;

private:
    mutable std::mutex mutex_;
    Generation         slot_generation_ = kNoGeneration;
    QualityLevel       slot_quality_ = 0;
    ImageBuffer        slot_image_;
    bool               ready_ = false;
    Generation         high_watermark_ = kNoGeneration;
};

} // namespace LV::Render
