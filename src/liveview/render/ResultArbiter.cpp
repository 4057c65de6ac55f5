#include <liveview/render/ResultArbiter.hpp>

#include <algorithm>
#include <utility>

namespace LV::Render {

auto ResultArbiter::publish(RenderResult candidate) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (candidate.generation < high_watermark_) {
        return false;
    }
    bool const fresher = candidate.generation > slot_generation_
                         || (candidate.generation == slot_generation_ && candidate.quality > slot_quality_);
    if (!fresher) {
        return false;
    }
    slot_generation_ = candidate.generation;
    slot_quality_ = candidate.quality;
    slot_image_ = std::move(candidate.image);
    ready_ = true;
    return true;
}

auto ResultArbiter::consume() -> std::optional<RenderResult> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ready_) {
        return std::nullopt;
    }
    ready_ = false;
    high_watermark_ = std::max(high_watermark_, slot_generation_);
    return RenderResult{
        .generation = slot_generation_,
        .quality = slot_quality_,
        .image = std::exchange(slot_image_, ImageBuffer{}),
    };
}

auto ResultArbiter::high_watermark() const -> Generation {
    std::lock_guard<std::mutex> lock(mutex_);
    return high_watermark_;
}

auto ResultArbiter::peek() const -> SlotState {
    std::lock_guard<std::mutex> lock(mutex_);
    return SlotState{
        .generation = slot_generation_,
        .quality = slot_quality_,
        .ready = ready_,
        .high_watermark = high_watermark_,
    };
}

} // namespace LV::Render
