#include <liveview/render/PoseStore.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace LV::Render {

PoseStore::PoseStore(bool skip_duplicate_poses)
    : skip_duplicates_(skip_duplicate_poses) {}

auto PoseStore::update(CameraPose const& pose) -> Expected<PoseUpdate> {
    if (!is_finite(pose)) {
        lv_log("PoseStore::update rejected non-finite pose", "PoseStore");
        return std::unexpected(Error{Error::Code::InvalidPose, "camera pose components must be finite"});
    }
    Generation next = kNoGeneration;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return std::unexpected(Error{Error::Code::ShuttingDown, "pose store closed"});
        }
        auto const current = generation_.load(std::memory_order_relaxed);
        if (skip_duplicates_ && current != kNoGeneration && pose == pose_) {
            return PoseUpdate{.generation = current, .deduplicated = true};
        }
        next = current + 1;
        pose_ = pose;
        generation_.store(next, std::memory_order_release);
    }
    changed_.notify_all();
    lv_log("PoseStore::update generation=" + std::to_string(next), "PoseStore");
    return PoseUpdate{.generation = next, .deduplicated = false};
}

auto PoseStore::snapshot() const -> std::optional<PoseSnapshot> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto const current = generation_.load(std::memory_order_relaxed);
    if (current == kNoGeneration) {
        return std::nullopt;
    }
    return PoseSnapshot{.generation = current, .pose = pose_};
}

auto PoseStore::wait_for_newer(Generation seen, std::stop_token stop) -> std::optional<PoseSnapshot> {
    std::unique_lock<std::mutex> lock(mutex_);
    auto const ready = changed_.wait(lock, stop, [&] {
        return closed_ || generation_.load(std::memory_order_relaxed) > seen;
    });
    if (!ready || closed_) {
        return std::nullopt;
    }
    return PoseSnapshot{.generation = generation_.load(std::memory_order_relaxed), .pose = pose_};
}

auto PoseStore::close() -> void {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    changed_.notify_all();
}

auto PoseStore::closed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace LV::Render
