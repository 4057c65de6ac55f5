#pragma once

#include <liveview/core/Error.hpp>
#include <liveview/render/CameraPose.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>

namespace LV::Render {

struct PoseUpdate {
    Generation generation = kNoGeneration;
    bool       deduplicated = false;
};

// Capacity-one, overwrite-on-write mailbox for the latest camera pose.
// Producers never wait on the renderer; only the worker blocks, in
// wait_for_newer.
class PoseStore {
public:
    explicit PoseStore(bool skip_duplicate_poses = true);

    PoseStore(PoseStore const&)                    = delete;
    auto operator=(PoseStore const&) -> PoseStore& = delete;

    // Fails with InvalidPose when any component is not finite and with
    // ShuttingDown after close(); neither failure touches the generation.
    auto update(CameraPose const& pose) -> Expected<PoseUpdate>;

    [[nodiscard]] auto generation() const -> Generation {
        return generation_.load(std::memory_order_acquire);
    }
    [[nodiscard]] auto snapshot() const -> std::optional<PoseSnapshot>;

    // Returns the latest snapshot once its generation exceeds `seen`.
    // Returns nullopt when stop is requested or the store is closed.
    auto wait_for_newer(Generation seen, std::stop_token stop) -> std::optional<PoseSnapshot>;

    auto close() -> void;
    [[nodiscard]] auto closed() const -> bool;

private:
    mutable std::mutex          mutex_;
    std::condition_variable_any changed_;
    std::atomic<Generation>     generation_{kNoGeneration};
    CameraPose                  pose_{};
    bool                        closed_ = false;
    bool const                  skip_duplicates_;
};

} // namespace LV::Render
