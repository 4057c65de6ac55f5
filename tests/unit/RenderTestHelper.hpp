#pragma once

#include <liveview/render/RenderQueue.hpp>
#include <liveview/render/Renderer.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace LV::Render::Test {

// Renderer whose passes block until the test scripts an outcome for them.
class GatedRenderer final : public Renderer {
public:
    enum class Outcome {
        Image,
        Converged,
        Error,
        Throw,
        ThrowUnknown,
        BadBuffer,
    };

    struct Call {
        CameraPose   pose;
        QualityLevel level = 0;
    };

    auto render_pass(CameraPose const& pose, QualityLevel level, QualityLevelSpec const& spec)
        -> Expected<RenderPassOutput> override {
        std::unique_lock<std::mutex> lock(mutex_);
        calls_.push_back(Call{.pose = pose, .level = level});
        changed_.notify_all();
        changed_.wait(lock, [&] { return closed_ || !script_.empty(); });
        if (script_.empty()) {
            return std::unexpected(Error{Error::Code::RenderFailed, "gated renderer closed"});
        }
        auto const outcome = script_.front();
        script_.pop_front();
        lock.unlock();

        switch (outcome) {
        case Outcome::Error:
            return std::unexpected(Error{Error::Code::RenderFailed, "scripted failure"});
        case Outcome::Throw:
            throw std::runtime_error("scripted exception");
        case Outcome::ThrowUnknown:
            throw 42;
        case Outcome::BadBuffer: {
            auto image = ImageBuffer::allocate(spec.width, spec.height);
            image.pixels.resize(image.pixels.size() / 2);
            return RenderPassOutput{.image = std::move(image), .converged = false};
        }
        case Outcome::Image:
        case Outcome::Converged:
            break;
        }
        auto image = ImageBuffer::allocate(spec.width, spec.height);
        for (auto& byte : image.pixels) {
            byte = static_cast<std::uint8_t>(level + 1);
        }
        return RenderPassOutput{.image = std::move(image), .converged = outcome == Outcome::Converged};
    }

    auto release(Outcome outcome = Outcome::Image, int count = 1) -> void {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (int i = 0; i < count; ++i) {
                script_.push_back(outcome);
            }
        }
        changed_.notify_all();
    }

    // Blocks until at least `count` passes have started.
    auto wait_for_calls(std::size_t count, std::chrono::milliseconds timeout = std::chrono::seconds{5}) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return changed_.wait_for(lock, timeout, [&] { return calls_.size() >= count; });
    }

    auto calls() const -> std::vector<Call> {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    auto call_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    // Unblocks the pass in flight; later passes fail immediately.
    auto close() -> void {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        changed_.notify_all();
    }

private:
    mutable std::mutex      mutex_;
    std::condition_variable changed_;
    std::deque<Outcome>     script_;
    std::vector<Call>       calls_;
    bool                    closed_ = false;
};

// Owns a queue driven by a GatedRenderer and closes the renderer before the
// queue joins its worker.
struct GatedQueue {
    std::shared_ptr<GatedRenderer> renderer = std::make_shared<GatedRenderer>();
    std::unique_ptr<RenderQueue>   queue;

    explicit GatedQueue(RenderQueueConfig config) {
        auto created = RenderQueue::create(renderer, std::move(config));
        if (!created) {
            throw std::runtime_error(describeError(created.error()));
        }
        queue = std::move(*created);
    }

    ~GatedQueue() {
        renderer->close();
        queue->shutdown();
    }

    GatedQueue(GatedQueue const&)            = delete;
    GatedQueue& operator=(GatedQueue const&) = delete;
};

inline auto small_ladder(std::size_t levels = 3) -> RenderQueueConfig {
    RenderQueueConfig config{};
    for (std::size_t i = 0; i < levels; ++i) {
        auto const size = static_cast<int>(4u << i);
        config.quality_levels.push_back({.width = size, .height = size, .fov_degrees = 45.0f});
    }
    return config;
}

inline auto pose_at(float x) -> CameraPose {
    return CameraPose{.position = {x, 0.0f, 0.1722f}, .rotation = {0.0f, -152.0f, 0.0f}};
}

// Polls the predicate until it holds or the timeout expires.
inline auto eventually(std::function<bool()> const& predicate,
                       std::chrono::milliseconds timeout = std::chrono::seconds{5}) -> bool {
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
    return predicate();
}

// Polls get_result until something arrives.
inline auto next_result(RenderQueue& queue, std::chrono::milliseconds timeout = std::chrono::seconds{5})
    -> std::optional<RenderResult> {
    std::optional<RenderResult> result;
    eventually([&] {
        result = queue.get_result();
        return result.has_value();
    }, timeout);
    return result;
}

} // namespace LV::Render::Test
