#include <liveview/render/RenderWorker.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <string>
#include <system_error>
#include <utility>

namespace LV::Render {

auto workerPhaseToString(WorkerPhase phase) -> char const* {
    switch (phase) {
    case WorkerPhase::NotStarted:
        return "not_started";
    case WorkerPhase::Idle:
        return "idle";
    case WorkerPhase::Rendering:
        return "rendering";
    case WorkerPhase::Stopped:
        return "stopped";
    }
    return "unknown";
}

RenderWorker::RenderWorker(PoseStore& store,
                           ResultArbiter& arbiter,
                           Renderer& renderer,
                           std::vector<QualityLevelSpec> levels,
                           RenderQueueCounters& counters)
    : store_(store)
    , arbiter_(arbiter)
    , renderer_(renderer)
    , levels_(std::move(levels))
    , counters_(counters) {}

RenderWorker::~RenderWorker() {
    stop();
}

auto RenderWorker::start() -> Expected<void> {
    if (thread_.joinable() || phase() != WorkerPhase::NotStarted) {
        return std::unexpected(Error{Error::Code::UnknownError, "render worker already started"});
    }
    try {
        phase_.store(WorkerPhase::Idle, std::memory_order_release);
        thread_ = std::jthread([this](std::stop_token stop) { this->run(stop); });
    } catch (std::system_error const& ex) {
        phase_.store(WorkerPhase::Stopped, std::memory_order_release);
        return std::unexpected(Error{Error::Code::UnknownError, std::string{"failed to spawn render worker: "} + ex.what()});
    }
    lv_log("RenderWorker::start levels=" + std::to_string(levels_.size()), "RenderWorker");
    return {};
}

auto RenderWorker::stop() -> void {
    if (!thread_.joinable()) {
        return;
    }
    lv_log("RenderWorker::stop requested", "RenderWorker");
    thread_.request_stop();
    thread_.join();
    phase_.store(WorkerPhase::Stopped, std::memory_order_release);
}

auto RenderWorker::run(std::stop_token stop) -> void {
#ifdef LV_LOG_DEBUG
    set_thread_name("RenderWorker");
#endif
    Generation last_seen = kNoGeneration;
    while (!stop.stop_requested()) {
        phase_.store(WorkerPhase::Idle, std::memory_order_release);
        auto snapshot = store_.wait_for_newer(last_seen, stop);
        if (!snapshot) {
            break;
        }
        last_seen = snapshot->generation;
        working_generation_.store(last_seen, std::memory_order_release);
        phase_.store(WorkerPhase::Rendering, std::memory_order_release);
        render_generation(*snapshot, stop);
    }
    phase_.store(WorkerPhase::Stopped, std::memory_order_release);
    lv_log("RenderWorker::run exit", "RenderWorker");
}

auto RenderWorker::render_generation(PoseSnapshot const& snapshot, std::stop_token const& stop) -> void {
    auto const generation = snapshot.generation;
    for (QualityLevel level = 0; level < levels_.size(); ++level) {
        auto pass = render_level(snapshot, level);
        bool const superseded = store_.generation() > generation;

        if (pass) {
            bool const converged = pass->converged;
            bool const accepted = arbiter_.publish(RenderResult{
                .generation = generation,
                .quality = level,
                .image = std::move(pass->image),
            });
            if (accepted) {
                counters_.publishes_accepted.fetch_add(1, std::memory_order_relaxed);
            } else {
                counters_.publishes_rejected.fetch_add(1, std::memory_order_relaxed);
            }
            // A rejection means a newer generation already reached the slot or a consumer.
            if (!accepted || superseded) {
                counters_.generations_superseded.fetch_add(1, std::memory_order_relaxed);
                lv_log("RenderWorker generation=" + std::to_string(generation) + " superseded after level "
                           + std::to_string(level),
                       "RenderWorker");
                return;
            }
            if (converged) {
                counters_.generations_converged.fetch_add(1, std::memory_order_relaxed);
                lv_log("RenderWorker generation=" + std::to_string(generation) + " converged at level "
                           + std::to_string(level),
                       "RenderWorker");
                return;
            }
        } else if (superseded) {
            counters_.generations_superseded.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        if (stop.stop_requested()) {
            return;
        }
    }
    counters_.generations_converged.fetch_add(1, std::memory_order_relaxed);
}

auto RenderWorker::render_level(PoseSnapshot const& snapshot, QualityLevel level) -> std::optional<RenderPassOutput> {
    auto const& spec = levels_[level];
    try {
        auto pass = renderer_.render_pass(snapshot.pose, level, spec);
        if (!pass) {
            counters_.passes_failed.fetch_add(1, std::memory_order_relaxed);
            lv_log("RenderWorker pass failed generation=" + std::to_string(snapshot.generation) + " level="
                       + std::to_string(level) + ": " + describeError(pass.error()),
                   "RenderWorker", "ERROR");
            return std::nullopt;
        }
        if (!pass->image.is_consistent()) {
            counters_.passes_failed.fetch_add(1, std::memory_order_relaxed);
            lv_log("RenderWorker pass returned inconsistent image buffer at level " + std::to_string(level),
                   "RenderWorker", "ERROR");
            return std::nullopt;
        }
        counters_.passes_rendered.fetch_add(1, std::memory_order_relaxed);
        return std::move(*pass);
    } catch (std::exception const& ex) {
        counters_.passes_failed.fetch_add(1, std::memory_order_relaxed);
        lv_log("RenderWorker pass threw generation=" + std::to_string(snapshot.generation) + " level="
                   + std::to_string(level) + ": " + ex.what(),
               "RenderWorker", "ERROR");
        return std::nullopt;
    } catch (...) {
        counters_.passes_failed.fetch_add(1, std::memory_order_relaxed);
        lv_log("RenderWorker pass threw a non-standard exception generation=" + std::to_string(snapshot.generation)
                   + " level=" + std::to_string(level),
               "RenderWorker", "ERROR");
        return std::nullopt;
    }
}

} // namespace LV::Render
