#include <liveview/LiveView.hpp>

#include "examples/cli/ExampleCli.hpp"
#include "log/TaggedLogger.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

using namespace LV;
using namespace LV::Render;

namespace {

std::atomic<bool> g_running{true};

void handle_signal(int) {
    g_running.store(false);
}

struct DemoOptions {
    int                                  frames = 120;
    int                                  fps = 30;
    int                                  pass_delay_ms = 5;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> snapshot_path;
    bool                                 log = false;
};

void print_error(std::string_view context, Error const& error) {
    std::cerr << "[liveview] " << context << " failed: " << describeError(error) << '\n';
}

auto parse_options(int argc, char** argv) -> std::optional<DemoOptions> {
    using LV::Examples::CLI::ExampleCli;
    DemoOptions options;
    ExampleCli  cli;
    cli.set_program_name("liveview_demo");
    cli.add_int("--frames", {.on_value = [&](int value) { options.frames = value; },
                             .help = "number of camera updates to send",
                             .min_value = 1});
    cli.add_int("--fps", {.on_value = [&](int value) { options.fps = value; },
                          .help = "camera update rate",
                          .min_value = 1});
    cli.add_int("--pass-delay-ms", {.on_value = [&](int value) { options.pass_delay_ms = value; },
                                    .help = "simulated cost of the first quality level",
                                    .min_value = 0});
    cli.add_string("--config", {.on_value = [&](std::string value) { options.config_path = std::move(value); },
                                .help = "JSON quality ladder"});
    cli.add_string("--snapshot", {.on_value = [&](std::string value) { options.snapshot_path = std::move(value); },
                                  .help = "write the last delivered image as PNG"});
    cli.add_flag("--log", {.on_set = [&] { options.log = true; }, .help = "enable tagged logging"});

    if (!cli.parse(argc, argv)) {
        std::cerr << cli.usage();
        return std::nullopt;
    }
    if (cli.help_requested()) {
        std::cout << cli.usage();
        std::exit(0);
    }
    return options;
}

auto write_snapshot(ImageBuffer const& image, std::filesystem::path const& output_path) -> bool {
    if (image.empty() || !image.is_consistent()) {
        std::cerr << "[liveview] snapshot has an inconsistent buffer (" << image.width << "x" << image.height << ", "
                  << image.pixels.size() << " bytes)\n";
        return false;
    }
    auto const parent = output_path.parent_path();
    if (!parent.empty()) {
        std::error_code ec{};
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[liveview] failed to create directory '" << parent.string() << "': " << ec.message() << '\n';
            return false;
        }
    }
    auto const path_string = output_path.string();
    auto const channels = static_cast<int>(ImageBuffer::kBytesPerPixel);
    if (stbi_write_png(path_string.c_str(), image.width, image.height, channels, image.pixels.data(),
                       static_cast<int>(image.stride_bytes()))
        == 0) {
        std::cerr << "[liveview] failed to write PNG snapshot to '" << path_string << "'\n";
        return false;
    }
    std::cout << "[liveview] saved snapshot to " << path_string << '\n';
    return true;
}

} // namespace

int main(int argc, char** argv) {
    auto options = parse_options(argc, argv);
    if (!options) {
        return 1;
    }

#ifdef LV_LOG_DEBUG
    bool enable_log = options->log;
    if (char const* env_log = std::getenv("LIVEVIEW_LOG")) {
        if (std::strcmp(env_log, "0") != 0) {
            enable_log = true;
        }
    }
    set_thread_name("Main");
    set_logging_enabled(enable_log);
#else
    if (options->log) {
        std::cerr << "[liveview] built without LV_LOG_DEBUG; --log has no effect\n";
    }
#endif

    std::signal(SIGINT, handle_signal);

    auto config = default_render_queue_config();
    if (options->config_path) {
        auto loaded = load_render_queue_config(*options->config_path);
        if (!loaded) {
            print_error("loading config", loaded.error());
            return 1;
        }
        config = std::move(*loaded);
    }

    auto renderer = std::make_shared<SyntheticRenderer>(SyntheticRendererOptions{
        .pass_delay = std::chrono::milliseconds{options->pass_delay_ms},
        .scale_delay_with_pixels = true,
    });
    auto queue = RenderQueue::create(renderer, config);
    if (!queue) {
        print_error("creating render queue", queue.error());
        return 1;
    }

    auto const frame_period = std::chrono::microseconds{1'000'000 / options->fps};
    auto const start = std::chrono::steady_clock::now();
    std::optional<ImageBuffer> last_image;
    Generation                 last_generation = kNoGeneration;

    auto drain = [&](int frame) {
        auto result = (*queue)->get_result();
        if (!result) {
            return;
        }
        auto const& level = config.quality_levels[result->quality];
        std::cout << "frame " << frame << ": generation " << result->generation << " quality " << result->quality << " ("
                  << level.width << "x" << level.height << ")\n";
        last_generation = result->generation;
        last_image = std::move(result->image);
    };

    for (int frame = 0; frame < options->frames && g_running.load(); ++frame) {
        auto const t = std::chrono::duration<float>(std::chrono::steady_clock::now() - start).count();
        auto const x = (std::sin(t) + 1.0f) / 2.0f;
        auto generation = (*queue)->update_camera({x, 0.0f, 0.1722f}, {0.0f, -152.0f, 0.0f});
        if (!generation) {
            print_error("update_camera", generation.error());
            return 1;
        }
        lv_log("camera update " + std::to_string(*generation), "Demo");
        drain(frame);
        std::this_thread::sleep_until(start + frame_period * (frame + 1));
    }

    // Let the ladder finish for the final pose.
    auto const settle_deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    auto settled = [&] {
        return (*queue)->phase() == WorkerPhase::Idle && (*queue)->delivered_generation() == (*queue)->generation();
    };
    while (g_running.load() && std::chrono::steady_clock::now() < settle_deadline) {
        drain(options->frames);
        if (settled()) {
            break;
        }
        std::this_thread::sleep_for(frame_period);
    }
    drain(options->frames);

    (*queue)->shutdown();

    auto const stats = (*queue)->stats();
    std::cout << "[liveview] poses " << stats.poses_accepted << " (deduplicated " << stats.poses_deduplicated
              << "), passes " << stats.passes_rendered << " (failed " << stats.passes_failed << "), superseded "
              << stats.generations_superseded << ", delivered " << stats.images_delivered << ", last generation "
              << last_generation << '\n';

#ifdef LV_LOG_DEBUG
    logger().flush();
#endif

    if (options->snapshot_path) {
        if (!last_image) {
            std::cerr << "[liveview] no image was delivered; skipping snapshot\n";
            return 1;
        }
        if (!write_snapshot(*last_image, *options->snapshot_path)) {
            return 1;
        }
    }
    return 0;
}
