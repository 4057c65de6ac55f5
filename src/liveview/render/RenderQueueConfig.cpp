#include <liveview/render/RenderQueueConfig.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace LV::Render {

namespace {

using json = nlohmann::json;

// 60 degree horizontal fov on a 16:9 viewport.
constexpr float kDefaultVerticalFov = 35.98339777135764f;

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

auto parse_level(json const& entry, std::size_t index) -> Expected<QualityLevelSpec> {
    auto const where = "quality level " + std::to_string(index);
    if (!entry.is_object()) {
        return std::unexpected(malformed(where + " is not an object"));
    }
    if (!entry.contains("width") || !entry["width"].is_number_integer()) {
        return std::unexpected(malformed(where + " needs an integer 'width'"));
    }
    if (!entry.contains("height") || !entry["height"].is_number_integer()) {
        return std::unexpected(malformed(where + " needs an integer 'height'"));
    }
    if (!entry.contains("fov") || !entry["fov"].is_number()) {
        return std::unexpected(malformed(where + " needs a numeric 'fov'"));
    }
    auto const width = entry["width"].get<std::int64_t>();
    auto const height = entry["height"].get<std::int64_t>();
    if (width <= 0 || height <= 0 || width > 1 << 16 || height > 1 << 16) {
        return std::unexpected(Error{Error::Code::InvalidConfig, where + " has out of range dimensions"});
    }
    return QualityLevelSpec{
        .width = static_cast<int>(width),
        .height = static_cast<int>(height),
        .fov_degrees = entry["fov"].get<float>(),
    };
}

auto parse_levels(json const& levels) -> Expected<std::vector<QualityLevelSpec>> {
    if (!levels.is_array()) {
        return std::unexpected(malformed("'quality_levels' must be an array"));
    }
    std::vector<QualityLevelSpec> parsed;
    parsed.reserve(levels.size());
    for (std::size_t i = 0; i < levels.size(); ++i) {
        auto level = parse_level(levels[i], i);
        if (!level) {
            return std::unexpected(level.error());
        }
        parsed.push_back(*level);
    }
    return parsed;
}

} // namespace

auto default_render_queue_config() -> RenderQueueConfig {
    return RenderQueueConfig{
        .quality_levels = {
            {.width = 64, .height = 36, .fov_degrees = kDefaultVerticalFov},
            {.width = 128, .height = 72, .fov_degrees = kDefaultVerticalFov},
            {.width = 320, .height = 180, .fov_degrees = kDefaultVerticalFov},
            {.width = 640, .height = 360, .fov_degrees = kDefaultVerticalFov},
            {.width = 1280, .height = 720, .fov_degrees = kDefaultVerticalFov},
        },
        .skip_duplicate_poses = true,
    };
}

auto validate_render_queue_config(RenderQueueConfig const& config) -> Expected<void> {
    if (config.quality_levels.empty()) {
        return std::unexpected(Error{Error::Code::InvalidConfig, "at least one quality level is required"});
    }
    for (std::size_t i = 0; i < config.quality_levels.size(); ++i) {
        auto const& level = config.quality_levels[i];
        if (level.width <= 0 || level.height <= 0) {
            return std::unexpected(Error{Error::Code::InvalidConfig,
                                         "quality level " + std::to_string(i) + " must have positive dimensions"});
        }
        if (!std::isfinite(level.fov_degrees) || level.fov_degrees <= 0.0f || level.fov_degrees >= 180.0f) {
            return std::unexpected(Error{Error::Code::InvalidConfig,
                                         "quality level " + std::to_string(i) + " fov must be in (0, 180) degrees"});
        }
    }
    return {};
}

auto parse_render_queue_config(std::string_view json_text) -> Expected<RenderQueueConfig> {
    auto payload = json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (payload.is_discarded()) {
        return std::unexpected(malformed("render queue config is not valid JSON"));
    }

    RenderQueueConfig config{};
    if (payload.is_array()) {
        auto levels = parse_levels(payload);
        if (!levels) {
            return std::unexpected(levels.error());
        }
        config.quality_levels = std::move(*levels);
    } else if (payload.is_object()) {
        if (!payload.contains("quality_levels")) {
            return std::unexpected(malformed("render queue config needs 'quality_levels'"));
        }
        auto levels = parse_levels(payload["quality_levels"]);
        if (!levels) {
            return std::unexpected(levels.error());
        }
        config.quality_levels = std::move(*levels);
        if (payload.contains("skip_duplicate_poses")) {
            if (!payload["skip_duplicate_poses"].is_boolean()) {
                return std::unexpected(malformed("'skip_duplicate_poses' must be a boolean"));
            }
            config.skip_duplicate_poses = payload["skip_duplicate_poses"].get<bool>();
        }
    } else {
        return std::unexpected(malformed("render queue config must be an array or an object"));
    }

    if (auto valid = validate_render_queue_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

auto load_render_queue_config(std::filesystem::path const& path) -> Expected<RenderQueueConfig> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(Error{Error::Code::NoSuchFile, "config file not found: " + path.string()});
    }
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NoSuchFile, "unable to open config file: " + path.string()});
    }
    std::ostringstream contents;
    contents << stream.rdbuf();
    auto config = parse_render_queue_config(contents.str());
    if (!config) {
        auto error = config.error();
        error.message = path.string() + ": " + error.message.value_or("");
        return std::unexpected(std::move(error));
    }
    return config;
}

} // namespace LV::Render
