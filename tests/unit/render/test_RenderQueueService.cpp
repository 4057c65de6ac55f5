#include <doctest/doctest.h>

#include "RenderTestHelper.hpp"

#include <liveview/render/RenderQueueService.hpp>

#include <limits>
#include <string>
#include <variant>

using namespace LV;
using namespace LV::Render;
using namespace LV::Render::Test;

TEST_SUITE("render.service") {

TEST_CASE("Requests are answered with owned responses") {
    GatedQueue         fixture{small_ladder()};
    RenderQueueService service{*fixture.queue};

    auto update = service.handle(UpdateCameraRequest{.position = {0.1f, 0.0f, 0.2f}, .rotation = {0.0f, -152.0f, 0.0f}});
    REQUIRE(std::holds_alternative<UpdateCameraResponse>(update));
    auto const& accepted = std::get<UpdateCameraResponse>(update).result;
    REQUIRE(accepted.has_value());
    CHECK(*accepted == 1);

    auto empty = service.handle(GetImageRequest{});
    REQUIRE(std::holds_alternative<GetImageResponse>(empty));
    CHECK_FALSE(std::get<GetImageResponse>(empty).image.has_value());

    REQUIRE(fixture.renderer->wait_for_calls(1));
    fixture.renderer->release();

    GetImageResponse image_response;
    REQUIRE(eventually([&] {
        image_response = std::get<GetImageResponse>(service.handle(GetImageRequest{}));
        return image_response.image.has_value();
    }));
    CHECK(image_response.generation == 1);
    CHECK(image_response.quality == 0);
    CHECK(image_response.image->width == 4);
    CHECK(image_response.image->is_consistent());

    auto status = service.handle(StatusRequest{});
    REQUIRE(std::holds_alternative<StatusResponse>(status));
    auto const& snapshot = std::get<StatusResponse>(status);
    CHECK(snapshot.latest_generation == 1);
    CHECK(snapshot.delivered_generation == 1);
    CHECK(snapshot.stats.poses_accepted == 1);
    CHECK(snapshot.stats.images_delivered == 1);
    CHECK(snapshot.phase == WorkerPhase::Rendering);
}

TEST_CASE("Invalid camera requests carry the error back") {
    GatedQueue         fixture{small_ladder()};
    RenderQueueService service{*fixture.queue};

    auto const nan = std::numeric_limits<float>::quiet_NaN();
    auto response = service.update_camera(UpdateCameraRequest{.position = {nan, 0.0f, 0.0f}, .rotation = {}});
    REQUIRE_FALSE(response.result.has_value());
    CHECK(response.result.error().code == Error::Code::InvalidPose);
    CHECK(service.status(StatusRequest{}).latest_generation == kNoGeneration);
}

TEST_CASE("Status reports a stopped worker after shutdown") {
    GatedQueue         fixture{small_ladder()};
    RenderQueueService service{*fixture.queue};

    fixture.renderer->close();
    fixture.queue->shutdown();
    auto status = service.status(StatusRequest{});
    CHECK(status.phase == WorkerPhase::Stopped);
    CHECK(std::string{workerPhaseToString(status.phase)} == "stopped");

    auto refused = service.update_camera(UpdateCameraRequest{});
    REQUIRE_FALSE(refused.result.has_value());
    CHECK(refused.result.error().code == Error::Code::ShuttingDown);
}

}
