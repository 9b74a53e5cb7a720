/**
 * @file test_modules.cpp
 * @brief Lifecycle tests for the camera and stream server modules
 */
#include <catch2/catch.hpp>
#include "Modules/CameraModule.hpp"
#include "Modules/StreamServerModule.hpp"
#include "network_interface/ViewerClient.hpp"
#include "mocks/mock_frame_source.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Stream::ChannelRegistry;

TEST_CASE("CameraModule publishes frames until stopped", "[modules][camera]") {
    ChannelRegistry registry;
    auto subscription = registry.attach(ChannelRegistry::CameraChannel);

    Config::CameraConfig config;
    config.rate = 100;

    Modules::CameraModule module(Modules::CAMERA_MODULE, "camera", config, registry,
                                 std::make_unique<mocks::MockFrameSource>());
    REQUIRE(module.getName() == "camera");
    REQUIRE(module.getModuleID() == Modules::CAMERA_MODULE);
    REQUIRE(module.scheduler() == nullptr);

    REQUIRE(module.init() == 0);
    REQUIRE(module.scheduler() != nullptr);
    REQUIRE(module.trigger() == 0);
    REQUIRE(module.isRunning());
    REQUIRE(module.trigger() == -1);

    REQUIRE(helpers::waitFor([&]() { return module.scheduler()->publishedCount() >= 5; }));
    REQUIRE(subscription->pending() == 1);

    module.stop();
    module.join();
    REQUIRE_FALSE(module.isRunning());
    REQUIRE(module.scheduler()->state() == Camera::RateScheduler::State::Stopped);
    REQUIRE_FALSE(subscription->isClosed());
}

TEST_CASE("CameraModule stops promptly right after trigger", "[modules][camera][lifecycle]") {
    constexpr int Cycles = 200;

    // The cycles run on a detached thread so a stuck shutdown fails the test instead of hanging it
    auto completed = std::make_shared<std::atomic<int>>(0);
    std::thread([completed]() {
        for (int i = 0; i < Cycles; i++) {
            ChannelRegistry registry;
            Config::CameraConfig config;
            config.rate = 1000;

            Modules::CameraModule module(Modules::CAMERA_MODULE, "camera", config, registry,
                                         std::make_unique<mocks::MockFrameSource>());
            if (module.init() != 0 || module.trigger() != 0) {
                return;
            }
            if (i % 2 == 0) {
                std::this_thread::sleep_for(2ms);
            }
            module.stop();
            module.join();
            (*completed)++;
        }
    }).detach();

    REQUIRE(helpers::waitFor([&]() { return completed->load() == Cycles; }, 30s));
}

TEST_CASE("CameraModule rejects unusable configuration", "[modules][camera]") {
    ChannelRegistry registry;

    SECTION("missing directory") {
        Config::CameraConfig config;
        config.source = Config::SourceType::Directory;
        config.directory.path = "/nonexistent/camsim/frames";

        Modules::CameraModule module(Modules::CAMERA_MODULE, "camera", config, registry);
        REQUIRE(module.init() == -1);
        REQUIRE(module.scheduler() == nullptr);
    }

    SECTION("non-positive rate") {
        Config::CameraConfig config;
        config.rate = 0;

        Modules::CameraModule module(Modules::CAMERA_MODULE, "camera", config, registry,
                                     std::make_unique<mocks::MockFrameSource>());
        REQUIRE(module.init() == -1);
    }
}

TEST_CASE("StreamServerModule serves viewers until stopped", "[modules][server]") {
    ChannelRegistry registry;

    Config::ServerConfig config;
    config.address = "127.0.0.1";
    config.port = 0;
    config.threads = 2;

    Modules::StreamServerModule module(Modules::STREAM_SERVER, "server", config, registry);
    REQUIRE(module.init() == 0);
    REQUIRE(module.server() != nullptr);
    const unsigned short port = module.server()->port();
    REQUIRE(port != 0);
    REQUIRE(module.trigger() == 0);

    boost::asio::io_context clientIo;
    Network::ViewerClient control(clientIo);
    control.connect("127.0.0.1", port, "/ws/control");
    REQUIRE(helpers::waitFor([&]() { return module.server()->sessionCount() == 1; }));

    auto shoot = registry.attach(ChannelRegistry::ShootChannel);
    control.send(Msg::Shoot{Msg::ShotType::Burst});
    REQUIRE(helpers::waitFor([&]() { return shoot->pending() == 1; }));

    module.stop();
    module.join();
    REQUIRE_FALSE(module.isRunning());
    REQUIRE(module.server()->sessionCount() == 0);

    // The listener is gone once the module stopped
    control.close();
    Network::ViewerClient late(clientIo);
    REQUIRE_THROWS_AS(late.connect("127.0.0.1", port, "/ws/camera"), Errors::TransportFailure);
}

TEST_CASE("StreamServerModule fails init on a bad address", "[modules][server]") {
    ChannelRegistry registry;
    Config::ServerConfig config;
    config.address = "256.1.1.1";
    config.port = 0;

    Modules::StreamServerModule module(Modules::STREAM_SERVER, "server", config, registry);
    REQUIRE(module.init() == -1);
    REQUIRE(module.server() == nullptr);
}
