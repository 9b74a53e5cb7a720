/**
 * @file test_broadcast_channel.cpp
 * @brief Unit tests for Subscription, BroadcastChannel and ChannelRegistry
 */
#include <catch2/catch.hpp>
#include "app/stream/ChannelRegistry.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using Stream::BroadcastChannel;
using Stream::ChannelRegistry;
using Stream::Subscription;

namespace {
Msg::Message frame(int n) {
    return Msg::ImagePath{"frame_" + std::to_string(n) + ".jpg"};
}

std::vector<Msg::Message> drain(Subscription& subscription) {
    std::vector<Msg::Message> out;
    while (auto msg = subscription.take()) {
        out.push_back(*msg);
    }
    return out;
}
}  // namespace

//=============================================================================
// Subscription mailbox
//=============================================================================

TEST_CASE("Subscription coalesces frame references", "[channel][subscription]") {
    Subscription subscription("camera");

    SECTION("only the newest undelivered frame is kept") {
        for (int i = 0; i < 10; i++) {
            subscription.deliver(frame(i));
        }
        REQUIRE(subscription.pending() == 1);
        REQUIRE(subscription.coalescedCount() == 9);
        REQUIRE(subscription.deliveredCount() == 10);

        auto msg = subscription.take();
        REQUIRE(msg);
        REQUIRE(std::get<Msg::ImagePath>(*msg).path == "frame_9.jpg");
        REQUIRE_FALSE(subscription.take());
    }

    SECTION("events are never coalesced and keep their order") {
        subscription.deliver(Msg::Shoot{Msg::ShotType::Single});
        subscription.deliver(frame(1));
        subscription.deliver(Msg::Shoot{Msg::ShotType::Burst});
        subscription.deliver(Msg::Mode{Msg::CameraMode::Smart});
        subscription.deliver(frame(2));

        const auto messages = drain(subscription);
        REQUIRE(messages.size() == 4);
        REQUIRE(std::get<Msg::Shoot>(messages[0]).type == Msg::ShotType::Single);
        REQUIRE(std::get<Msg::Shoot>(messages[1]).type == Msg::ShotType::Burst);
        REQUIRE(std::get<Msg::Mode>(messages[2]).type == Msg::CameraMode::Smart);
        REQUIRE(std::get<Msg::ImagePath>(messages[3]).path == "frame_2.jpg");
    }

    SECTION("pending notification fires only on empty to non-empty") {
        int notified = 0;
        subscription.onPending.connect([&notified]() { notified++; });

        subscription.deliver(frame(1));
        subscription.deliver(Msg::Shoot{});
        subscription.deliver(frame(2));
        REQUIRE(notified == 1);

        drain(subscription);
        subscription.deliver(Msg::Mode{});
        REQUIRE(notified == 2);
    }

    SECTION("closed subscription drops deliveries") {
        subscription.deliver(frame(1));
        subscription.close();
        REQUIRE(subscription.isClosed());
        REQUIRE(subscription.pending() == 0);

        subscription.deliver(frame(2));
        subscription.deliver(Msg::Shoot{});
        REQUIRE(subscription.pending() == 0);
        REQUIRE_FALSE(subscription.take());
    }
}

//=============================================================================
// BroadcastChannel
//=============================================================================

TEST_CASE("BroadcastChannel fan-out", "[channel]") {
    BroadcastChannel channel("shoot");

    SECTION("every attached subscriber receives each event once") {
        auto a = channel.attach();
        auto b = channel.attach();
        REQUIRE(channel.subscriberCount() == 2);

        REQUIRE(channel.publish(Msg::Shoot{Msg::ShotType::Single}));
        REQUIRE(channel.publish(Msg::Shoot{Msg::ShotType::Burst}));
        REQUIRE(channel.publishedCount() == 2);

        for (auto* sub : {a.get(), b.get()}) {
            const auto messages = drain(*sub);
            REQUIRE(messages.size() == 2);
            REQUIRE(std::get<Msg::Shoot>(messages[0]).type == Msg::ShotType::Single);
            REQUIRE(std::get<Msg::Shoot>(messages[1]).type == Msg::ShotType::Burst);
        }
    }

    SECTION("late subscribers get no replay") {
        REQUIRE(channel.publish(Msg::Shoot{}));
        auto late = channel.attach();
        REQUIRE(late->pending() == 0);

        REQUIRE(channel.publish(Msg::Shoot{Msg::ShotType::Burst}));
        REQUIRE(late->pending() == 1);
    }

    SECTION("detaching one subscriber leaves the others untouched") {
        auto a = channel.attach();
        auto b = channel.attach();
        channel.publish(Msg::Shoot{});

        channel.detach(a);
        REQUIRE(a->isClosed());
        REQUIRE(channel.subscriberCount() == 1);

        channel.publish(Msg::Shoot{Msg::ShotType::Burst});
        REQUIRE(a->pending() == 0);
        REQUIRE(b->pending() == 2);
    }

    SECTION("a destroyed subscription is dropped without detaching") {
        auto a = channel.attach();
        a.reset();
        REQUIRE(channel.publish(Msg::Shoot{}));
        REQUIRE(channel.subscriberCount() == 0);
    }

    SECTION("closed publication rejects messages") {
        auto a = channel.attach();
        channel.closePublication();
        REQUIRE_FALSE(channel.isPublicationOpen());
        REQUIRE_FALSE(channel.publish(Msg::Shoot{}));
        REQUIRE(a->pending() == 0);
        REQUIRE(channel.subscriberCount() == 1);

        channel.openPublication();
        REQUIRE(channel.publish(Msg::Shoot{}));
        REQUIRE(a->pending() == 1);
    }

    SECTION("shutdown disconnects every subscriber") {
        auto a = channel.attach();
        channel.shutdown();
        REQUIRE(channel.subscriberCount() == 0);
        REQUIRE_FALSE(channel.publish(Msg::Shoot{}));
        REQUIRE(a->pending() == 0);
    }
}

TEST_CASE("BroadcastChannel survives concurrent attach and detach", "[channel][concurrency]") {
    BroadcastChannel channel("camera");
    auto steady = channel.attach();

    std::atomic<bool> done{false};
    std::atomic<uint64_t> received{0};
    steady->onPending.connect([&]() {
        while (steady->take()) {
            received++;
        }
    });

    std::thread publisher([&]() {
        for (int i = 0; i < 5000; i++) {
            channel.publish(i % 2 ? frame(i) : Msg::Message{Msg::Shoot{}});
        }
        done = true;
    });

    std::vector<std::thread> churners;
    for (int t = 0; t < 3; t++) {
        churners.emplace_back([&]() {
            while (!done.load()) {
                auto sub = channel.attach();
                sub->take();
                channel.detach(sub);
            }
        });
    }

    publisher.join();
    for (auto& t : churners) {
        t.join();
    }

    REQUIRE(channel.publishedCount() == 5000);
    REQUIRE(channel.subscriberCount() == 1);
    // Every event survives, frames may be coalesced away
    REQUIRE(received.load() >= 2500);
    REQUIRE(received.load() <= 5000);
}

//=============================================================================
// ChannelRegistry
//=============================================================================

TEST_CASE("ChannelRegistry manages named channels", "[channel][registry]") {
    ChannelRegistry registry;

    SECTION("well-known channels exist from the start") {
        const auto names = registry.names();
        REQUIRE(std::find(names.begin(), names.end(), "camera") != names.end());
        REQUIRE(std::find(names.begin(), names.end(), "shoot") != names.end());
        REQUIRE(std::find(names.begin(), names.end(), "mode") != names.end());
    }

    SECTION("channels are created on first use") {
        REQUIRE(registry.find("telemetry") == nullptr);
        BroadcastChannel* created = registry.channel("telemetry");
        REQUIRE(created != nullptr);
        REQUIRE(registry.channel("telemetry") == created);
        REQUIRE(registry.find("telemetry") == created);
    }

    SECTION("publishing on one channel does not reach another") {
        auto camera = registry.attach(ChannelRegistry::CameraChannel);
        auto shoot = registry.attach(ChannelRegistry::ShootChannel);

        REQUIRE(registry.publish(ChannelRegistry::ShootChannel, Msg::Shoot{}));
        REQUIRE(shoot->pending() == 1);
        REQUIRE(camera->pending() == 0);
    }

    SECTION("detach closes the subscription") {
        auto mode = registry.attach(ChannelRegistry::ModeChannel);
        registry.detach(mode);
        REQUIRE(mode->isClosed());
        REQUIRE(registry.find(ChannelRegistry::ModeChannel)->subscriberCount() == 0);
    }

    SECTION("shutdown disconnects subscribers and refuses new work") {
        auto camera = registry.attach(ChannelRegistry::CameraChannel);
        BroadcastChannel* channel = registry.find(ChannelRegistry::CameraChannel);

        registry.shutdown();
        REQUIRE(registry.isShutdown());
        REQUIRE(channel->subscriberCount() == 0);
        REQUIRE_FALSE(channel->isPublicationOpen());

        REQUIRE_FALSE(registry.publish(ChannelRegistry::CameraChannel, frame(1)));
        REQUIRE(registry.attach(ChannelRegistry::CameraChannel) == nullptr);
        REQUIRE(registry.channel("late") == nullptr);
        REQUIRE(camera->pending() == 0);

        registry.shutdown();
        REQUIRE(registry.isShutdown());
    }
}
