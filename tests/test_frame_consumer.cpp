/**
 * @file test_frame_consumer.cpp
 * @brief Unit tests for FrameConsumer backpressure, location resolution and image fetching
 */
#include <catch2/catch.hpp>
#include "viewer/FrameConsumer.hpp"
#include "mocks/mock_canvas.hpp"
#include "mocks/mock_image_fetcher.hpp"
#include "test_helpers.hpp"

#include <opencv2/imgcodecs.hpp>

using Viewer::FrameConsumer;
using Viewer::Label;
using Viewer::percentDecode;
using Viewer::resolveLocation;

//=============================================================================
// Location helpers
//=============================================================================

TEST_CASE("percentDecode", "[viewer][location]") {
    REQUIRE(percentDecode("frame%20001.png") == "frame 001.png");
    REQUIRE(percentDecode("%2Fimages%2fa.jpg") == "/images/a.jpg");
    REQUIRE(percentDecode("plain.jpg") == "plain.jpg");

    SECTION("malformed escapes are kept") {
        REQUIRE(percentDecode("100%") == "100%");
        REQUIRE(percentDecode("a%2") == "a%2");
        REQUIRE(percentDecode("%zzb") == "%zzb");
    }
}

TEST_CASE("resolveLocation", "[viewer][location]") {
    REQUIRE(resolveLocation("", "frames/a.png") == "frames/a.png");
    REQUIRE(resolveLocation("http://cam:8080", "a.png") == "http://cam:8080/a.png");
    REQUIRE(resolveLocation("http://cam:8080/", "/a.png") == "http://cam:8080/a.png");
    REQUIRE(resolveLocation("/srv/frames//", "//a.png") == "/srv/frames/a.png");
}

//=============================================================================
// Backpressure
//=============================================================================

TEST_CASE("FrameConsumer skips frames while a fetch is outstanding", "[viewer][consumer]") {
    mocks::MockImageFetcher fetcher;
    mocks::MockCanvas canvas;
    int64_t now = 0;
    FrameConsumer consumer(fetcher, canvas, "/srv/frames", [&now]() { return now; });

    consumer.onImagePath("a.png");
    REQUIRE(consumer.isLoading());
    REQUIRE(fetcher.requested() == std::vector<std::string>{"/srv/frames/a.png"});

    SECTION("references arriving while busy are dropped") {
        consumer.onImagePath("b.png");
        consumer.onImagePath("c.png");
        REQUIRE(consumer.skippedCount() == 2);
        REQUIRE(fetcher.outstanding() == 1);

        fetcher.complete_ok();
        REQUIRE_FALSE(consumer.isLoading());
        REQUIRE(consumer.renderedCount() == 1);
        REQUIRE(canvas.draws() == 1);

        // The next reference after completion is fetched
        consumer.onImagePath("d%20e.png");
        REQUIRE(fetcher.requested().size() == 2);
        REQUIRE(fetcher.requested().back() == "/srv/frames/d e.png");
    }

    SECTION("a failed fetch is counted and does not block later frames") {
        fetcher.complete_error("truncated");
        REQUIRE_FALSE(consumer.isLoading());
        REQUIRE(consumer.failedCount() == 1);
        REQUIRE(canvas.draws() == 0);

        consumer.onImagePath("b.png");
        REQUIRE(consumer.isLoading());
        fetcher.complete_ok();
        REQUIRE(consumer.renderedCount() == 1);
    }

    SECTION("rendering updates the fps label") {
        fetcher.complete_ok();
        REQUIRE(canvas.label(Label::Fps) == "FPS: 0");

        for (int i = 0; i < 3; i++) {
            now += 100;
            consumer.onImagePath("x.png");
            fetcher.complete_ok();
        }
        now = 1000;
        consumer.onImagePath("y.png");
        fetcher.complete_ok();
        REQUIRE(consumer.fps() == 4);
        REQUIRE(canvas.label(Label::Fps) == "FPS: 4");
    }
}

TEST_CASE("FrameConsumer follows a message signal", "[viewer][consumer]") {
    mocks::MockImageFetcher fetcher;
    mocks::MockCanvas canvas;
    FrameConsumer consumer(fetcher, canvas, "");
    boost::signals2::signal<void(const Msg::Message&)> source;

    consumer.start(source);
    source(Msg::Shoot{});
    source(Msg::Mode{});
    REQUIRE(fetcher.requested().empty());

    source(Msg::ImagePath{"frames/1.png"});
    REQUIRE(fetcher.requested() == std::vector<std::string>{"frames/1.png"});
    fetcher.complete_ok();

    consumer.stop();
    REQUIRE(canvas.clears() == 1);
    REQUIRE(canvas.last_image().empty());

    source(Msg::ImagePath{"frames/2.png"});
    REQUIRE(fetcher.requested().size() == 1);
}

//=============================================================================
// File fetcher
//=============================================================================

TEST_CASE("FileImageFetcher decodes on the pool and completes on the loop", "[viewer][fetcher]") {
    helpers::TempDir dir;
    const std::string good = (dir.path() / "good.png").string();
    REQUIRE(cv::imwrite(good, cv::Mat(8, 12, CV_8UC3, cv::Scalar(10, 20, 30))));
    const std::string bad = dir.touch("bad.png", "not an image");

    boost::asio::io_context loop;
    Viewer::FileImageFetcher fetcher(loop, 2);

    std::vector<Viewer::FetchResult> results;
    fetcher.fetch(good, [&results](const Viewer::FetchResult& result) { results.push_back(result); });
    fetcher.fetch(bad, [&results](const Viewer::FetchResult& result) { results.push_back(result); });
    fetcher.fetch((dir.path() / "missing.png").string(), [&results](const Viewer::FetchResult& result) { results.push_back(result); });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (results.size() < 3 && std::chrono::steady_clock::now() < deadline) {
        loop.run_for(std::chrono::milliseconds(20));
        loop.restart();
    }
    REQUIRE(results.size() == 3);

    int decoded = 0;
    int failed = 0;
    for (const auto& result : results) {
        if (result.error) {
            failed++;
            REQUIRE(result.image.empty());
        } else {
            decoded++;
            REQUIRE(result.image.cols == 12);
            REQUIRE(result.image.rows == 8);
        }
    }
    REQUIRE(decoded == 1);
    REQUIRE(failed == 2);
}
