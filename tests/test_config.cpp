/**
 * @file test_config.cpp
 * @brief Unit tests for configuration parsing and validation
 */
#include <catch2/catch.hpp>
#include "utils/Config.hpp"
#include "utils/Errors.hpp"
#include "test_helpers.hpp"

using Errors::ConfigurationError;

//=============================================================================
// Resolution parsing
//=============================================================================

TEST_CASE("Resolution parsing", "[config][resolution]") {
    SECTION("height comes first") {
        const Config::Resolution res = Config::parseResolution("720,1280");
        REQUIRE(res.width == 1280);
        REQUIRE(res.height == 720);
    }

    SECTION("square resolution") {
        const Config::Resolution res = Config::parseResolution("64,64");
        REQUIRE(res.width == 64);
        REQUIRE(res.height == 64);
    }

    SECTION("malformed values are rejected") {
        REQUIRE_THROWS_AS(Config::parseResolution("abc"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parseResolution(""), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parseResolution("720"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parseResolution("720,1280,3"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parseResolution("720,"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parseResolution(",1280"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parseResolution("720, 1280"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parseResolution("72.5,1280"), ConfigurationError);
    }

    SECTION("non-positive values are rejected") {
        REQUIRE_THROWS_AS(Config::parseResolution("0,1280"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parseResolution("720,0"), ConfigurationError);
        REQUIRE_THROWS_AS(Config::parseResolution("-720,1280"), ConfigurationError);
    }
}

TEST_CASE("Source type parsing", "[config]") {
    REQUIRE(Config::parseSourceType("directory") == Config::SourceType::Directory);
    REQUIRE(Config::parseSourceType("synthetic") == Config::SourceType::Synthetic);
    REQUIRE_THROWS_AS(Config::parseSourceType("webcam"), ConfigurationError);
}

//=============================================================================
// JSON overlay
//=============================================================================

TEST_CASE("JSON configuration overlay", "[config][json]") {
    Config::AppConfig config;

    SECTION("values present in the document replace defaults") {
        Config::applyJson(R"({
            "debug": true,
            "camera": {
                "source": "directory",
                "rate": 5,
                "reference_prefix": "images/",
                "directory": { "path": "/srv/frames", "format": "*.png", "cycle": true }
            },
            "server": { "port": 9000, "threads": 4 }
        })", config);

        REQUIRE(config.debug);
        REQUIRE(config.camera.source == Config::SourceType::Directory);
        REQUIRE(config.camera.rate == 5);
        REQUIRE(config.camera.referencePrefix == "images/");
        REQUIRE(config.camera.directory.path == "/srv/frames");
        REQUIRE(config.camera.directory.format == "*.png");
        REQUIRE(config.camera.directory.cycle);
        REQUIRE(config.server.port == 9000);
        REQUIRE(config.server.threads == 4);
    }

    SECTION("absent keys keep defaults") {
        Config::applyJson(R"({ "camera": { "rate": 30 } })", config);
        REQUIRE(config.camera.rate == 30);
        REQUIRE(config.camera.source == Config::SourceType::Synthetic);
        REQUIRE(config.server.address == "0.0.0.0");
        REQUIRE(config.server.port == 8888);
        REQUIRE(config.camera.synthetic.imageLimit == 100);
    }

    SECTION("synthetic resolution uses the H,W form") {
        Config::applyJson(R"({ "camera": { "synthetic": { "resolution": "480,640", "image_limit": 10 } } })", config);
        REQUIRE(config.camera.synthetic.resolution.width == 640);
        REQUIRE(config.camera.synthetic.resolution.height == 480);
        REQUIRE(config.camera.synthetic.imageLimit == 10);
    }

    SECTION("comments are tolerated") {
        Config::applyJson("{\n  // frames per second\n  \"camera\": { \"rate\": 12 }\n}", config);
        REQUIRE(config.camera.rate == 12);
    }

    SECTION("invalid documents are rejected") {
        REQUIRE_THROWS_AS(Config::applyJson("{ not json", config), ConfigurationError);
        REQUIRE_THROWS_AS(Config::applyJson("[1, 2, 3]", config), ConfigurationError);
        REQUIRE_THROWS_AS(Config::applyJson(R"({ "camera": { "rate": "fast" } })", config), ConfigurationError);
        REQUIRE_THROWS_AS(Config::applyJson(R"({ "camera": { "synthetic": { "resolution": "big" } } })", config), ConfigurationError);
    }

    SECTION("integers that do not fit their setting are rejected") {
        REQUIRE_THROWS_AS(Config::applyJson(R"({ "server": { "port": 70000 } })", config), ConfigurationError);
        REQUIRE_THROWS_AS(Config::applyJson(R"({ "server": { "port": -1 } })", config), ConfigurationError);
        REQUIRE_THROWS_AS(Config::applyJson(R"({ "camera": { "synthetic": { "image_limit": -1 } } })", config), ConfigurationError);
        REQUIRE_THROWS_AS(Config::applyJson(R"({ "camera": { "rate": 10000000000 } })", config), ConfigurationError);
        REQUIRE_THROWS_AS(Config::applyJson(R"({ "camera": { "rate": 2.5 } })", config), ConfigurationError);
        REQUIRE_THROWS_AS(Config::applyJson(R"({ "camera": { "synthetic": { "seed": -5 } } })", config), ConfigurationError);
        REQUIRE(config.server.port == 8888);
        REQUIRE(config.camera.synthetic.imageLimit == 100);

        Config::applyJson(R"({ "server": { "port": 65535 }, "camera": { "cpu_core": -1, "synthetic": { "seed": 18446744073709551615 } } })", config);
        REQUIRE(config.server.port == 65535);
        REQUIRE(config.camera.cpuCore == -1);
        REQUIRE(config.camera.synthetic.seed == 18446744073709551615ULL);
    }

    SECTION("missing file is rejected") {
        REQUIRE_THROWS_AS(Config::loadFile("/nonexistent/camsim.json", config), ConfigurationError);
    }
}

TEST_CASE("Configuration file loading", "[config][json]") {
    helpers::TempDir dir;
    const std::string file = dir.touch("camsim.json", R"({ "camera": { "rate": 7 }, "server": { "address": "127.0.0.1" } })");

    Config::AppConfig config;
    Config::loadFile(file, config);
    REQUIRE(config.camera.rate == 7);
    REQUIRE(config.server.address == "127.0.0.1");
}

//=============================================================================
// Validation
//=============================================================================

TEST_CASE("Configuration validation", "[config][validate]") {
    helpers::TempDir dir;
    Config::AppConfig config;
    config.camera.synthetic.savePath = dir.str();

    SECTION("defaults with a save path are valid") {
        REQUIRE_NOTHROW(Config::validate(config));
    }

    SECTION("rate must be positive") {
        config.camera.rate = 0;
        REQUIRE_THROWS_AS(Config::validate(config), ConfigurationError);
        config.camera.rate = -5;
        REQUIRE_THROWS_AS(Config::validate(config), ConfigurationError);
    }

    SECTION("synthetic source requires an existing save directory") {
        config.camera.synthetic.savePath.clear();
        REQUIRE_THROWS_AS(Config::validate(config), ConfigurationError);
        config.camera.synthetic.savePath = (dir.path() / "missing").string();
        REQUIRE_THROWS_AS(Config::validate(config), ConfigurationError);
        config.camera.synthetic.savePath = dir.touch("file.txt");
        REQUIRE_THROWS_AS(Config::validate(config), ConfigurationError);
    }

    SECTION("directory source requires a path") {
        config.camera.source = Config::SourceType::Directory;
        REQUIRE_THROWS_AS(Config::validate(config), ConfigurationError);
        config.camera.directory.path = dir.str();
        REQUIRE_NOTHROW(Config::validate(config));
    }

    SECTION("server needs at least one thread") {
        config.server.threads = 0;
        REQUIRE_THROWS_AS(Config::validate(config), ConfigurationError);
    }

    SECTION("viewer configuration") {
        Config::ViewerConfig viewer;
        REQUIRE_NOTHROW(Config::validate(viewer));
        viewer.port = 0;
        REQUIRE_THROWS_AS(Config::validate(viewer), ConfigurationError);
    }
}
