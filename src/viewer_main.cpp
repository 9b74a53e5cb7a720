#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>

#include "utils/Config.hpp"
#include "utils/Errors.hpp"
#include "utils/logger.hpp"
#include "version.h"

#include "network_interface/ViewerClient.hpp"
#include "viewer/FrameConsumer.hpp"
#include "viewer/ImageFetcher.hpp"
#include "viewer/OpenCvCanvas.hpp"
#include "viewer/ShotNotifier.hpp"


namespace po = boost::program_options;

namespace {
constexpr const char* CameraRoute = "/ws/camera";
constexpr const char* EventsRoute = "/ws/events";
constexpr auto PollInterval = std::chrono::milliseconds(10);

bool parseArguments(int argc, char* argv[], Config::ViewerConfig& config) {
    po::options_description desc("camsim-viewer options");
    desc.add_options()
        ("help,h", "Show this help")
        ("host", po::value<std::string>(&config.host)->default_value(config.host), "Server host")
        ("port", po::value<unsigned short>(&config.port)->default_value(config.port), "Server port")
        ("base", po::value<std::string>(&config.baseAddress), "Base the frame references are resolved against")
        ("headless", po::bool_switch(&config.headless), "Do not open a window")
        ("debug", po::bool_switch(&config.debug), "Enable debug logging");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return false;
    }
    return true;
}
}  // namespace


int main(int argc, char* argv[]) {
    Logger* logger = Logger::getLoggerInst();

    Config::ViewerConfig config;
    try {
        if (!parseArguments(argc, argv, config)) {
            return 0;
        }
        Config::validate(config);
    } catch (const Errors::ConfigurationError& e) {
        logger->log(Logger::LOG_LVL_ERROR, "Configuration error: %s\n", e.what());
        return 1;
    } catch (const po::error& e) {
        logger->log(Logger::LOG_LVL_ERROR, "Invalid arguments: %s\n", e.what());
        return 1;
    }

    logger->setDebug(config.debug);
    logger->log(Logger::LOG_LVL_INFO, "camsim viewer V%u.%u.%u\n", CAMSIM_VERSION_MAJOR, CAMSIM_VERSION_MINOR, CAMSIM_VERSION_BUILD);

    boost::asio::io_context loop;

    std::unique_ptr<Viewer::OpenCvCanvas> window;
    std::unique_ptr<Viewer::HeadlessCanvas> headless;
    Viewer::ICanvas* canvas = nullptr;
    if (config.headless) {
        headless = std::make_unique<Viewer::HeadlessCanvas>();
        canvas = headless.get();
    } else {
        window = std::make_unique<Viewer::OpenCvCanvas>("camsim");
        canvas = window.get();
    }

    Viewer::FileImageFetcher fetcher(loop);
    Viewer::FrameConsumer consumer(fetcher, *canvas, config.baseAddress);
    Viewer::ShotNotifier notifier(loop, *canvas);
    Viewer::ModeTracker modeTracker(*canvas);

    Network::ViewerClient cameraClient(loop);
    Network::ViewerClient eventsClient(loop);
    try {
        cameraClient.connect(config.host, config.port, CameraRoute);
        eventsClient.connect(config.host, config.port, EventsRoute);
    } catch (const Errors::TransportFailure& e) {
        logger->log(Logger::LOG_LVL_ERROR, "%s\n", e.what());
        return 1;
    }

    consumer.start(cameraClient.onMessage);
    notifier.start(eventsClient.onMessage);
    modeTracker.start(eventsClient.onMessage);

    cameraClient.onDisconnected.connect([&loop](const std::string&) { loop.stop(); });

    cameraClient.start();
    eventsClient.start();

    boost::asio::signal_set signals(loop, SIGINT, SIGTERM);
    signals.async_wait([&loop](const boost::system::error_code& ec, int) {
        if (!ec) {
            loop.stop();
        }
    });

    // HighGUI needs its event queue pumped from the loop thread
    boost::asio::steady_timer pollTimer(loop);
    std::function<void()> schedulePoll = [&]() {
        pollTimer.expires_after(PollInterval);
        pollTimer.async_wait([&](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            if (!window->poll()) {
                loop.stop();
                return;
            }
            schedulePoll();
        });
    };
    if (window) {
        schedulePoll();
    }

    loop.run();

    consumer.stop();
    notifier.stop();
    modeTracker.stop();
    logger->log(Logger::LOG_LVL_INFO, "Viewer exiting: %llu frames rendered, %llu skipped, %llu failed\n",
                static_cast<unsigned long long>(consumer.renderedCount()),
                static_cast<unsigned long long>(consumer.skippedCount()),
                static_cast<unsigned long long>(consumer.failedCount()));
    return 0;
}
