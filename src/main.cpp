#include <iostream>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>

#include "utils/Config.hpp"
#include "utils/Errors.hpp"
#include "utils/logger.hpp"
#include "version.h"

#include "app/stream/ChannelRegistry.hpp"
#include "Modules/CameraModule.hpp"
#include "Modules/StreamServerModule.hpp"


namespace po = boost::program_options;

namespace {
/**
 * @brief Build the configuration from an optional JSON file and command line flags.
 *
 * Flags given on the command line override values from the file.
 *
 * @return false if only help or version output was requested
 */
bool parseArguments(int argc, char* argv[], Config::AppConfig& config) {
    po::options_description desc("camsim-server options");
    desc.add_options()
        ("help,h", "Show this help")
        ("version", "Show the version")
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("source", po::value<std::string>(), "Frame source: directory or synthetic")
        ("directory,d", po::value<std::string>(), "Directory of images for the directory source")
        ("format", po::value<std::string>(), "File name filter for the directory source (default *.jpg)")
        ("cycle", "Restart the directory source after its last image")
        ("resolution", po::value<std::string>(), "Synthetic frame resolution as H,W (default 720,1280)")
        ("path,p", po::value<std::string>(), "Directory the synthetic source writes images to")
        ("image-limit", po::value<std::size_t>(), "Number of synthetic images kept on disk (default 100)")
        ("rate,r", po::value<int>(), "Frames per second (default 20)")
        ("prefix", po::value<std::string>(), "Published references become prefix + file name")
        ("cpu-core", po::value<int>(), "Pin the scheduler thread to a CPU core")
        ("realtime", "Run the scheduler thread with realtime priority")
        ("address", po::value<std::string>(), "Bind address (default 0.0.0.0)")
        ("port", po::value<unsigned short>(), "TCP port (default 8888)")
        ("threads", po::value<int>(), "Number of io threads (default 2)")
        ("debug", "Enable debug logging");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return false;
    }
    if (vm.count("version")) {
        std::cout << "camsim-server " << CAMSIM_VERSION_MAJOR << "." << CAMSIM_VERSION_MINOR << "."
                  << CAMSIM_VERSION_BUILD << std::endl;
        return false;
    }

    if (vm.count("config")) {
        Config::loadFile(vm["config"].as<std::string>(), config);
    }

    Config::CameraConfig& cam = config.camera;
    if (vm.count("source"))      cam.source = Config::parseSourceType(vm["source"].as<std::string>());
    if (vm.count("directory"))   cam.directory.path = vm["directory"].as<std::string>();
    if (vm.count("format"))      cam.directory.format = vm["format"].as<std::string>();
    if (vm.count("cycle"))       cam.directory.cycle = true;
    if (vm.count("resolution"))  cam.synthetic.resolution = Config::parseResolution(vm["resolution"].as<std::string>());
    if (vm.count("path"))        cam.synthetic.savePath = vm["path"].as<std::string>();
    if (vm.count("image-limit")) cam.synthetic.imageLimit = vm["image-limit"].as<std::size_t>();
    if (vm.count("rate"))        cam.rate = vm["rate"].as<int>();
    if (vm.count("prefix"))      cam.referencePrefix = vm["prefix"].as<std::string>();
    if (vm.count("cpu-core"))    cam.cpuCore = vm["cpu-core"].as<int>();
    if (vm.count("realtime"))    cam.realtime = true;

    if (vm.count("address"))     config.server.address = vm["address"].as<std::string>();
    if (vm.count("port"))        config.server.port = vm["port"].as<unsigned short>();
    if (vm.count("threads"))     config.server.threads = vm["threads"].as<int>();
    if (vm.count("debug"))       config.debug = true;

    return true;
}
}  // namespace


int main(int argc, char* argv[]) {
    Logger* logger = Logger::getLoggerInst();

    Config::AppConfig config;
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
    logger->log(Logger::LOG_LVL_INFO, "camsim server V%u.%u.%u\n", CAMSIM_VERSION_MAJOR, CAMSIM_VERSION_MINOR, CAMSIM_VERSION_BUILD);

    Stream::ChannelRegistry registry;

    std::unique_ptr<Modules::CameraModule      > camera = std::make_unique<Modules::CameraModule>(Modules::CAMERA_MODULE, "Camera", config.camera, registry);
    std::unique_ptr<Modules::StreamServerModule> server = std::make_unique<Modules::StreamServerModule>(Modules::STREAM_SERVER, "StreamServer", config.server, registry);

    // Preliminary initialization; the source is opened before any socket
    if (camera->init() < 0) {
        return 1;
    }
    if (server->init() < 0) {
        return 1;
    }

    // Start each module
    camera->trigger();
    server->trigger();

    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    signals.async_wait([logger](const boost::system::error_code& ec, int signalNumber) {
        if (!ec) {
            logger->log(Logger::LOG_LVL_INFO, "Received signal %d, shutting down\n", signalNumber);
        }
    });
    signalContext.run();

    camera->stop();
    server->stop();
    camera->join();
    server->join();

    registry.shutdown();
    logger->log(Logger::LOG_LVL_INFO, "camsim server exited\n");
    return 0;
}
