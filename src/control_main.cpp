#include <iostream>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>

#include "app/messages/ControlMessages.hpp"
#include "network_interface/ViewerClient.hpp"
#include "utils/Errors.hpp"
#include "utils/logger.hpp"


namespace po = boost::program_options;

namespace {
constexpr const char* ControlRoute = "/ws/control";
}


int main(int argc, char* argv[]) {
    Logger* logger = Logger::getLoggerInst();
    // Short-lived tool, keep its output on the terminal only
    logger->setJournal(false);

    std::string host = "127.0.0.1";
    unsigned short port = 8888;

    po::options_description desc("camsim-ctl options");
    desc.add_options()
        ("help,h", "Show this help")
        ("host", po::value<std::string>(&host)->default_value(host), "Server host")
        ("port", po::value<unsigned short>(&port)->default_value(port), "Server port")
        ("shoot", po::value<std::string>(), "Publish a shot event: single or burst")
        ("mode", po::value<std::string>(), "Publish a mode change: motion or smart");

    std::vector<Msg::Message> outgoing;
    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        if (vm.count("mode")) {
            const std::string text = vm["mode"].as<std::string>();
            const auto mode = Msg::parseCameraMode(text);
            if (!mode) {
                throw Errors::ConfigurationError("Unknown mode \"" + text + "\"");
            }
            outgoing.push_back(Msg::Mode{*mode});
        }
        if (vm.count("shoot")) {
            const std::string text = vm["shoot"].as<std::string>();
            const auto shot = Msg::parseShotType(text);
            if (!shot) {
                throw Errors::ConfigurationError("Unknown shot type \"" + text + "\"");
            }
            outgoing.push_back(Msg::Shoot{*shot});
        }
        if (outgoing.empty()) {
            throw Errors::ConfigurationError("Nothing to send, use --shoot and/or --mode");
        }
    } catch (const Errors::ConfigurationError& e) {
        logger->log(Logger::LOG_LVL_ERROR, "%s\n", e.what());
        return 1;
    } catch (const po::error& e) {
        logger->log(Logger::LOG_LVL_ERROR, "Invalid arguments: %s\n", e.what());
        return 1;
    }

    boost::asio::io_context io_context;
    Network::ViewerClient client(io_context);
    try {
        client.connect(host, port, ControlRoute);
        for (const auto& msg : outgoing) {
            client.send(msg);
            logger->log(Logger::LOG_LVL_INFO, "Sent %s\n", Msg::encode(msg).c_str());
        }
    } catch (const Errors::TransportFailure& e) {
        logger->log(Logger::LOG_LVL_ERROR, "%s\n", e.what());
        return 1;
    }
    client.close();
    return 0;
}
