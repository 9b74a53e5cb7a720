#pragma once

#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include "Modules/ModuleBase.hpp"
#include "network_interface/StreamServer.hpp"
#include "utils/Config.hpp"


namespace Modules {

/**
 * @brief Runs the viewer-facing TCP server on a pool of io threads.
 */
class StreamServerModule : public Base {
public:
    StreamServerModule(int moduleID, std::string name, const Config::ServerConfig& config, Stream::ChannelRegistry& registry);
    ~StreamServerModule();

    int init(void) override;
    int stop(void) override;

    const Network::StreamServer* server() const {
        return m_Server.get();
    }

protected:
    void mainProc() override;
    void OnTimer(void) override;

    static constexpr int StatsPeriodMs = 5000;

    Config::ServerConfig m_Config;
    Stream::ChannelRegistry& m_Registry;
    boost::asio::io_context m_IoContext;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> m_WorkGuard;
    std::unique_ptr<Network::StreamServer> m_Server;
};

}  // namespace Modules
