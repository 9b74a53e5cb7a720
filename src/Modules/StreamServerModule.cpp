#include "Modules/StreamServerModule.hpp"

#include <stdexcept>

#include "utils/logger.hpp"


namespace Modules {
StreamServerModule::StreamServerModule(int moduleID, std::string name, const Config::ServerConfig& config,
                                       Stream::ChannelRegistry& registry)
    : Base(moduleID, name), m_Config(config), m_Registry(registry) {
}


StreamServerModule::~StreamServerModule() {
    stop();
    join();
    m_Server.reset();
}


/**
 * @brief Bind the listener
 * 
 * @return int 0 on success, -1 if the address cannot be bound
 */
int StreamServerModule::init(void) {
    try {
        m_Server = std::make_unique<Network::StreamServer>(m_IoContext, m_Registry, m_Config.address, m_Config.port);
    } catch (const std::runtime_error& e) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "%s failed to start: %s\n", m_name.c_str(), e.what());
        return -1;
    }

    m_WorkGuard.emplace(boost::asio::make_work_guard(m_IoContext));
    setPeriod(StatsPeriodMs);
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "%s initialized\n", m_name.c_str());
    return 0;
}


/**
 * @brief Close the listener and all sessions, then let the io threads drain
 * 
 * @return int 
 */
int StreamServerModule::stop(void) {
    requestStop_();
    if (m_Server) {
        m_Server->stop();
    }
    m_WorkGuard.reset();
    return 0;
}


/**
 * @brief Serve connections on m_Config.threads io threads, this one included
 * 
 */
void StreamServerModule::mainProc() {
    if (!m_Server) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "%s triggered before init\n", m_name.c_str());
        return;
    }

    m_Server->start();

    std::vector<std::thread> workers;
    for (int i = 1; i < m_Config.threads; i++) {
        workers.emplace_back([this]() { m_IoContext.run(); });
    }
    m_IoContext.run();

    for (auto& worker : workers) {
        worker.join();
    }
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "%s io threads exited\n", m_name.c_str());
}


void StreamServerModule::OnTimer(void) {
    if (!m_Server) {
        return;
    }
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "%s: %zu viewers connected, %llu accepted\n",
                                 m_name.c_str(), m_Server->sessionCount(),
                                 static_cast<unsigned long long>(m_Server->acceptedCount()));
}
}
