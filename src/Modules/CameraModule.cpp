#include "Modules/CameraModule.hpp"

#include "utils/Errors.hpp"
#include "utils/logger.hpp"


namespace Modules {
CameraModule::CameraModule(int moduleID, std::string name, const Config::CameraConfig& config,
                           Stream::ChannelRegistry& registry)
    : Base(moduleID, name), m_Config(config), m_Registry(registry) {
}


CameraModule::CameraModule(int moduleID, std::string name, const Config::CameraConfig& config,
                           Stream::ChannelRegistry& registry, std::unique_ptr<Camera::IFrameSource> source)
    : Base(moduleID, name), m_Config(config), m_Registry(registry), m_Source(std::move(source)) {
}


CameraModule::~CameraModule() {
    stop();
    join();
}


/**
 * @brief Open the frame source and build the scheduler
 * 
 * @return int 0 on success, -1 if the source or rate is unusable
 */
int CameraModule::init(void) {
    Logger* logger = Logger::getLoggerInst();

    try {
        if (!m_Source) {
            m_Source = Camera::makeFrameSource(m_Config);
        }
        m_Scheduler = std::make_unique<Camera::RateScheduler>(std::move(m_Source), m_Config.rate, m_Registry);
    } catch (const Errors::SourceUnavailable& e) {
        logger->log(Logger::LOG_LVL_ERROR, "Camera source unavailable: %s\n", e.what());
        return -1;
    } catch (const Errors::ConfigurationError& e) {
        logger->log(Logger::LOG_LVL_ERROR, "Camera configuration error: %s\n", e.what());
        return -1;
    }

    setPeriod(StatsPeriodMs);
    logger->log(Logger::LOG_LVL_INFO, "%s initialized\n", m_name.c_str());
    return 0;
}


int CameraModule::stop(void) {
    requestStop_();
    if (m_Scheduler) {
        m_Scheduler->stop();
    }
    return 0;
}


/**
 * @brief Run the scheduler until the module is stopped
 * 
 */
void CameraModule::mainProc() {
    if (!m_Scheduler) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "%s triggered before init\n", m_name.c_str());
        return;
    }

    // stop() may already have run; it then found no worker to join
    if (!m_Running.load()) {
        return;
    }
    if (m_Scheduler->start(m_Config.cpuCore, m_Config.realtime) < 0) {
        return;
    }

    waitForStop_();
    m_Scheduler->stop();
}


void CameraModule::OnTimer(void) {
    if (!m_Scheduler) {
        return;
    }
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "%s: %s, %llu frames published, %llu overruns\n",
                                 m_name.c_str(),
                                 Camera::RateScheduler::toString(m_Scheduler->state()),
                                 static_cast<unsigned long long>(m_Scheduler->publishedCount()),
                                 static_cast<unsigned long long>(m_Scheduler->overrunCount()));
}
}
