#include "Modules/ModuleBase.hpp"

#include "utils/logger.hpp"


namespace Modules {
Base::Base(int moduleID_, const std::string& name) : moduleID(moduleID_), m_name(name) {
}


Base::~Base() {
    requestStop_();
    join();
}


int Base::trigger(void) {
    if (m_Running.exchange(true)) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "%s already running\n", m_name.c_str());
        return -1;
    }

    m_TimerCanRun = true;
    m_Thread = std::thread(&Base::mainProc, this);
    m_TimerThread = std::thread(&Base::timerThread, this);
    return 0;
}


void Base::join(void) {
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    if (m_TimerThread.joinable()) {
        m_TimerThread.join();
    }
}


void Base::requestStop_(void) {
    {
        std::lock_guard<std::mutex> lock(m_StopMutex);
        m_Running.store(false);
    }
    m_StopCv.notify_all();
}


void Base::waitForStop_(void) {
    std::unique_lock<std::mutex> lock(m_StopMutex);
    m_StopCv.wait(lock, [this]() { return !m_Running.load(); });
}


/**
 * @brief Call OnTimer() every m_SleepPeriod milliseconds until the module stops
 * 
 */
void Base::timerThread(void) {
    std::unique_lock<std::mutex> lock(m_StopMutex);
    while (m_Running.load() && m_TimerCanRun.load()) {
        lock.unlock();
        OnTimer();
        lock.lock();
        m_StopCv.wait_for(lock, std::chrono::milliseconds(m_SleepPeriod.load()),
                          [this]() { return !m_Running.load(); });
    }
}
}
