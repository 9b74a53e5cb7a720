#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>


namespace Modules {

enum ModuleType {
    CAMERA_MODULE,
    STREAM_SERVER
};

class Base {
public:
    explicit Base(int moduleID_, const std::string& name);

    virtual ~Base();

    Base(const Base&) = delete;
    Base& operator=(const Base&) = delete;

    /**
     * @brief Prepare the module. Nothing runs until trigger()
     * 
     * @return int 0 on success, -1 on failure
     */
    virtual int init(void) = 0;

    /**
     * @brief Stop the module's processing
     * 
     * @return int 
     */
    virtual int stop(void) = 0;

    /**
     * @brief Start the main processing loop and the timer thread
     * 
     * @return int 0 on success, -1 if already running
     */
    int trigger(void);

    /**
     * @brief Wait for the module's threads to exit
     * 
     */
    void join(void);

    /**
     * @brief Get the module name
     * 
     * @return const std::string& 
     */
    const std::string& getName(void) const {
        return m_name;
    }

    int getModuleID(void) const {
        return moduleID;
    }

    bool isRunning(void) const {
        return m_Running.load();
    }

protected:
    virtual void mainProc() = 0;

    virtual void OnTimer(void) {
        m_TimerCanRun = false; // If this method isn't overwritten, then exit thread
    }

    /**
     * @brief Set the sleep period for the timer
     * 
     * @param period Period in milliseconds
     */
    void setPeriod(int period) {
        m_SleepPeriod.store(period);
    }

    /**
     * @brief Mark the module as stopping and wake any waiter
     * 
     */
    void requestStop_(void);

    /**
     * @brief Block the calling thread until requestStop_() is called
     * 
     */
    void waitForStop_(void);

    void timerThread(void);

    /**
     * @brief Timer thread keep-alive flag
     * 
     */
    std::atomic<bool> m_TimerCanRun{true};

    /**
     * @brief Timer thread sleep period
     * 
     */
    std::atomic<int> m_SleepPeriod{1}; // Default to 1ms

    const int moduleID = -1;

    std::string m_name;

    std::atomic<bool> m_Running{false};

private:
    std::mutex m_StopMutex;
    std::condition_variable m_StopCv;
    std::thread m_Thread;
    std::thread m_TimerThread;  // This thread handles time-based events per object
};

} // namespace Modules
