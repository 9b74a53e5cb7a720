#pragma once

#include <pthread.h>
#include <sched.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>


namespace Lib {
class Thread {
public:
    using Callback = std::function<void()>;

    Thread() = default;
    ~Thread();

    /**
     * @brief Spawn the thread running callback.
     *
     * @param callback Body of the thread
     * @param cpuCore CPU core to pin the thread to, -1 to leave it floating
     * @param realtime Request realtime scheduling for the thread
     * @param realtimePriority Realtime priority, -1 for the policy maximum
     * @param schedulingPolicy Realtime policy (SCHED_FIFO or SCHED_RR)
     * @return int 0 on success, errno-style code otherwise
     */
    int start(Callback callback,
              int cpuCore = -1,
              bool realtime = false,
              int realtimePriority = -1,
              int schedulingPolicy = SCHED_FIFO);
    int join();
    bool isRunning() const { return m_IsRunning_.load(); }
    bool joinable() const {
        std::lock_guard<std::mutex> lock(m_JoinMutex_);
        return m_Joinable_;
    }

    Thread(const Thread&) = delete;
    Thread& operator=(const Thread&) = delete;

private:
    static int setThreadAffinity(pthread_t threadHandle, int cpuCore);
    static void* threadEntry(void* arg);

    pthread_t m_ThreadHandle_{};
    int m_CpuCore_ = -1;
    Callback m_Callback_;
    std::atomic<bool> m_IsRunning_{false};
    bool m_Joinable_ = false;
    mutable std::mutex m_JoinMutex_;  // Guards m_Joinable_ and the pthread_join
};
}
