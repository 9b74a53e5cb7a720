#include "Thread.hpp"

#include <algorithm>
#include <errno.h>
#include <sched.h>

#include "utils/logger.hpp"


namespace Lib {

namespace {
int resolveSchedulingPolicy(int requestedPolicy) {
    return (requestedPolicy <= 0) ? SCHED_FIFO : requestedPolicy;
}

int resolveRealtimePriority(int policy, int requestedPriority, int& resolvedPriority) {
    const int minPriority = sched_get_priority_min(policy);
    if (minPriority == -1) {
        return (errno != 0) ? errno : EINVAL;
    }
    const int maxPriority = sched_get_priority_max(policy);
    if (maxPriority == -1) {
        return (errno != 0) ? errno : EINVAL;
    }
    const int defaultPriority = (requestedPriority < 0) ? maxPriority : requestedPriority;
    resolvedPriority = std::clamp(defaultPriority, minPriority, maxPriority);
    return 0;
}
}

Thread::~Thread() {
    join();
}

int Thread::start(Callback callback,
                  int cpuCore,
                  bool realtime,
                  int realtimePriority,
                  int schedulingPolicy) {
    if (!callback) {
        return -1;
    }

    std::lock_guard<std::mutex> lock(m_JoinMutex_);
    if (m_Joinable_) {
        return EBUSY;
    }

    m_CpuCore_ = cpuCore;
    m_Callback_ = std::move(callback);

    pthread_attr_t attr;
    pthread_attr_t* attrPtr = nullptr;
    const int resolvedPolicy = resolveSchedulingPolicy(schedulingPolicy);
    sched_param schedParam{};
    if (realtime) {
        attrPtr = &attr;
        int result = pthread_attr_init(attrPtr);
        if (result != 0) {
            m_Callback_ = nullptr;
            return result;
        }

        int resolvedPriority = 0;
        result = pthread_attr_setinheritsched(attrPtr, PTHREAD_EXPLICIT_SCHED);
        if (result == 0) {
            result = pthread_attr_setschedpolicy(attrPtr, resolvedPolicy);
        }
        if (result == 0) {
            result = resolveRealtimePriority(resolvedPolicy, realtimePriority, resolvedPriority);
        }
        if (result == 0) {
            schedParam.sched_priority = resolvedPriority;
            result = pthread_attr_setschedparam(attrPtr, &schedParam);
        }
        if (result != 0) {
            pthread_attr_destroy(attrPtr);
            m_Callback_ = nullptr;
            return result;
        }
    }

    m_IsRunning_.store(true);
    int createResult = pthread_create(&m_ThreadHandle_, attrPtr, &Thread::threadEntry, this);
    if (attrPtr) {
        pthread_attr_destroy(attrPtr);
    }

    // Unprivileged processes may not get SCHED_FIFO; fall back to normal scheduling.
    if (createResult == EPERM && realtime) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Realtime scheduling not permitted, using default policy\n");
        createResult = pthread_create(&m_ThreadHandle_, nullptr, &Thread::threadEntry, this);
    }

    if (createResult != 0) {
        m_IsRunning_.store(false);
        m_Callback_ = nullptr;
        return createResult;
    }

    if (m_CpuCore_ >= 0) {
        const int affinityResult = setThreadAffinity(m_ThreadHandle_, m_CpuCore_);
        if (affinityResult != 0) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Failed to pin thread to core %d (%d)\n", m_CpuCore_, affinityResult);
        }
    }
    m_Joinable_ = true;
    return 0;
}

int Thread::join() {
    // A second caller waits here until the first join completes, then sees nothing to join
    std::lock_guard<std::mutex> lock(m_JoinMutex_);
    if (!m_Joinable_) {
        return 0;
    }

    const int result = pthread_join(m_ThreadHandle_, nullptr);
    if (result == 0) {
        m_Joinable_ = false;
        m_Callback_ = nullptr;
        m_CpuCore_ = -1;
    }
    return result;
}


int Thread::setThreadAffinity(pthread_t threadHandle, int cpuCore) {
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(cpuCore, &cpuset);
    return pthread_setaffinity_np(threadHandle, sizeof(cpu_set_t), &cpuset);
}

void* Thread::threadEntry(void* arg) {
    auto* self = static_cast<Thread*>(arg);
    if (!self || !self->m_Callback_) {
        return nullptr;
    }
    self->m_Callback_();
    self->m_IsRunning_.store(false);
    return nullptr;
}
}
