#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "app/camera/FrameSource.hpp"
#include "app/stream/ChannelRegistry.hpp"
#include "lib/Thread.hpp"


namespace Camera {

/**
 * @brief Drives a frame source at a fixed rate and publishes each frame reference.
 *
 * Ticks fall on a fixed grid measured from the moment the worker starts. A pull
 * that overruns its period is published as soon as it completes and the worker
 * resumes at the next grid tick still in the future; missed ticks are dropped.
 */
class RateScheduler {
public:
    enum class State : uint8_t {
        Idle,
        Running,
        Stopped,
        Exhausted,
        Failed
    };

    /**
     * @brief Construct the scheduler.
     *
     * @param source Frame source, owned by the scheduler
     * @param rate Target frames per second
     * @param registry Channel registry to publish into
     * @param channel Channel receiving the frame references
     * @throws Errors::ConfigurationError if rate is not positive or source is null
     */
    RateScheduler(std::unique_ptr<IFrameSource> source,
                  int rate,
                  Stream::ChannelRegistry& registry,
                  std::string channel = Stream::ChannelRegistry::CameraChannel);
    ~RateScheduler();

    RateScheduler(const RateScheduler&) = delete;
    RateScheduler& operator=(const RateScheduler&) = delete;

    /**
     * @brief Open the channel for publication and spawn the worker (idempotent).
     *
     * @param cpuCore Core to pin the worker to, -1 for none
     * @param realtime Request SCHED_FIFO for the worker
     * @return int 0 on success, -1 if the worker could not be spawned
     */
    int start(int cpuCore = -1, bool realtime = false);

    /**
     * @brief Interrupt the tick wait and join the worker (idempotent).
     *
     * May be called from several threads at once; only one of them joins.
     * Attached subscribers are left untouched.
     */
    void stop();

    State state() const {
        return m_State.load();
    }

    int rate() const {
        return m_Rate;
    }

    std::chrono::nanoseconds period() const {
        return m_Period;
    }

    uint64_t publishedCount() const {
        return m_Published.load();
    }

    uint64_t overrunCount() const {
        return m_Overruns.load();
    }

    static const char* toString(State state);

private:
    using Clock = std::chrono::steady_clock;

    void run();

    /**
     * @brief Block until deadline or until stop() is called.
     *
     * @return true if the deadline was reached, false if stop was requested
     */
    bool waitUntil(Clock::time_point deadline);

    std::unique_ptr<IFrameSource> m_Source;
    const int m_Rate;
    const std::chrono::nanoseconds m_Period;
    Stream::ChannelRegistry& m_Registry;
    const std::string m_Channel;

    Lib::Thread m_Thread;
    std::mutex m_LifecycleMutex;  // Serializes start() and stop() callers
    std::mutex m_Mutex;
    std::condition_variable m_Cv;
    bool m_StopRequested = false;

    std::atomic<State> m_State{State::Idle};
    std::atomic<uint64_t> m_Published{0};
    std::atomic<uint64_t> m_Overruns{0};
};

}  // namespace Camera
