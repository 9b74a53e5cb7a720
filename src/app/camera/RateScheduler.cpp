#include "app/camera/RateScheduler.hpp"

#include "utils/Errors.hpp"
#include "utils/logger.hpp"


namespace Camera {

namespace {
std::chrono::nanoseconds periodFor(int rate) {
    if (rate <= 0) {
        throw Errors::ConfigurationError("Framerate must be specified as a positive integer: " + std::to_string(rate));
    }
    return std::chrono::nanoseconds(1000000000LL / rate);
}
}  // namespace


RateScheduler::RateScheduler(std::unique_ptr<IFrameSource> source,
                             int rate,
                             Stream::ChannelRegistry& registry,
                             std::string channel)
    : m_Source(std::move(source)),
      m_Rate(rate),
      m_Period(periodFor(rate)),
      m_Registry(registry),
      m_Channel(std::move(channel)) {

    if (!m_Source) {
        throw Errors::ConfigurationError("Rate scheduler requires a frame source");
    }
}


RateScheduler::~RateScheduler() {
    stop();
}


int RateScheduler::start(int cpuCore, bool realtime) {
    std::lock_guard<std::mutex> lifecycle(m_LifecycleMutex);
    if (m_State.load() == State::Running) {
        return 0;
    }

    // Reap a worker that ended on its own (exhausted or failed)
    m_Thread.join();

    Stream::BroadcastChannel* channel = m_Registry.channel(m_Channel);
    if (!channel) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Channel \"%s\" is unavailable\n", m_Channel.c_str());
        return -1;
    }
    channel->openPublication();

    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_StopRequested = false;
    }
    m_State.store(State::Running);

    const int result = m_Thread.start([this]() { run(); }, cpuCore, realtime);
    if (result != 0) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Failed to spawn scheduler thread (%d)\n", result);
        m_State.store(State::Failed);
        return -1;
    }

    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Scheduler started: %s at %d fps\n",
                                 m_Source->describe().c_str(), m_Rate);
    return 0;
}


void RateScheduler::stop() {
    std::lock_guard<std::mutex> lifecycle(m_LifecycleMutex);
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_StopRequested = true;
    }
    m_Cv.notify_all();

    if (m_Thread.joinable()) {
        m_Thread.join();
        Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Scheduler stopped (%s, %llu published, %llu overruns)\n",
                                     toString(m_State.load()),
                                     static_cast<unsigned long long>(m_Published.load()),
                                     static_cast<unsigned long long>(m_Overruns.load()));
    }
}


const char* RateScheduler::toString(State state) {
    switch (state) {
        case State::Idle:      return "idle";
        case State::Running:   return "running";
        case State::Stopped:   return "stopped";
        case State::Exhausted: return "exhausted";
        case State::Failed:    return "failed";
    }
    return "unknown";
}


bool RateScheduler::waitUntil(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(m_Mutex);
    return !m_Cv.wait_until(lock, deadline, [this]() { return m_StopRequested; });
}


/**
 * @brief Worker loop: wait for the tick, pull a frame, publish its reference.
 */
void RateScheduler::run() {
    const Clock::time_point origin = Clock::now();
    int64_t tick = 0;

    while (waitUntil(origin + m_Period * tick)) {
        std::optional<Frame> frame;
        try {
            frame = m_Source->next();
        } catch (const Errors::SourceUnavailable& e) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Frame source unavailable: %s\n", e.what());
            m_State.store(State::Failed);
            return;
        } catch (const std::exception& e) {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Frame source error: %s\n", e.what());
            m_State.store(State::Failed);
            return;
        }

        if (!frame) {
            Stream::BroadcastChannel* channel = m_Registry.find(m_Channel);
            if (channel) {
                channel->closePublication();
            }
            Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Frame source exhausted after %llu frames\n",
                                         static_cast<unsigned long long>(m_Published.load()));
            m_State.store(State::Exhausted);
            return;
        }

        if (m_Registry.publish(m_Channel, Msg::ImagePath{frame->reference})) {
            m_Published++;
        } else {
            Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Dropped frame %llu, channel closed\n",
                                         static_cast<unsigned long long>(frame->sequence));
        }

        // First grid tick strictly after now
        const int64_t due = static_cast<int64_t>((Clock::now() - origin) / m_Period) + 1;
        if (due > tick + 1) {
            m_Overruns++;
            Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Frame %llu overran by %lld ticks\n",
                                         static_cast<unsigned long long>(frame->sequence),
                                         static_cast<long long>(due - tick - 1));
            tick = due;
        } else {
            tick++;
        }
    }

    m_State.store(State::Stopped);
}

}  // namespace Camera
