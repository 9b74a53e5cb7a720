#include "viewer/FpsCounter.hpp"

#include <chrono>


namespace Viewer {

FpsCounter::FpsCounter(Clock clock) : m_Clock(clock ? std::move(clock) : Clock(&FpsCounter::systemMillis)) {
    m_Second = m_Clock() / 1000;
}


/**
 * @brief Count one frame, rolling over to a new second when needed.
 *
 * A second in which nothing was rendered reports 0.
 */
void FpsCounter::countFrame() {
    const int64_t second = m_Clock() / 1000;
    if (second == m_Second) {
        m_Current++;
        return;
    }

    m_Fps = (second == m_Second + 1) ? m_Current : 0;
    m_Current = 1;
    m_Second = second;
}


int64_t FpsCounter::systemMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace Viewer
