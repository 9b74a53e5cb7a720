#pragma once

#include <cstdint>
#include <functional>


namespace Viewer {

/**
 * @brief Counts rendered frames per wall-clock second.
 *
 * fps() reports the count of the last completed second, not a moving average.
 */
class FpsCounter {
public:
    using Clock = std::function<int64_t()>;  // Milliseconds

    explicit FpsCounter(Clock clock = Clock());

    void countFrame();

    int fps() const {
        return m_Fps;
    }

    static int64_t systemMillis();

private:
    Clock m_Clock;
    int64_t m_Second;
    int m_Current = 0;
    int m_Fps = 0;
};

}  // namespace Viewer
