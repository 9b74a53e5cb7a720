#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/signals2.hpp>

#include "app/messages/ControlMessages.hpp"
#include "viewer/Canvas.hpp"


namespace Viewer {

/**
 * @brief Shows the latest shutter event for a short time, then reverts to idle.
 *
 * A new event restarts the hold timer; the last event wins.
 */
class ShotNotifier {
public:
    static constexpr const char* IdleText = "Shot: all clear";

    ShotNotifier(boost::asio::io_context& io_context,
                 ICanvas& canvas,
                 std::chrono::milliseconds hold = std::chrono::milliseconds(500));

    void start(boost::signals2::signal<void(const Msg::Message&)>& source);
    void stop();

    void onShoot(const Msg::Shoot& shot);

    const std::string& text() const {
        return m_Text;
    }

private:
    void show_(const std::string& text);

    boost::asio::steady_timer m_Timer;
    ICanvas& m_Canvas;
    const std::chrono::milliseconds m_Hold;
    std::string m_Text;
    uint64_t m_Generation = 0;  // Bumped per shot; a hold handler only reverts its own shot
    boost::signals2::scoped_connection m_Connection;
};


/**
 * @brief Tracks the camera mode from Mode messages and labels it.
 *
 * The mode is unknown until the first Mode message arrives.
 */
class ModeTracker {
public:
    explicit ModeTracker(ICanvas& canvas);

    void start(boost::signals2::signal<void(const Msg::Message&)>& source);
    void stop();

    void onMode(const Msg::Mode& mode);

    std::optional<Msg::CameraMode> current() const {
        return m_Current;
    }

private:
    ICanvas& m_Canvas;
    std::optional<Msg::CameraMode> m_Current;
    boost::signals2::scoped_connection m_Connection;
};

}  // namespace Viewer
