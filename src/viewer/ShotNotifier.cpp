#include "viewer/ShotNotifier.hpp"

#include "utils/logger.hpp"


namespace Viewer {

ShotNotifier::ShotNotifier(boost::asio::io_context& io_context,
                           ICanvas& canvas,
                           std::chrono::milliseconds hold)
    : m_Timer(io_context), m_Canvas(canvas), m_Hold(hold) {
    show_(IdleText);
}


void ShotNotifier::start(boost::signals2::signal<void(const Msg::Message&)>& source) {
    m_Connection = source.connect([this](const Msg::Message& msg) {
        if (const auto* shot = std::get_if<Msg::Shoot>(&msg)) {
            onShoot(*shot);
        }
    });
}


void ShotNotifier::stop() {
    m_Connection.disconnect();
    m_Generation++;
    m_Timer.cancel();
}


/**
 * @brief Show the shot and (re)arm the revert timer.
 */
void ShotNotifier::onShoot(const Msg::Shoot& shot) {
    show_(std::string("Shot: ") + Msg::toString(shot.type));

    // Rearming cancels a pending wait, but a wait that already expired still
    // completes with success; the generation tells it apart
    const uint64_t generation = ++m_Generation;
    m_Timer.expires_after(m_Hold);
    m_Timer.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec || generation != m_Generation) {
            return;
        }
        show_(IdleText);
    });
}


void ShotNotifier::show_(const std::string& text) {
    m_Text = text;
    m_Canvas.setLabel(Label::Shot, m_Text);
}


ModeTracker::ModeTracker(ICanvas& canvas) : m_Canvas(canvas) {
    m_Canvas.setLabel(Label::Mode, "Mode: unknown");
}


void ModeTracker::start(boost::signals2::signal<void(const Msg::Message&)>& source) {
    m_Connection = source.connect([this](const Msg::Message& msg) {
        if (const auto* mode = std::get_if<Msg::Mode>(&msg)) {
            onMode(*mode);
        }
    });
}


void ModeTracker::stop() {
    m_Connection.disconnect();
}


void ModeTracker::onMode(const Msg::Mode& mode) {
    if (m_Current != mode.type) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Camera mode changed to %s\n", Msg::toString(mode.type));
    }
    m_Current = mode.type;
    m_Canvas.setLabel(Label::Mode, std::string("Mode: ") + Msg::toString(mode.type));
}

}  // namespace Viewer
