#pragma once

#include <memory>

#include "Modules/ModuleBase.hpp"
#include "app/camera/RateScheduler.hpp"
#include "utils/Config.hpp"


namespace Modules {

/**
 * @brief Owns the frame source and drives it through the rate scheduler.
 */
class CameraModule : public Base {
public:
    CameraModule(int moduleID, std::string name, const Config::CameraConfig& config, Stream::ChannelRegistry& registry);

    /**
     * @brief Construct around an already built source.
     */
    CameraModule(int moduleID, std::string name, const Config::CameraConfig& config, Stream::ChannelRegistry& registry,
                 std::unique_ptr<Camera::IFrameSource> source);
    ~CameraModule();

    int init(void) override;
    int stop(void) override;

    const Camera::RateScheduler* scheduler() const {
        return m_Scheduler.get();
    }

protected:
    void mainProc() override;
    void OnTimer(void) override;

    static constexpr int StatsPeriodMs = 5000;

    Config::CameraConfig m_Config;
    Stream::ChannelRegistry& m_Registry;
    std::unique_ptr<Camera::IFrameSource> m_Source;
    std::unique_ptr<Camera::RateScheduler> m_Scheduler;
};

}  // namespace Modules
