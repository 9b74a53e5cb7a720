#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "app/stream/BroadcastChannel.hpp"


namespace Stream {

/**
 * @brief Owns the named channels of one process.
 *
 * Created once in main and handed to the modules that publish or subscribe.
 */
class ChannelRegistry {
public:
    static constexpr const char* CameraChannel = "camera";
    static constexpr const char* ShootChannel  = "shoot";
    static constexpr const char* ModeChannel   = "mode";

    ChannelRegistry();
    ~ChannelRegistry();

    ChannelRegistry(const ChannelRegistry&) = delete;
    ChannelRegistry& operator=(const ChannelRegistry&) = delete;

    /**
     * @brief Get a channel, creating it on first use.
     *
     * @return BroadcastChannel* nullptr once the registry was shut down
     */
    BroadcastChannel* channel(const std::string& name);

    /**
     * @brief Get an existing channel without creating it.
     */
    BroadcastChannel* find(const std::string& name);

    /**
     * @brief Publish on the named channel.
     *
     * @return true if the message was handed to the channel's subscribers
     */
    bool publish(const std::string& name, const Msg::Message& msg);

    /**
     * @brief Attach to the named channel.
     *
     * @return std::shared_ptr<Subscription> nullptr once the registry was shut down
     */
    std::shared_ptr<Subscription> attach(const std::string& name);

    void detach(const std::shared_ptr<Subscription>& subscription);

    std::vector<std::string> names() const;

    /**
     * @brief Close every channel and disconnect all subscribers.
     */
    void shutdown();

    bool isShutdown() const;

private:
    mutable std::mutex m_Mutex;
    std::map<std::string, std::unique_ptr<BroadcastChannel>> m_Channels;
    bool m_Shutdown = false;
};

}  // namespace Stream
