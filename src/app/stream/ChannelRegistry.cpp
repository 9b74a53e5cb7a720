#include "app/stream/ChannelRegistry.hpp"

#include "utils/logger.hpp"


namespace Stream {

ChannelRegistry::ChannelRegistry() {
    for (const char* name : {CameraChannel, ShootChannel, ModeChannel}) {
        m_Channels.emplace(name, std::make_unique<BroadcastChannel>(name));
    }
}


ChannelRegistry::~ChannelRegistry() {
    shutdown();
}


BroadcastChannel* ChannelRegistry::channel(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_Shutdown) {
        return nullptr;
    }

    auto it = m_Channels.find(name);
    if (it == m_Channels.end()) {
        it = m_Channels.emplace(name, std::make_unique<BroadcastChannel>(name)).first;
        Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Created channel \"%s\"\n", name.c_str());
    }
    return it->second.get();
}


BroadcastChannel* ChannelRegistry::find(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    auto it = m_Channels.find(name);
    return (it == m_Channels.end()) ? nullptr : it->second.get();
}


bool ChannelRegistry::publish(const std::string& name, const Msg::Message& msg) {
    BroadcastChannel* target = channel(name);
    if (!target) {
        return false;
    }
    return target->publish(msg);
}


std::shared_ptr<Subscription> ChannelRegistry::attach(const std::string& name) {
    BroadcastChannel* target = channel(name);
    if (!target) {
        return nullptr;
    }
    return target->attach();
}


void ChannelRegistry::detach(const std::shared_ptr<Subscription>& subscription) {
    if (!subscription) {
        return;
    }

    BroadcastChannel* target = find(subscription->channelName());
    if (target) {
        target->detach(subscription);
    } else {
        subscription->close();
    }
}


std::vector<std::string> ChannelRegistry::names() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    std::vector<std::string> out;
    out.reserve(m_Channels.size());
    for (const auto& entry : m_Channels) {
        out.push_back(entry.first);
    }
    return out;
}


/**
 * @brief Tear down every channel.
 *
 * Channel objects stay allocated until the registry is destroyed so pointers
 * handed out earlier remain valid; they just accept nothing further.
 */
void ChannelRegistry::shutdown() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_Shutdown) {
        return;
    }
    m_Shutdown = true;

    for (auto& entry : m_Channels) {
        entry.second->shutdown();
    }
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Channel registry shut down (%zu channels)\n", m_Channels.size());
}


bool ChannelRegistry::isShutdown() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Shutdown;
}

}  // namespace Stream
