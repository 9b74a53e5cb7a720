#include "app/stream/BroadcastChannel.hpp"

#include <algorithm>

#include "utils/logger.hpp"


namespace Stream {

Subscription::Subscription(std::string channelName) : m_ChannelName(std::move(channelName)) {
}


Subscription::~Subscription() {
    close();
}


/**
 * @brief Enqueue a message, replacing any buffered frame reference.
 *
 * @param msg Message published on the channel
 */
void Subscription::deliver(const Msg::Message& msg) {
    bool wasEmpty = false;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_Closed.load()) {
            return;
        }

        if (Msg::isCoalescable(msg)) {
            auto stale = std::find_if(m_Mailbox.begin(), m_Mailbox.end(),
                                      [](const Msg::Message& queued) { return Msg::isCoalescable(queued); });
            if (stale != m_Mailbox.end()) {
                m_Mailbox.erase(stale);
                m_Coalesced++;
            }
        }

        wasEmpty = m_Mailbox.empty();
        m_Mailbox.push_back(msg);
        m_Delivered++;
    }

    if (wasEmpty) {
        onPending();
    }
}


std::optional<Msg::Message> Subscription::take() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_Mailbox.empty()) {
        return std::nullopt;
    }
    Msg::Message msg = std::move(m_Mailbox.front());
    m_Mailbox.pop_front();
    return msg;
}


std::size_t Subscription::pending() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Mailbox.size();
}


void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Closed.store(true);
        m_Mailbox.clear();
    }
    m_Connection.disconnect();
}


void Subscription::bindConnection(boost::signals2::connection connection) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Connection = connection;
}


BroadcastChannel::BroadcastChannel(std::string name) : m_Name(std::move(name)) {
}


BroadcastChannel::~BroadcastChannel() {
    shutdown();
}


/**
 * @brief Attach a new subscriber.
 *
 * The slot tracks the subscription so a subscriber destroyed without detaching
 * is dropped from the signal automatically.
 *
 * @return std::shared_ptr<Subscription> Handle used to drain and detach
 */
std::shared_ptr<Subscription> BroadcastChannel::attach() {
    auto subscription = std::make_shared<Subscription>(m_Name);
    Subscription* raw = subscription.get();

    MessageSignal::slot_type slot([raw](const Msg::Message& msg) { raw->deliver(msg); });
    slot.track_foreign(std::weak_ptr<Subscription>(subscription));

    subscription->bindConnection(m_Signal.connect(slot));

    Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Subscriber attached to \"%s\" (%zu attached)\n",
                                 m_Name.c_str(), subscriberCount());
    return subscription;
}


void BroadcastChannel::detach(const std::shared_ptr<Subscription>& subscription) {
    if (!subscription) {
        return;
    }
    subscription->close();
    Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Subscriber detached from \"%s\" (%zu attached)\n",
                                 m_Name.c_str(), subscriberCount());
}


bool BroadcastChannel::publish(const Msg::Message& msg) {
    if (!m_PublicationOpen.load()) {
        return false;
    }
    m_Signal(msg);
    m_Published++;
    return true;
}


void BroadcastChannel::shutdown() {
    m_PublicationOpen.store(false);
    m_Signal.disconnect_all_slots();
}

}  // namespace Stream
