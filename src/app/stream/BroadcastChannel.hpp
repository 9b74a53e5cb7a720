#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/signals2.hpp>

#include "app/messages/ControlMessages.hpp"


namespace Stream {

/**
 * @brief Per-subscriber mailbox attached to one channel.
 *
 * Frame references are coalesced so at most one undelivered ImagePath is held;
 * every other message kind is queued and delivered exactly once.
 */
class Subscription {
public:
    explicit Subscription(std::string channelName);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    /**
     * @brief Place a message in the mailbox. Called from the publishing thread.
     */
    void deliver(const Msg::Message& msg);

    /**
     * @brief Remove the oldest buffered message.
     */
    std::optional<Msg::Message> take();

    std::size_t pending() const;

    /**
     * @brief Disconnect from the channel and release buffered messages.
     *
     * Deliveries racing with close are dropped.
     */
    void close();

    bool isClosed() const {
        return m_Closed.load();
    }

    const std::string& channelName() const {
        return m_ChannelName;
    }

    uint64_t deliveredCount() const {
        return m_Delivered.load();
    }

    uint64_t coalescedCount() const {
        return m_Coalesced.load();
    }

    /**
     * @brief Fired when the mailbox goes from empty to non-empty.
     */
    boost::signals2::signal<void()> onPending;

private:
    friend class BroadcastChannel;

    void bindConnection(boost::signals2::connection connection);

    std::string m_ChannelName;

    mutable std::mutex m_Mutex;
    std::deque<Msg::Message> m_Mailbox;
    boost::signals2::scoped_connection m_Connection;

    std::atomic<bool> m_Closed{false};
    std::atomic<uint64_t> m_Delivered{0};
    std::atomic<uint64_t> m_Coalesced{0};
};


/**
 * @brief Named fan-out point. Publishing never waits on subscribers.
 */
class BroadcastChannel {
public:
    using MessageSignal = boost::signals2::signal<void(const Msg::Message&)>;

    explicit BroadcastChannel(std::string name);
    ~BroadcastChannel();

    BroadcastChannel(const BroadcastChannel&) = delete;
    BroadcastChannel& operator=(const BroadcastChannel&) = delete;

    /**
     * @brief Create a subscription receiving every message published from now on.
     */
    std::shared_ptr<Subscription> attach();

    void detach(const std::shared_ptr<Subscription>& subscription);

    /**
     * @brief Deliver msg to every currently attached subscription.
     *
     * @return true if delivered, false if publication is closed
     */
    bool publish(const Msg::Message& msg);

    void openPublication() {
        m_PublicationOpen.store(true);
    }

    void closePublication() {
        m_PublicationOpen.store(false);
    }

    bool isPublicationOpen() const {
        return m_PublicationOpen.load();
    }

    /**
     * @brief Close publication and disconnect every subscriber.
     */
    void shutdown();

    std::size_t subscriberCount() const {
        return m_Signal.num_slots();
    }

    uint64_t publishedCount() const {
        return m_Published.load();
    }

    const std::string& name() const {
        return m_Name;
    }

private:
    std::string m_Name;
    MessageSignal m_Signal;
    std::atomic<bool> m_PublicationOpen{true};
    std::atomic<uint64_t> m_Published{0};
};

}  // namespace Stream
