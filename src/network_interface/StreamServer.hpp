#ifndef STREAM_SERVER_HPP
#define STREAM_SERVER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio.hpp>
#include <boost/signals2.hpp>

#include "network_interface/ViewerSession.hpp"


namespace Network {

/**
 * @brief TCP acceptor creating one ViewerSession per connection.
 */
class StreamServer {
public:
    /**
     * @brief Bind and listen.
     *
     * @param io_context Context the acceptor and sessions run on
     * @param registry Channels sessions attach to
     * @param address Bind address
     * @param port Bind port, 0 picks an ephemeral port
     * @throws std::runtime_error if the address cannot be bound
     */
    StreamServer(boost::asio::io_context& io_context,
                 Stream::ChannelRegistry& registry,
                 const std::string& address,
                 unsigned short port);
    ~StreamServer();

    StreamServer(const StreamServer&) = delete;
    StreamServer& operator=(const StreamServer&) = delete;

    /**
     * @brief Start accepting connections.
     */
    void start();

    /**
     * @brief Stop accepting and close every session. Safe to call from any thread.
     */
    void stop();

    /**
     * @brief Port the acceptor is bound to.
     */
    unsigned short port() const {
        return m_Port;
    }

    std::size_t sessionCount() const;

    uint64_t acceptedCount() const {
        return m_Accepted.load();
    }

    uint64_t acceptErrorCount() const {
        return m_AcceptErrors.load();
    }

    static constexpr std::chrono::milliseconds AcceptRetryDelay{100};

private:
    struct SessionEntry {
        std::shared_ptr<ViewerSession> session;
        boost::signals2::scoped_connection closedConnection;
    };

    void accept_();
    void retryAccept_();
    void removeSession_(uint64_t id);

    boost::asio::io_context& m_IoContext;
    Stream::ChannelRegistry& m_Registry;
    tcp::acceptor m_Acceptor;
    boost::asio::steady_timer m_AcceptRetryTimer;  // Shares the acceptor's strand
    unsigned short m_Port = 0;

    mutable std::mutex m_Mutex;
    std::map<uint64_t, SessionEntry> m_Sessions;
    uint64_t m_NextId = 1;

    std::atomic<bool> m_Running{false};
    std::atomic<uint64_t> m_Accepted{0};
    std::atomic<uint64_t> m_AcceptErrors{0};
};

}  // namespace Network

#endif
