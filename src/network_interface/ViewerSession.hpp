#ifndef VIEWER_SESSION_HPP
#define VIEWER_SESSION_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/signals2.hpp>

#include "app/stream/ChannelRegistry.hpp"


namespace Network {

using boost::asio::ip::tcp;

/**
 * @brief Fixed route table entry.
 */
struct Route {
    std::string path;
    std::vector<std::string> channels;  // Channels forwarded to the client
    bool control = false;               // Client may publish Shoot/Mode messages
};

/**
 * @brief Map the first line sent by a client to its route.
 *
 * Accepts a bare path ("/ws/camera") or a request line ("GET /ws/camera HTTP/1.1").
 *
 * @return std::optional<Route> std::nullopt for unknown routes
 */
std::optional<Route> resolveRoute(const std::string& line);


/**
 * @brief One connected viewer.
 *
 * All socket work and mailbox draining happens on the session's strand, so at
 * most one write is in flight and frames coalesce in the mailbox meanwhile.
 */
class ViewerSession : public std::enable_shared_from_this<ViewerSession> {
public:
    static constexpr std::size_t MaxLineLength = 64 * 1024;

    ViewerSession(tcp::socket socket, Stream::ChannelRegistry& registry, uint64_t id);
    ~ViewerSession();

    ViewerSession(const ViewerSession&) = delete;
    ViewerSession& operator=(const ViewerSession&) = delete;

    /**
     * @brief Begin reading the route line.
     */
    void start();

    /**
     * @brief Detach and close the connection. Safe to call from any thread.
     */
    void close();

    uint64_t id() const {
        return m_Id;
    }

    bool isAlive() const {
        return !m_Closed.load();
    }

    uint64_t sentCount() const {
        return m_Sent.load();
    }

    /**
     * @brief Fired once, on the session strand, after the session detached and closed.
     */
    boost::signals2::signal<void(uint64_t)> onClosed;

private:
    void readLine_();
    void handleLine_(const std::string& line);
    void handleRoute_(const std::string& line);
    void handleControl_(const std::string& line);
    void attach_(const Route& route);
    void drain_();
    void writeLine_(std::string line, bool closeAfter);
    void shutdown_(const std::string& reason);

    tcp::socket m_Socket;
    Stream::ChannelRegistry& m_Registry;
    const uint64_t m_Id;
    std::string m_Peer;

    boost::asio::streambuf m_ReadBuffer;
    std::string m_OutLine;
    bool m_Writing = false;

    std::optional<Route> m_Route;
    std::vector<std::shared_ptr<Stream::Subscription>> m_Subscriptions;
    std::size_t m_NextSubscription = 0;

    std::atomic<bool> m_Closed{false};
    std::atomic<uint64_t> m_Sent{0};
};

}  // namespace Network

#endif
