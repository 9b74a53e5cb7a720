#ifndef VIEWER_CLIENT_HPP
#define VIEWER_CLIENT_HPP

#include <atomic>
#include <cstdint>
#include <string>

#include <boost/asio.hpp>
#include <boost/signals2.hpp>

#include "app/messages/ControlMessages.hpp"


namespace Network {

/**
 * @brief Client end of one route: connects, names the route, then exchanges JSON lines.
 *
 * Received messages are emitted on onMessage from the io_context the client was built on.
 */
class ViewerClient {
public:
    explicit ViewerClient(boost::asio::io_context& io_context);
    ~ViewerClient();

    ViewerClient(const ViewerClient&) = delete;
    ViewerClient& operator=(const ViewerClient&) = delete;

    /**
     * @brief Connect and send the route line. Blocks until connected.
     *
     * @throws Errors::TransportFailure if the host cannot be resolved or reached
     */
    void connect(const std::string& host, unsigned short port, const std::string& route);

    /**
     * @brief Start the asynchronous read loop.
     */
    void start();

    /**
     * @brief Send one message synchronously.
     *
     * @throws Errors::TransportFailure on write failure
     */
    void send(const Msg::Message& msg);

    void close();

    bool isConnected() const {
        return m_Connected.load();
    }

    uint64_t receivedCount() const {
        return m_Received.load();
    }

    boost::signals2::signal<void(const Msg::Message&)> onMessage;
    boost::signals2::signal<void(const std::string&)> onDisconnected;

private:
    void readLine_();

    boost::asio::io_context& m_IoContext;
    boost::asio::ip::tcp::socket m_Socket;
    boost::asio::streambuf m_ReadBuffer;
    std::string m_Route;

    std::atomic<bool> m_Connected{false};
    std::atomic<uint64_t> m_Received{0};
};

}  // namespace Network

#endif
