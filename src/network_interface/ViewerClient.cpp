#include "network_interface/ViewerClient.hpp"

#include <istream>

#include "utils/Errors.hpp"
#include "utils/logger.hpp"


namespace Network {

ViewerClient::ViewerClient(boost::asio::io_context& io_context)
    : m_IoContext(io_context), m_Socket(io_context), m_ReadBuffer(64 * 1024) {
}


ViewerClient::~ViewerClient() {
    close();
}


void ViewerClient::connect(const std::string& host, unsigned short port, const std::string& route) {
    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(m_IoContext);
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw Errors::TransportFailure("Unable to resolve " + host + ": " + ec.message());
    }

    boost::asio::connect(m_Socket, endpoints, ec);
    if (ec) {
        throw Errors::TransportFailure("Unable to connect to " + host + ":" + std::to_string(port) + ": " + ec.message());
    }

    const std::string line = route + "\n";
    boost::asio::write(m_Socket, boost::asio::buffer(line), ec);
    if (ec) {
        throw Errors::TransportFailure("Unable to send route " + route + ": " + ec.message());
    }

    m_Route = route;
    m_Connected.store(true);
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Connected to %s:%u%s\n", host.c_str(), port, route.c_str());
}


void ViewerClient::start() {
    readLine_();
}


void ViewerClient::send(const Msg::Message& msg) {
    const std::string line = Msg::encode(msg) + "\n";
    boost::system::error_code ec;
    boost::asio::write(m_Socket, boost::asio::buffer(line), ec);
    if (ec) {
        throw Errors::TransportFailure("Send failed: " + ec.message());
    }
}


void ViewerClient::close() {
    if (!m_Connected.exchange(false)) {
        return;
    }
    boost::system::error_code ec;
    m_Socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    m_Socket.close(ec);
}


/**
 * @brief Read one JSON line, decode it and emit it.
 *
 * Lines that do not decode are logged and skipped.
 */
void ViewerClient::readLine_() {
    boost::asio::async_read_until(m_Socket, m_ReadBuffer, '\n',
        [this](const boost::system::error_code& ec, std::size_t bytes) {
            if (ec) {
                const std::string reason = (ec == boost::asio::error::eof) ? "server closed the connection" : ec.message();
                if (m_Connected.load()) {
                    Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Connection %s lost: %s\n", m_Route.c_str(), reason.c_str());
                }
                close();
                onDisconnected(reason);
                return;
            }

            std::string line(bytes, '\0');
            std::istream in(&m_ReadBuffer);
            in.read(&line[0], static_cast<std::streamsize>(bytes));
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
                line.pop_back();
            }

            const std::optional<Msg::Message> msg = Msg::decode(line);
            if (msg) {
                m_Received++;
                onMessage(*msg);
            } else {
                Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Ignoring undecodable line on %s: %s\n", m_Route.c_str(), line.c_str());
            }

            readLine_();
        });
}

}  // namespace Network
