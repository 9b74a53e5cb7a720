#include "network_interface/StreamServer.hpp"

#include <stdexcept>
#include <vector>

#include "utils/logger.hpp"


namespace Network {

StreamServer::StreamServer(boost::asio::io_context& io_context,
                           Stream::ChannelRegistry& registry,
                           const std::string& address,
                           unsigned short port)
    : m_IoContext(io_context),
      m_Registry(registry),
      m_Acceptor(boost::asio::make_strand(io_context)),
      m_AcceptRetryTimer(m_Acceptor.get_executor()) {

    Logger* logger = Logger::getLoggerInst();

    boost::system::error_code ec;
    const boost::asio::ip::address bindAddress = boost::asio::ip::make_address(address, ec);
    if (ec) {
        logger->log(Logger::LOG_LVL_ERROR, "Invalid bind address %s: %s\n", address.c_str(), ec.message().c_str());
        throw std::runtime_error("Invalid bind address: " + address);
    }

    const tcp::endpoint endpoint(bindAddress, port);
    m_Acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
        m_Acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        m_Acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        m_Acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        logger->log(Logger::LOG_LVL_ERROR, "Failed to open TCP listener %s:%u: %s\n", address.c_str(), port, ec.message().c_str());
        throw std::runtime_error("Failed to open TCP listener: " + ec.message());
    }

    m_Port = m_Acceptor.local_endpoint().port();
    logger->log(Logger::LOG_LVL_INFO, "Listening on %s:%u\n", address.c_str(), m_Port);
}


StreamServer::~StreamServer() {
    stop();

    // The io threads are gone by now; sessions may outlive the server while their handlers drain
    boost::system::error_code ec;
    m_Acceptor.close(ec);
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Sessions.clear();
}


void StreamServer::start() {
    if (m_Running.exchange(true)) {
        return;
    }
    boost::asio::dispatch(m_Acceptor.get_executor(), [this]() { accept_(); });
}


void StreamServer::stop() {
    if (!m_Running.exchange(false)) {
        return;
    }

    // The acceptor lives on its own strand; close it there
    boost::asio::dispatch(m_Acceptor.get_executor(), [this]() {
        boost::system::error_code ec;
        m_AcceptRetryTimer.cancel();
        m_Acceptor.close(ec);
    });

    std::vector<std::shared_ptr<ViewerSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        for (auto& entry : m_Sessions) {
            sessions.push_back(entry.second.session);
        }
    }
    for (auto& session : sessions) {
        session->close();
    }

    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Stream server stopped, closing %zu sessions\n", sessions.size());
}


std::size_t StreamServer::sessionCount() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Sessions.size();
}


/**
 * @brief Accept the next connection onto its own strand.
 */
void StreamServer::accept_() {
    m_Acceptor.async_accept(boost::asio::make_strand(m_IoContext),
        [this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) {
                if (ec == boost::asio::error::operation_aborted) {
                    return;
                }
                m_AcceptErrors++;
                Logger::getLoggerInst()->log(Logger::LOG_LVL_ERROR, "Accept failed: %s, retrying in %lld ms\n",
                                             ec.message().c_str(), static_cast<long long>(AcceptRetryDelay.count()));
                retryAccept_();
                return;
            }

            std::shared_ptr<ViewerSession> session;
            {
                std::lock_guard<std::mutex> lock(m_Mutex);
                const uint64_t id = m_NextId++;
                session = std::make_shared<ViewerSession>(std::move(socket), m_Registry, id);

                SessionEntry& entry = m_Sessions[id];
                entry.session = session;
                entry.closedConnection = session->onClosed.connect([this](uint64_t closedId) { removeSession_(closedId); });
            }
            m_Accepted++;
            session->start();

            if (m_Running.load()) {
                accept_();
            }
        });
}


/**
 * @brief Re-arm the acceptor after a delay.
 *
 * Errors such as EMFILE persist while the pending connection stays queued, so
 * an immediate retry would fail again at once.
 */
void StreamServer::retryAccept_() {
    m_AcceptRetryTimer.expires_after(AcceptRetryDelay);
    m_AcceptRetryTimer.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !m_Running.load() || !m_Acceptor.is_open()) {
            return;
        }
        accept_();
    });
}


void StreamServer::removeSession_(uint64_t id) {
    std::shared_ptr<ViewerSession> session;
    std::size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        auto it = m_Sessions.find(id);
        if (it == m_Sessions.end()) {
            return;
        }
        // Keep the session alive until its handler returns
        session = std::move(it->second.session);
        m_Sessions.erase(it);
        remaining = m_Sessions.size();
    }
    Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Session %llu removed (%zu remaining)\n",
                                 static_cast<unsigned long long>(id), remaining);
}

}  // namespace Network
