#include "network_interface/ViewerSession.hpp"

#include <istream>

#include "app/messages/ControlMessages.hpp"
#include "utils/logger.hpp"


namespace Network {

namespace {
std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}
}  // namespace


std::optional<Route> resolveRoute(const std::string& line) {
    std::string path = trim(line);

    // "GET /ws/camera HTTP/1.1"
    if (path.compare(0, 4, "GET ") == 0) {
        path = trim(path.substr(4));
        const auto space = path.find(' ');
        if (space != std::string::npos) {
            path = path.substr(0, space);
        }
    }

    Route route;
    route.path = path;
    if (path == "/ws/camera") {
        route.channels = {Stream::ChannelRegistry::CameraChannel};
    } else if (path == "/ws/shoot") {
        route.channels = {Stream::ChannelRegistry::ShootChannel};
    } else if (path == "/ws/mode") {
        route.channels = {Stream::ChannelRegistry::ModeChannel};
    } else if (path == "/ws/events") {
        route.channels = {Stream::ChannelRegistry::ShootChannel, Stream::ChannelRegistry::ModeChannel};
    } else if (path == "/ws/control") {
        route.control = true;
    } else {
        return std::nullopt;
    }
    return route;
}


ViewerSession::ViewerSession(tcp::socket socket, Stream::ChannelRegistry& registry, uint64_t id)
    : m_Socket(std::move(socket)), m_Registry(registry), m_Id(id), m_ReadBuffer(MaxLineLength) {

    boost::system::error_code ec;
    const tcp::endpoint remote = m_Socket.remote_endpoint(ec);
    m_Peer = ec ? std::string("unknown") : remote.address().to_string() + ":" + std::to_string(remote.port());
}


ViewerSession::~ViewerSession() {
    for (auto& subscription : m_Subscriptions) {
        m_Registry.detach(subscription);
    }
}


void ViewerSession::start() {
    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Session %llu connected from %s\n",
                                 static_cast<unsigned long long>(m_Id), m_Peer.c_str());
    auto self = shared_from_this();
    boost::asio::dispatch(m_Socket.get_executor(), [self]() { self->readLine_(); });
}


void ViewerSession::close() {
    auto self = shared_from_this();
    boost::asio::post(m_Socket.get_executor(), [self]() { self->shutdown_("closed by server"); });
}


void ViewerSession::readLine_() {
    auto self = shared_from_this();
    boost::asio::async_read_until(m_Socket, m_ReadBuffer, '\n',
        [self](const boost::system::error_code& ec, std::size_t bytes) {
            if (ec) {
                self->shutdown_(ec == boost::asio::error::eof ? "peer closed" : ec.message());
                return;
            }

            std::string line(bytes, '\0');
            std::istream in(&self->m_ReadBuffer);
            in.read(&line[0], static_cast<std::streamsize>(bytes));
            if (!line.empty() && line.back() == '\n') {
                line.pop_back();
            }
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            self->handleLine_(line);
            if (!self->m_Closed.load()) {
                self->readLine_();
            }
        });
}


void ViewerSession::handleLine_(const std::string& line) {
    if (!m_Route) {
        handleRoute_(line);
    } else if (m_Route->control) {
        handleControl_(line);
    }
    // Subscriber routes ignore further input; reading only detects disconnect
}


void ViewerSession::handleRoute_(const std::string& line) {
    m_Route = resolveRoute(line);
    if (!m_Route) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Session %llu requested unknown route \"%s\"\n",
                                     static_cast<unsigned long long>(m_Id), line.c_str());
        // Any route set makes further lines be ignored while the error line is sent
        m_Route = Route{};
        writeLine_(Msg::encodeError("unknown route: " + line), true);
        return;
    }

    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Session %llu bound to %s\n",
                                 static_cast<unsigned long long>(m_Id), m_Route->path.c_str());
    attach_(*m_Route);
}


/**
 * @brief Publish a control message received from the client.
 *
 * Frame references cannot be injected from the outside and malformed lines are
 * ignored; neither closes the session.
 *
 * @param line JSON text of one message
 */
void ViewerSession::handleControl_(const std::string& line) {
    if (line.empty()) {
        return;
    }

    const std::optional<Msg::Message> msg = Msg::decode(line);
    if (!msg) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Session %llu sent malformed control message: %s\n",
                                     static_cast<unsigned long long>(m_Id), line.c_str());
        return;
    }

    const char* channel = nullptr;
    switch (Msg::kindOf(*msg)) {
        case Msg::Kind::Shoot:
            channel = Stream::ChannelRegistry::ShootChannel;
            break;
        case Msg::Kind::Mode:
            channel = Stream::ChannelRegistry::ModeChannel;
            break;
        case Msg::Kind::ImagePath:
            Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Session %llu may not publish frame references\n",
                                         static_cast<unsigned long long>(m_Id));
            return;
    }

    if (!m_Registry.publish(channel, *msg)) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Channel \"%s\" is closed, control message dropped\n", channel);
        return;
    }
    Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Session %llu published %s\n",
                                 static_cast<unsigned long long>(m_Id), line.c_str());
}


void ViewerSession::attach_(const Route& route) {
    std::weak_ptr<ViewerSession> weak = shared_from_this();
    const auto executor = m_Socket.get_executor();

    for (const auto& name : route.channels) {
        std::shared_ptr<Stream::Subscription> subscription = m_Registry.attach(name);
        if (!subscription) {
            shutdown_("channel registry is shut down");
            return;
        }

        boost::signals2::signal<void()>::slot_type slot([weak, executor]() {
            boost::asio::post(executor, [weak]() {
                if (auto self = weak.lock()) {
                    self->drain_();
                }
            });
        });
        subscription->onPending.connect(slot.track_foreign(weak));
        m_Subscriptions.push_back(std::move(subscription));
    }

    // Anything delivered before the pending slot was connected
    drain_();
}


/**
 * @brief Send the next buffered message, if no write is in flight.
 */
void ViewerSession::drain_() {
    if (m_Writing || m_Closed.load() || m_Subscriptions.empty()) {
        return;
    }

    const std::size_t count = m_Subscriptions.size();
    for (std::size_t i = 0; i < count; i++) {
        auto& subscription = m_Subscriptions[(m_NextSubscription + i) % count];
        std::optional<Msg::Message> msg = subscription->take();
        if (msg) {
            m_NextSubscription = (m_NextSubscription + i + 1) % count;
            writeLine_(Msg::encode(*msg), false);
            return;
        }
    }
}


void ViewerSession::writeLine_(std::string line, bool closeAfter) {
    m_Writing = true;
    m_OutLine = std::move(line);
    m_OutLine.push_back('\n');

    auto self = shared_from_this();
    boost::asio::async_write(m_Socket, boost::asio::buffer(m_OutLine),
        [self, closeAfter](const boost::system::error_code& ec, std::size_t) {
            self->m_Writing = false;
            if (ec) {
                self->shutdown_("send failed: " + ec.message());
                return;
            }
            if (closeAfter) {
                self->shutdown_("route rejected");
                return;
            }
            self->m_Sent++;
            self->drain_();
        });
}


/**
 * @brief Detach from every channel, close the socket and notify the owner.
 *
 * @param reason Logged cause
 */
void ViewerSession::shutdown_(const std::string& reason) {
    if (m_Closed.exchange(true)) {
        return;
    }
    auto self = shared_from_this();

    for (auto& subscription : m_Subscriptions) {
        m_Registry.detach(subscription);
    }
    m_Subscriptions.clear();

    boost::system::error_code ec;
    m_Socket.shutdown(tcp::socket::shutdown_both, ec);
    m_Socket.close(ec);

    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Session %llu (%s) closed: %s (%llu sent)\n",
                                 static_cast<unsigned long long>(m_Id), m_Peer.c_str(), reason.c_str(),
                                 static_cast<unsigned long long>(m_Sent.load()));
    onClosed(m_Id);
}

}  // namespace Network
