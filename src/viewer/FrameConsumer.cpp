#include "viewer/FrameConsumer.hpp"

#include "utils/logger.hpp"


namespace Viewer {

namespace {
int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}  // namespace


std::string percentDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); i++) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hexValue(text[i + 1]);
            const int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}


std::string resolveLocation(const std::string& base, const std::string& reference) {
    if (base.empty()) {
        return reference;
    }

    std::string head = base;
    while (!head.empty() && head.back() == '/') {
        head.pop_back();
    }
    const auto start = reference.find_first_not_of('/');
    const std::string tail = (start == std::string::npos) ? std::string() : reference.substr(start);

    return head + "/" + tail;
}


FrameConsumer::FrameConsumer(IImageFetcher& fetcher,
                             ICanvas& canvas,
                             std::string baseAddress,
                             FpsCounter::Clock clock)
    : m_Fetcher(fetcher), m_Canvas(canvas), m_BaseAddress(std::move(baseAddress)), m_FpsCounter(std::move(clock)) {
}


FrameConsumer::~FrameConsumer() {
    m_Connection.disconnect();
}


void FrameConsumer::start(boost::signals2::signal<void(const Msg::Message&)>& source) {
    m_Connection = source.connect([this](const Msg::Message& msg) { onMessage(msg); });
}


void FrameConsumer::stop() {
    m_Connection.disconnect();
    m_Canvas.clear();
}


void FrameConsumer::onMessage(const Msg::Message& msg) {
    if (const auto* frame = std::get_if<Msg::ImagePath>(&msg)) {
        onImagePath(frame->path);
    }
}


/**
 * @brief Fetch a frame unless one is already in flight.
 *
 * @param path Frame reference as received, still percent-encoded
 */
void FrameConsumer::onImagePath(const std::string& path) {
    if (m_Loading) {
        m_Skipped++;
        Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Skipping %s\n", path.c_str());
        return;
    }

    m_Loading = true;
    const std::string location = resolveLocation(m_BaseAddress, percentDecode(path));
    m_Fetcher.fetch(location, [this, location](const FetchResult& result) { onFetched_(location, result); });
}


void FrameConsumer::onFetched_(const std::string& location, const FetchResult& result) {
    if (result.error) {
        m_Failed++;
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "%s\n", result.error->what());
    } else {
        m_Canvas.draw(result.image);
        m_FpsCounter.countFrame();
        m_Rendered++;
        m_Canvas.setLabel(Label::Fps, "FPS: " + std::to_string(m_FpsCounter.fps()));
        Logger::getLoggerInst()->log(Logger::LOG_LVL_DEBUG, "Rendered %s\n", location.c_str());
    }
    m_Loading = false;
}

}  // namespace Viewer
