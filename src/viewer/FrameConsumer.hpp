#pragma once

#include <cstdint>
#include <string>

#include <boost/signals2.hpp>

#include "app/messages/ControlMessages.hpp"
#include "viewer/Canvas.hpp"
#include "viewer/FpsCounter.hpp"
#include "viewer/ImageFetcher.hpp"


namespace Viewer {

/**
 * @brief Decode "%XX" escapes. Malformed escapes are kept as-is.
 */
std::string percentDecode(const std::string& text);

/**
 * @brief Join a frame reference onto the base address with exactly one '/'.
 *
 * An empty base leaves the reference unchanged.
 */
std::string resolveLocation(const std::string& base, const std::string& reference);


/**
 * @brief Renders frame references with skip-if-busy backpressure.
 *
 * While a fetch is outstanding new references are dropped, so the viewer
 * always shows the newest frame it can keep up with. Runs on a single event
 * loop; the fetch flag is never touched from another thread.
 */
class FrameConsumer {
public:
    FrameConsumer(IImageFetcher& fetcher,
                  ICanvas& canvas,
                  std::string baseAddress,
                  FpsCounter::Clock clock = FpsCounter::Clock());
    ~FrameConsumer();

    FrameConsumer(const FrameConsumer&) = delete;
    FrameConsumer& operator=(const FrameConsumer&) = delete;

    /**
     * @brief Start consuming messages emitted by source.
     */
    void start(boost::signals2::signal<void(const Msg::Message&)>& source);

    /**
     * @brief Stop consuming and clear the canvas.
     */
    void stop();

    void onMessage(const Msg::Message& msg);
    void onImagePath(const std::string& path);

    bool isLoading() const {
        return m_Loading;
    }

    uint64_t renderedCount() const {
        return m_Rendered;
    }

    uint64_t skippedCount() const {
        return m_Skipped;
    }

    uint64_t failedCount() const {
        return m_Failed;
    }

    int fps() const {
        return m_FpsCounter.fps();
    }

private:
    void onFetched_(const std::string& location, const FetchResult& result);

    IImageFetcher& m_Fetcher;
    ICanvas& m_Canvas;
    std::string m_BaseAddress;
    FpsCounter m_FpsCounter;

    boost::signals2::scoped_connection m_Connection;

    bool m_Loading = false;
    uint64_t m_Rendered = 0;
    uint64_t m_Skipped = 0;
    uint64_t m_Failed = 0;
};

}  // namespace Viewer
