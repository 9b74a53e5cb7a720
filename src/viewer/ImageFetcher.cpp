#include "viewer/ImageFetcher.hpp"

#include <opencv2/imgcodecs.hpp>


namespace Viewer {

FileImageFetcher::FileImageFetcher(boost::asio::io_context& loop, std::size_t workers)
    : m_Loop(loop), m_Pool(workers == 0 ? 1 : workers) {
}


FileImageFetcher::~FileImageFetcher() {
    m_Pool.join();
}


/**
 * @brief Decode location on the pool and post the result back to the loop.
 */
void FileImageFetcher::fetch(const std::string& location, Completion done) {
    boost::asio::post(m_Pool, [this, location, done = std::move(done)]() {
        FetchResult result;
        try {
            result.image = cv::imread(location, cv::IMREAD_COLOR);
            if (result.image.empty()) {
                result.error.emplace("Unable to decode " + location);
            }
        } catch (const cv::Exception& e) {
            result.error.emplace("Unable to decode " + location + ": " + e.what());
        }

        boost::asio::post(m_Loop, [done, result]() { done(result); });
    });
}

}  // namespace Viewer
