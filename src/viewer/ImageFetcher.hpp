#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <opencv2/core.hpp>

#include "utils/Errors.hpp"


namespace Viewer {

struct FetchResult {
    cv::Mat image;
    std::optional<Errors::DecodeFailure> error;
};

/**
 * @brief Asynchronous image loader.
 *
 * The completion is always invoked from the event loop the fetcher was built for.
 */
class IImageFetcher {
public:
    using Completion = std::function<void(const FetchResult&)>;

    virtual ~IImageFetcher() = default;

    virtual void fetch(const std::string& location, Completion done) = 0;
};


/**
 * @brief Decodes local image files on a worker pool.
 */
class FileImageFetcher : public IImageFetcher {
public:
    FileImageFetcher(boost::asio::io_context& loop, std::size_t workers = 2);
    ~FileImageFetcher();

    FileImageFetcher(const FileImageFetcher&) = delete;
    FileImageFetcher& operator=(const FileImageFetcher&) = delete;

    void fetch(const std::string& location, Completion done) override;

private:
    boost::asio::io_context& m_Loop;
    boost::asio::thread_pool m_Pool;
};

}  // namespace Viewer
