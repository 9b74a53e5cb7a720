#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "utils/Config.hpp"


namespace Camera {

/**
 * @brief A single produced frame.
 *
 * reference is an opaque path the consumer can fetch the image from.
 */
struct Frame {
    uint64_t sequence = 0;
    std::string reference;
};

/**
 * @brief Pull-style producer of frames.
 *
 * next() returns frames with strictly increasing, gap-free sequence numbers.
 * std::nullopt marks the end of the sequence.
 */
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    /**
     * @brief Produce the next frame.
     * @throws Errors::SourceUnavailable if the source cannot produce a frame
     */
    virtual std::optional<Frame> next() = 0;

    /**
     * @brief Short human readable description used in log output.
     */
    virtual std::string describe() const = 0;
};


/**
 * @brief Build the frame source selected by the camera configuration.
 *
 * @throws Errors::SourceUnavailable if the source cannot be opened
 */
std::unique_ptr<IFrameSource> makeFrameSource(const Config::CameraConfig& config);

}  // namespace Camera
