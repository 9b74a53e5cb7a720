#pragma once

#include <cstddef>
#include <string>

#include <opencv2/core.hpp>

#include "app/camera/FrameSource.hpp"
#include "utils/Config.hpp"


namespace Camera {

/**
 * @brief Generates random-noise frames, writes them to disk and references the written file.
 *
 * Only the newest imageLimit files are kept on disk.
 */
class SyntheticGenerator : public IFrameSource {
public:
    /**
     * @brief Construct the generator.
     *
     * @param config Resolution, destination directory, extension, retention limit and seed
     * @param referencePrefix If non-empty, references are prefix + file name instead of the full path
     * @throws Errors::SourceUnavailable if the destination directory does not exist
     * @throws Errors::ConfigurationError if the resolution is not positive
     */
    explicit SyntheticGenerator(const Config::SyntheticSourceConfig& config,
                                const std::string& referencePrefix = "");

    std::optional<Frame> next() override;

    std::string describe() const override;

    /**
     * @brief Path of the file written for the given sequence number.
     */
    std::string pathFor(uint64_t sequence) const;

private:
    void enforceRetention(uint64_t newest);

    Config::SyntheticSourceConfig m_Config;
    std::string m_ReferencePrefix;
    cv::RNG m_Rng;
    cv::Mat m_Image;
    uint64_t m_Sequence = 0;
};

}  // namespace Camera
