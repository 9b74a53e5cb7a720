#include "app/camera/SyntheticGenerator.hpp"

#include <cstdio>
#include <filesystem>

#include <opencv2/imgcodecs.hpp>

#include "utils/Errors.hpp"
#include "utils/logger.hpp"


namespace fs = std::filesystem;

namespace Camera {

SyntheticGenerator::SyntheticGenerator(const Config::SyntheticSourceConfig& config,
                                       const std::string& referencePrefix)
    : m_Config(config), m_ReferencePrefix(referencePrefix), m_Rng(config.seed) {

    if (m_Config.resolution.width <= 0 || m_Config.resolution.height <= 0) {
        throw Errors::ConfigurationError("Resolution must contain only positive integers");
    }

    std::error_code ec;
    if (!fs::is_directory(m_Config.savePath, ec)) {
        throw Errors::SourceUnavailable("Destination path does not exist: " + m_Config.savePath);
    }

    if (m_Config.imageLimit == 0) {
        m_Config.imageLimit = 1;
    }

    m_Image.create(m_Config.resolution.height, m_Config.resolution.width, CV_8UC3);
}


/**
 * @brief Render a noise frame, write it to disk and return its reference.
 *
 * @return std::optional<Frame> Always a frame; this source never ends
 */
std::optional<Frame> SyntheticGenerator::next() {
    const uint64_t sequence = m_Sequence;
    const std::string path = pathFor(sequence);

    m_Rng.fill(m_Image, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(256));

    bool written = false;
    try {
        written = cv::imwrite(path, m_Image);
    } catch (const cv::Exception& e) {
        throw Errors::SourceUnavailable("Failed to encode frame " + path + ": " + e.what());
    }
    if (!written) {
        throw Errors::SourceUnavailable("Failed to write frame " + path);
    }

    m_Sequence++;
    enforceRetention(sequence);

    Frame frame;
    frame.sequence = sequence;
    frame.reference = m_ReferencePrefix.empty() ? path : m_ReferencePrefix + fs::path(path).filename().string();
    return frame;
}


std::string SyntheticGenerator::describe() const {
    return "synthetic " + std::to_string(m_Config.resolution.width) + "x" +
           std::to_string(m_Config.resolution.height) + " -> " + m_Config.savePath;
}


std::string SyntheticGenerator::pathFor(uint64_t sequence) const {
    char name[32];
    std::snprintf(name, sizeof(name), "%06llu", static_cast<unsigned long long>(sequence));
    return (fs::path(m_Config.savePath) / (std::string(name) + m_Config.extension)).string();
}


void SyntheticGenerator::enforceRetention(uint64_t newest) {
    if (newest < m_Config.imageLimit) {
        return;
    }

    const std::string stale = pathFor(newest - m_Config.imageLimit);
    std::error_code ec;
    fs::remove(stale, ec);
    if (ec) {
        Logger::getLoggerInst()->log(Logger::LOG_LVL_WARN, "Failed to remove %s: %s\n", stale.c_str(), ec.message().c_str());
    }
}

}  // namespace Camera
