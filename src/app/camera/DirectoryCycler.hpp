#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "app/camera/FrameSource.hpp"


namespace Camera {

/**
 * @brief Replays the image files of a directory in lexicographic order.
 */
class DirectoryCycler : public IFrameSource {
public:
    /**
     * @brief Scan the directory for files matching a glob filter.
     *
     * @param directory Directory to scan (not recursive)
     * @param format Glob applied to the file name, e.g. "*.jpg"
     * @param cycle Restart from the first file after the last one
     * @param referencePrefix If non-empty, references are prefix + file name instead of the full path
     * @throws Errors::SourceUnavailable if the directory is missing or holds no matching files
     */
    DirectoryCycler(const std::string& directory,
                    const std::string& format,
                    bool cycle,
                    const std::string& referencePrefix = "");

    std::optional<Frame> next() override;

    std::string describe() const override;

    const std::vector<std::string>& files() const {
        return m_Files;
    }

private:
    std::string makeReference(const std::string& file) const;

    std::string m_Directory;
    std::string m_Format;
    bool m_Cycle;
    std::string m_ReferencePrefix;

    std::vector<std::string> m_Files;
    std::size_t m_Position = 0;
    uint64_t m_Sequence = 0;
};

}  // namespace Camera
