#include "app/camera/DirectoryCycler.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <filesystem>

#include "utils/Errors.hpp"
#include "utils/logger.hpp"


namespace fs = std::filesystem;

namespace Camera {

DirectoryCycler::DirectoryCycler(const std::string& directory,
                                 const std::string& format,
                                 bool cycle,
                                 const std::string& referencePrefix)
    : m_Directory(directory), m_Format(format), m_Cycle(cycle), m_ReferencePrefix(referencePrefix) {

    std::error_code ec;
    if (!fs::is_directory(m_Directory, ec)) {
        throw Errors::SourceUnavailable("Source directory does not exist: " + m_Directory);
    }

    for (fs::directory_iterator it(m_Directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const std::string name = it->path().filename().string();
        if (fnmatch(m_Format.c_str(), name.c_str(), 0) == 0) {
            m_Files.push_back(it->path().string());
        }
    }
    if (ec) {
        throw Errors::SourceUnavailable("Unable to read source directory " + m_Directory + ": " + ec.message());
    }

    if (m_Files.empty()) {
        throw Errors::SourceUnavailable("No files matching \"" + m_Format + "\" in " + m_Directory);
    }

    std::sort(m_Files.begin(), m_Files.end());

    Logger::getLoggerInst()->log(Logger::LOG_LVL_INFO, "Found %zu frames in %s\n", m_Files.size(), m_Directory.c_str());
}


/**
 * @brief Return the next file in order, wrapping when cycling is enabled.
 *
 * @return std::optional<Frame> std::nullopt once all files were returned and cycling is off
 */
std::optional<Frame> DirectoryCycler::next() {
    if (m_Position >= m_Files.size()) {
        if (!m_Cycle) {
            return std::nullopt;
        }
        m_Position = 0;
    }

    Frame frame;
    frame.sequence = m_Sequence++;
    frame.reference = makeReference(m_Files[m_Position++]);
    return frame;
}


std::string DirectoryCycler::describe() const {
    return "directory " + m_Directory + " (" + m_Format + (m_Cycle ? ", cycling)" : ")");
}


std::string DirectoryCycler::makeReference(const std::string& file) const {
    if (m_ReferencePrefix.empty()) {
        return file;
    }
    return m_ReferencePrefix + fs::path(file).filename().string();
}

}  // namespace Camera
