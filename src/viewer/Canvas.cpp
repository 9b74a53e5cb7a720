#include "viewer/Canvas.hpp"

#include "utils/logger.hpp"


namespace Viewer {

const char* toString(Label label) {
    switch (label) {
        case Label::Fps:  return "fps";
        case Label::Shot: return "shot";
        case Label::Mode: return "mode";
    }
    return "unknown";
}


void HeadlessCanvas::draw(const cv::Mat& image) {
    (void)image;
    m_Drawn++;
}


void HeadlessCanvas::setLabel(Label label, const std::string& text) {
    // FPS changes with every frame, keep it out of the normal log
    const int level = (label == Label::Fps) ? Logger::LOG_LVL_DEBUG : Logger::LOG_LVL_INFO;
    Logger::getLoggerInst()->log(level, "%s\n", text.c_str());
}

}  // namespace Viewer
