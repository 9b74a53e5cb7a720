#include "viewer/OpenCvCanvas.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>


namespace Viewer {

namespace {
constexpr int BlankWidth  = 640;
constexpr int BlankHeight = 480;
constexpr int KeyEscape   = 27;
}  // namespace


OpenCvCanvas::OpenCvCanvas(std::string windowName) : m_WindowName(std::move(windowName)) {
    cv::namedWindow(m_WindowName, cv::WINDOW_AUTOSIZE);
}


OpenCvCanvas::~OpenCvCanvas() {
    cv::destroyWindow(m_WindowName);
}


void OpenCvCanvas::draw(const cv::Mat& image) {
    m_Frame = image;
    m_Dirty = true;
}


void OpenCvCanvas::clear() {
    m_Frame.release();
    m_Dirty = true;
}


void OpenCvCanvas::setLabel(Label label, const std::string& text) {
    auto it = m_Labels.find(label);
    if (it != m_Labels.end() && it->second == text) {
        return;
    }
    m_Labels[label] = text;
    m_Dirty = true;
}


bool OpenCvCanvas::poll() {
    if (m_Dirty) {
        render_();
        m_Dirty = false;
    }
    const int key = cv::waitKey(1);
    return !(key == 'q' || key == KeyEscape);
}


/**
 * @brief Compose the frame and labels and show them.
 */
void OpenCvCanvas::render_() {
    if (m_Frame.empty()) {
        m_Composite = cv::Mat::zeros(BlankHeight, BlankWidth, CV_8UC3);
    } else {
        m_Frame.copyTo(m_Composite);
    }

    int baseline = 20;
    for (const auto& entry : m_Labels) {
        cv::putText(m_Composite, entry.second, cv::Point(10, baseline), cv::FONT_HERSHEY_SIMPLEX, 0.6,
                    cv::Scalar(0, 0, 0), 3, cv::LINE_AA);
        cv::putText(m_Composite, entry.second, cv::Point(10, baseline), cv::FONT_HERSHEY_SIMPLEX, 0.6,
                    cv::Scalar(0, 255, 0), 1, cv::LINE_AA);
        baseline += 24;
    }

    cv::imshow(m_WindowName, m_Composite);
}

}  // namespace Viewer
