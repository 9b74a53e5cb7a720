#pragma once

#include <map>
#include <string>

#include "viewer/Canvas.hpp"


namespace Viewer {

/**
 * @brief HighGUI window showing the latest frame with the label overlay.
 */
class OpenCvCanvas : public ICanvas {
public:
    explicit OpenCvCanvas(std::string windowName);
    ~OpenCvCanvas();

    OpenCvCanvas(const OpenCvCanvas&) = delete;
    OpenCvCanvas& operator=(const OpenCvCanvas&) = delete;

    void draw(const cv::Mat& image) override;
    void clear() override;
    void setLabel(Label label, const std::string& text) override;

    /**
     * @brief Repaint if anything changed and pump window events.
     *
     * @return false once the user asked to quit (q or ESC)
     */
    bool poll();

private:
    void render_();

    std::string m_WindowName;
    cv::Mat m_Frame;
    cv::Mat m_Composite;
    std::map<Label, std::string> m_Labels;
    bool m_Dirty = true;
};

}  // namespace Viewer
