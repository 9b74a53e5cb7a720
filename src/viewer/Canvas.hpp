#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>


namespace Viewer {

enum class Label : uint8_t {
    Fps,
    Shot,
    Mode
};

const char* toString(Label label);

/**
 * @brief Render target of the viewer. Only called from the viewer event loop.
 */
class ICanvas {
public:
    virtual ~ICanvas() = default;

    virtual void draw(const cv::Mat& image) = 0;
    virtual void clear() = 0;
    virtual void setLabel(Label label, const std::string& text) = 0;
};


/**
 * @brief Canvas that only logs label changes, for running without a display.
 */
class HeadlessCanvas : public ICanvas {
public:
    void draw(const cv::Mat& image) override;
    void clear() override {}
    void setLabel(Label label, const std::string& text) override;

    uint64_t drawnCount() const {
        return m_Drawn;
    }

private:
    uint64_t m_Drawn = 0;
};

}  // namespace Viewer
