#include "HighGuiRenderer.hpp"
#include "MatchComposer.hpp"
#include "target_finder/logging.hpp"
#include <opencv2/highgui.hpp>
#include <utility>

namespace target_finder::render {

HighGuiRenderer::HighGuiRenderer(std::string windowName)
    : windowName_(std::move(windowName)) {
    cv::namedWindow(windowName_, cv::WINDOW_AUTOSIZE);
}

HighGuiRenderer::~HighGuiRenderer() {
    try {
        cv::destroyWindow(windowName_);
    } catch (const cv::Exception& e) {
        LOG_WARNING("Failed to close window '" + windowName_ + "': " + e.what());
    }
}

void HighGuiRenderer::render(const RenderRequest& request) {
    cv::imshow(windowName_, composeMatchView(request));
}

int HighGuiRenderer::waitKey(int delayMs) {
    return cv::waitKey(delayMs);
}

} // namespace target_finder::render
