#pragma once

#include "src/interfaces/IRenderer.hpp"
#include <string>

namespace target_finder::render {

/**
 * @brief Shows composed match views in an OpenCV HighGUI window
 */
class HighGuiRenderer : public IRenderer {
public:
    explicit HighGuiRenderer(std::string windowName = "Good Matches");
    ~HighGuiRenderer() override;

    HighGuiRenderer(const HighGuiRenderer&) = delete;
    HighGuiRenderer& operator=(const HighGuiRenderer&) = delete;

    void render(const RenderRequest& request) override;
    int waitKey(int delayMs) override;

private:
    std::string windowName_;
};

} // namespace target_finder::render
