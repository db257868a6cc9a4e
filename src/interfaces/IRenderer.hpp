#pragma once

#include "target_finder/types.hpp"
#include <opencv2/core.hpp>

namespace target_finder {

    /**
     * @brief Everything a renderer needs to draw one frame
     *
     * Pointers refer to state owned by the control loop and are only valid
     * for the duration of the render() call.
     */
    struct RenderRequest {
        const cv::Mat* reference = nullptr;
        const FeatureSet* referenceFeatures = nullptr;
        const cv::Mat* scene = nullptr;
        const FeatureSet* sceneFeatures = nullptr;
        const Correspondences* correspondences = nullptr;
        const cv::Mat* transform = nullptr;   ///< null or empty: side-by-side mode
        const cv::Mat* overlay = nullptr;     ///< null or empty: no compositing
    };

    /**
     * @brief Output sink for the recognition loop
     */
    class IRenderer {
    public:
        virtual ~IRenderer() = default;

        virtual void render(const RenderRequest& request) = 0;

        /**
         * @brief Wait for a key press
         * @param delayMs Milliseconds to wait; 0 waits indefinitely
         * @return Key code, or -1 if no key was pressed
         */
        virtual int waitKey(int delayMs) = 0;
    };

} // namespace target_finder
