#pragma once

#include "core/forensic_result.hpp"
#include <opencv2/core.hpp>
#include <string>

/**
 * @brief Drawing and persistence helpers for the analyzers' explanatory images
 */
class VisualOverlay
{
public:
    // Red at or above high, orange at or above medium, yellow below (BGR)
    static cv::Scalar confidenceColor(double confidence, double high, double medium);

    /**
     * @brief Outline box and put label just above it (below it when there is no room)
     */
    static void drawLabeledBox(cv::Mat &canvas, const BoundingBox &box, const cv::Scalar &color, int thickness,
                               const std::string &label, double font_scale, int label_thickness);

    /**
     * @brief 3-channel 8-bit copy of a 1, 3 or 4 channel image
     */
    static cv::Mat toBgr(const cv::Mat &image);

    /**
     * @brief Write image as "<prefix>_<millis>_<sequence>.png" under directory, creating it if needed
     * @return The written file's path
     * @throws AnalyzerFailure if the directory cannot be created or the image cannot be written
     */
    static std::string save(const cv::Mat &image, const std::string &directory, const std::string &prefix);
};
