#pragma once

#include "core/signal_analyzer.hpp"
#include "core/forensics_config.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

/**
 * @brief Error level analysis: re-encodes the image as JPEG at a fixed quality
 * and flags regions whose recompression error stands out.
 *
 * Re-encoding happens in memory. The only file an invocation may write is the
 * region heatmap, and only when ElaSettings::heatmap_dir is set.
 */
class CompressionArtifactAnalyzer : public SignalAnalyzer
{
public:
    explicit CompressionArtifactAnalyzer(const ElaSettings &settings = ElaSettings{});

    SignalName signal() const override { return SignalName::ELA; }

    SignalResult analyze(const std::string &image_path) override;

    /**
     * @brief Analyze an already decoded image (1, 3 or 4 channels; 8 or 16-bit, or float in [0, 1])
     */
    SignalResult analyzeImage(const cv::Mat &image) const;

    /**
     * @brief Normalized (0-255) single-channel recompression error of a 3-channel image
     */
    cv::Mat computeErrorLevel(const cv::Mat &bgr_image) const;

    /**
     * @brief Threshold an error-level map and turn its connected components into region findings
     * @param error_level CV_8UC1 map normalized to 0-255
     * @param suspicious_area Receives the summed pixel area of the surviving regions
     */
    static std::vector<Finding> extractRegions(const cv::Mat &error_level, const ElaSettings &settings,
                                               double &suspicious_area);

    static double scoreSuspiciousArea(double suspicious_area, double total_area, const ElaSettings &settings);

    static std::string summarize(const std::vector<Finding> &regions, double overall_confidence,
                                 const ElaSettings &settings);

    /**
     * @brief JET-colored error level blended 50/50 over the image, with each region boxed
     * and labeled with its confidence
     */
    static cv::Mat renderHeatmap(const cv::Mat &bgr_image, const cv::Mat &error_level,
                                 const std::vector<Finding> &regions, const ElaSettings &settings);

private:
    ElaSettings settings_;
};
