#include "core/compression_artifact_analyzer.hpp"
#include "core/forensic_errors.hpp"
#include "core/visual_overlay.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdio>

CompressionArtifactAnalyzer::CompressionArtifactAnalyzer(const ElaSettings &settings)
    : settings_(settings)
{
}

SignalResult CompressionArtifactAnalyzer::analyze(const std::string &image_path)
{
    Logger::info("Running error level analysis on: " + image_path);

    cv::Mat image;
    try
    {
        image = cv::imread(image_path, cv::IMREAD_COLOR);
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error while reading " + image_path + ": " + std::string(e.what()));
        return SignalResult::failed(SignalStatus::ERROR, "Analysis failed: " + std::string(e.what()));
    }

    if (image.empty())
    {
        Logger::warn("Could not read image: " + image_path);
        return SignalResult::failed(SignalStatus::ERROR, "Analysis failed: Could not read image: " + image_path);
    }

    return analyzeImage(image);
}

SignalResult CompressionArtifactAnalyzer::analyzeImage(const cv::Mat &image) const
{
    try
    {
        if (image.empty())
        {
            throw AnalyzerFailure("Empty image");
        }

        cv::Mat bgr;
        cv::Mat source = image;
        switch (source.depth())
        {
        case CV_8U:
            break;
        case CV_16U:
            source.convertTo(source, CV_8U, 1.0 / 257.0);
            break;
        case CV_32F:
        case CV_64F:
            // Floating point rasters are expected in [0, 1]
            source.convertTo(source, CV_8U, 255.0);
            break;
        default:
            throw AnalyzerFailure("Unsupported pixel depth: " + std::to_string(source.depth()));
        }
        switch (source.channels())
        {
        case 1:
            cv::cvtColor(source, bgr, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            bgr = source;
            break;
        case 4:
            cv::cvtColor(source, bgr, cv::COLOR_BGRA2BGR);
            break;
        default:
            throw AnalyzerFailure("Unsupported channel count: " + std::to_string(source.channels()));
        }

        cv::Mat error_level = computeErrorLevel(bgr);

        double suspicious_area = 0.0;
        std::vector<Finding> regions = extractRegions(error_level, settings_, suspicious_area);

        const double total_area = static_cast<double>(bgr.rows) * bgr.cols;
        const double ratio = total_area > 0 ? suspicious_area / total_area : 0.0;
        const double overall = scoreSuspiciousArea(suspicious_area, total_area, settings_);

        nlohmann::json details = {
            {"regions_found", regions.size()},
            {"suspicious_ratio", roundTo(ratio * 100.0)},
            {"image_size", {{"width", bgr.cols}, {"height", bgr.rows}}},
            {"jpeg_quality", settings_.jpeg_quality}};

        if (!settings_.heatmap_dir.empty())
        {
            try
            {
                details["heatmap_path"] = VisualOverlay::save(renderHeatmap(bgr, error_level, regions, settings_),
                                                              settings_.heatmap_dir, "ela_heatmap");
            }
            catch (const std::exception &e)
            {
                // A heatmap failure does not fail the signal
                Logger::warn("Could not write error level heatmap: " + std::string(e.what()));
                details["heatmap_path"] = nullptr;
            }
        }

        std::string summary = summarize(regions, overall, settings_);
        Logger::debug("Error level analysis found " + std::to_string(regions.size()) +
                      " regions, overall confidence " + std::to_string(overall));

        return SignalResult::completed(roundTo(overall), std::move(regions), summary, details);
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during error level analysis: " + std::string(e.what()));
        return SignalResult::failed(SignalStatus::ERROR, "Analysis failed: " + std::string(e.what()));
    }
    catch (const std::exception &e)
    {
        Logger::error("Error level analysis failed: " + std::string(e.what()));
        return SignalResult::failed(SignalStatus::ERROR, "Analysis failed: " + std::string(e.what()));
    }
}

cv::Mat CompressionArtifactAnalyzer::computeErrorLevel(const cv::Mat &bgr_image) const
{
    std::vector<uchar> encoded;
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, settings_.jpeg_quality};
    if (!cv::imencode(".jpg", bgr_image, encoded, params))
    {
        throw AnalyzerFailure("JPEG re-encoding failed");
    }

    cv::Mat resaved = cv::imdecode(encoded, cv::IMREAD_COLOR);
    if (resaved.empty() || resaved.size() != bgr_image.size())
    {
        throw AnalyzerFailure("Could not decode re-encoded image");
    }

    cv::Mat diff;
    cv::absdiff(bgr_image, resaved, diff);

    cv::Mat diff_gray;
    cv::cvtColor(diff, diff_gray, cv::COLOR_BGR2GRAY);

    cv::Mat normalized;
    cv::normalize(diff_gray, normalized, 0, 255, cv::NORM_MINMAX, CV_8U);
    return normalized;
}

std::vector<Finding> CompressionArtifactAnalyzer::extractRegions(const cv::Mat &error_level,
                                                                 const ElaSettings &settings,
                                                                 double &suspicious_area)
{
    suspicious_area = 0.0;
    std::vector<Finding> regions;
    if (error_level.empty())
        return regions;

    cv::Mat mask;
    cv::threshold(error_level, mask, settings.diff_threshold, 255, cv::THRESH_BINARY);

    cv::Mat labels, stats, centroids;
    int count = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);

    // Label 0 is the background
    for (int label = 1; label < count; ++label)
    {
        int area = stats.at<int>(label, cv::CC_STAT_AREA);
        if (area < settings.min_region_area)
            continue;

        cv::Rect box(stats.at<int>(label, cv::CC_STAT_LEFT),
                     stats.at<int>(label, cv::CC_STAT_TOP),
                     stats.at<int>(label, cv::CC_STAT_WIDTH),
                     stats.at<int>(label, cv::CC_STAT_HEIGHT));

        cv::Mat component = labels(box) == label;
        double intensity = cv::mean(error_level(box), component)[0];
        double confidence = clampConfidence(intensity / 255.0 * 100.0);
        if (confidence < settings.min_region_confidence)
            continue;

        Finding region("ela_region", roundTo(confidence),
                       "Recompression error concentrated in a " + std::to_string(box.width) + "x" +
                           std::to_string(box.height) + " region",
                       {{"area", area}, {"intensity", roundTo(intensity)}},
                       BoundingBox(box.x, box.y, box.width, box.height));
        regions.push_back(std::move(region));
        suspicious_area += area;
    }
    return regions;
}

double CompressionArtifactAnalyzer::scoreSuspiciousArea(double suspicious_area, double total_area,
                                                        const ElaSettings &settings)
{
    if (total_area <= 0)
        return 0.0;
    return clampConfidence(suspicious_area / total_area * settings.area_ratio_scale);
}

std::string CompressionArtifactAnalyzer::summarize(const std::vector<Finding> &regions, double overall_confidence,
                                                   const ElaSettings &settings)
{
    if (regions.empty())
    {
        if (overall_confidence < 20)
            return "No significant tampering detected. Document appears authentic.";
        return "Low confidence findings. Document likely authentic with minor compression artifacts.";
    }

    auto high = std::count_if(regions.begin(), regions.end(), [&](const Finding &f)
                              { return f.confidence >= settings.high_confidence; });
    auto medium = std::count_if(regions.begin(), regions.end(), [&](const Finding &f)
                                { return f.confidence >= settings.medium_confidence && f.confidence < settings.high_confidence; });
    auto low = std::count_if(regions.begin(), regions.end(), [&](const Finding &f)
                             { return f.confidence < settings.medium_confidence; });

    if (high >= 2)
        return "High confidence tampering detected in " + std::to_string(high) +
               " regions. Document shows clear signs of manipulation.";
    if (high == 1 && medium >= 1)
        return "Suspicious editing detected. " + std::to_string(high) + " high confidence and " +
               std::to_string(medium) + " medium confidence regions found.";
    if (medium >= 2)
        return "Multiple suspicious regions detected (" + std::to_string(medium) +
               " regions). Document may have been altered.";
    if (low >= 3)
        return "Minor anomalies detected in " + std::to_string(regions.size()) +
               " regions. Could be compression artifacts or minor edits.";
    return std::to_string(regions.size()) + " potential tampering regions detected. Further verification recommended.";
}

cv::Mat CompressionArtifactAnalyzer::renderHeatmap(const cv::Mat &bgr_image, const cv::Mat &error_level,
                                                   const std::vector<Finding> &regions, const ElaSettings &settings)
{
    cv::Mat colored;
    cv::applyColorMap(error_level, colored, cv::COLORMAP_JET);

    cv::Mat overlay;
    cv::addWeighted(bgr_image, 0.5, colored, 0.5, 0.0, overlay);

    for (const auto &region : regions)
    {
        if (!region.bbox)
            continue;

        const BoundingBox &box = *region.bbox;
        int thickness = 1;
        if (region.confidence >= settings.high_confidence)
            thickness = 3;
        else if (region.confidence >= settings.medium_confidence)
            thickness = 2;

        char label[16];
        std::snprintf(label, sizeof(label), "%.0f%%", region.confidence);
        const double font_scale = std::max(0.5, std::min(1.0, box.width / 200.0));

        VisualOverlay::drawLabeledBox(overlay, box,
                                      VisualOverlay::confidenceColor(region.confidence, settings.high_confidence,
                                                                     settings.medium_confidence),
                                      thickness, label, font_scale, 2);
    }
    return overlay;
}
