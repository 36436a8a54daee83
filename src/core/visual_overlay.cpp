#include "core/visual_overlay.hpp"
#include "core/forensic_errors.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>

cv::Scalar VisualOverlay::confidenceColor(double confidence, double high, double medium)
{
    if (confidence >= high)
        return cv::Scalar(0, 0, 255);
    if (confidence >= medium)
        return cv::Scalar(0, 165, 255);
    return cv::Scalar(0, 255, 255);
}

void VisualOverlay::drawLabeledBox(cv::Mat &canvas, const BoundingBox &box, const cv::Scalar &color, int thickness,
                                   const std::string &label, double font_scale, int label_thickness)
{
    cv::rectangle(canvas, cv::Point(box.x, box.y), cv::Point(box.x + box.width, box.y + box.height), color,
                  thickness);
    if (label.empty())
        return;

    int label_y = box.y - 5;
    if (label_y < 10)
    {
        label_y = box.y + box.height + 15;
    }
    cv::putText(canvas, label, cv::Point(box.x, label_y), cv::FONT_HERSHEY_SIMPLEX, font_scale, color,
                label_thickness);
}

cv::Mat VisualOverlay::toBgr(const cv::Mat &image)
{
    cv::Mat bgr;
    switch (image.channels())
    {
    case 1:
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
        break;
    case 4:
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
        break;
    default:
        bgr = image.clone();
        break;
    }
    return bgr;
}

std::string VisualOverlay::save(const cv::Mat &image, const std::string &directory, const std::string &prefix)
{
    static std::atomic<unsigned long> sequence{0};

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        throw AnalyzerFailure("Cannot create " + directory + ": " + ec.message());
    }

    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    const std::string path = (std::filesystem::path(directory) /
                              (prefix + "_" + std::to_string(millis) + "_" + std::to_string(sequence++) + ".png"))
                                 .string();

    if (!cv::imwrite(path, image))
    {
        throw AnalyzerFailure("Could not write " + path);
    }
    Logger::debug("Wrote " + path);
    return path;
}
