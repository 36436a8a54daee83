#pragma once

#include "core/signal_analyzer.hpp"
#include "core/ocr_engine.hpp"
#include "core/forensics_config.hpp"
#include <memory>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

/**
 * @brief A recognized word retained for layout analysis
 */
struct TextRegion
{
    BoundingBox bbox;
    std::string text;
    double confidence = 0.0;
    int area = 0;
    double aspect_ratio = 0.0;
    int font_size_estimate = 0; // Box height as a proxy for font size
    int line_id = 0;
    int block_id = 0;
    int paragraph_id = 0;
};

using TextLine = std::vector<TextRegion>;

/**
 * @brief Flags typographic and geometric inconsistencies among OCR'd words.
 *
 * The overall confidence measures suspicion, not authenticity.
 */
class TextLayoutAnalyzer : public SignalAnalyzer
{
public:
    /**
     * @throws std::invalid_argument if engine is null
     */
    TextLayoutAnalyzer(std::shared_ptr<OcrEngine> engine, const OcrSettings &settings = OcrSettings{});

    SignalName signal() const override { return SignalName::OCR; }

    SignalResult analyze(const std::string &image_path) override;
    SignalResult analyzeImage(const cv::Mat &image) const;

    /**
     * @brief Run filtering, rules and scoring on words an engine already produced
     */
    SignalResult analyzeWords(const std::vector<OcrWord> &words) const;

    /**
     * @brief Adaptive threshold, light dilation and median denoise of a grayscale image
     */
    static cv::Mat preprocess(const cv::Mat &gray);

    static std::vector<TextRegion> filterRegions(const std::vector<OcrWord> &words, const OcrSettings &settings);

    /**
     * @brief Group regions into lines by vertical position in one forward pass.
     * A region joins the current line when its y is within tolerance of the line's first region.
     */
    static std::vector<TextLine> groupIntoLines(const std::vector<TextRegion> &regions, int tolerance);

    static std::vector<Finding> detectInconsistencies(const std::vector<TextRegion> &regions,
                                                      const OcrSettings &settings);

    static std::vector<Finding> checkFontSizes(const std::vector<TextLine> &lines, const OcrSettings &settings);
    static std::vector<Finding> checkAlignment(const std::vector<TextRegion> &regions, const OcrSettings &settings);
    static std::vector<Finding> checkSpacing(const std::vector<TextRegion> &regions, const OcrSettings &settings);
    static std::vector<Finding> checkMixedFormatting(const std::vector<TextRegion> &regions,
                                                     const OcrSettings &settings);

    static double scoreInconsistencies(const std::vector<Finding> &findings, size_t region_count);

    static std::string summarize(const std::vector<Finding> &findings, double overall_confidence);

    /**
     * @brief Copy of image with each region boxed in its OCR-confidence color and labeled
     * with the first 15 characters of its text
     */
    static cv::Mat renderTextRegions(const cv::Mat &image, const std::vector<TextRegion> &regions);

private:
    std::shared_ptr<OcrEngine> engine_;
    OcrSettings settings_;
};
