#include "core/text_layout_analyzer.hpp"
#include "core/forensic_errors.hpp"
#include "core/visual_overlay.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace
{
    std::string trim(const std::string &text)
    {
        auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char c)
                                      { return std::isspace(c); });
        auto last = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c)
                                     { return std::isspace(c); })
                        .base();
        return first < last ? std::string(first, last) : std::string();
    }

    nlohmann::json boxToJson(const BoundingBox &box)
    {
        return nlohmann::json::array({box.x, box.y, box.width, box.height});
    }

    BoundingBox unionOf(const std::vector<BoundingBox> &boxes)
    {
        int x1 = boxes.front().x;
        int y1 = boxes.front().y;
        int x2 = boxes.front().x + boxes.front().width;
        int y2 = boxes.front().y + boxes.front().height;
        for (const auto &b : boxes)
        {
            x1 = std::min(x1, b.x);
            y1 = std::min(y1, b.y);
            x2 = std::max(x2, b.x + b.width);
            y2 = std::max(y2, b.y + b.height);
        }
        return BoundingBox(x1, y1, x2 - x1, y2 - y1);
    }

    nlohmann::json regionToJson(const TextRegion &region)
    {
        return {
            {"bbox", boxToJson(region.bbox)},
            {"text", region.text},
            {"confidence", region.confidence},
            {"area", region.area},
            {"aspect_ratio", roundTo(region.aspect_ratio)},
            {"font_size_estimate", region.font_size_estimate},
            {"line_num", region.line_id},
            {"block_num", region.block_id},
            {"par_num", region.paragraph_id}};
    }
}

TextLayoutAnalyzer::TextLayoutAnalyzer(std::shared_ptr<OcrEngine> engine, const OcrSettings &settings)
    : engine_(std::move(engine)), settings_(settings)
{
    if (!engine_)
    {
        throw std::invalid_argument("TextLayoutAnalyzer requires an OCR engine");
    }
}

SignalResult TextLayoutAnalyzer::analyze(const std::string &image_path)
{
    Logger::info("Running text layout analysis on: " + image_path);

    cv::Mat image;
    try
    {
        image = cv::imread(image_path, cv::IMREAD_COLOR);
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error while reading " + image_path + ": " + std::string(e.what()));
        return SignalResult::failed(SignalStatus::ERROR, "OCR analysis failed: " + std::string(e.what()));
    }

    if (image.empty())
    {
        Logger::warn("Could not read image: " + image_path);
        return SignalResult::failed(SignalStatus::ERROR, "OCR analysis failed: Could not read image: " + image_path);
    }

    return analyzeImage(image);
}

SignalResult TextLayoutAnalyzer::analyzeImage(const cv::Mat &image) const
{
    try
    {
        if (image.empty())
        {
            throw AnalyzerFailure("Empty image");
        }

        cv::Mat gray;
        if (image.channels() == 1)
            gray = image;
        else if (image.channels() == 4)
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
        else
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);

        cv::Mat processed = preprocess(gray);
        std::vector<OcrWord> words = engine_->detect(processed, OcrConfig::fromSettings(settings_));
        SignalResult result = analyzeWords(words);

        if (!settings_.visualization_dir.empty())
        {
            try
            {
                result.details["visualization_path"] =
                    VisualOverlay::save(renderTextRegions(image, filterRegions(words, settings_)),
                                        settings_.visualization_dir, "ocr_regions");
            }
            catch (const std::exception &e)
            {
                Logger::warn("Could not write text region overlay: " + std::string(e.what()));
                result.details["visualization_path"] = nullptr;
            }
        }
        return result;
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during text layout analysis: " + std::string(e.what()));
        return SignalResult::failed(SignalStatus::ERROR, "OCR analysis failed: " + std::string(e.what()));
    }
    catch (const std::exception &e)
    {
        Logger::error("Text layout analysis failed: " + std::string(e.what()));
        return SignalResult::failed(SignalStatus::ERROR, "OCR analysis failed: " + std::string(e.what()));
    }
}

SignalResult TextLayoutAnalyzer::analyzeWords(const std::vector<OcrWord> &words) const
{
    std::vector<TextRegion> regions = filterRegions(words, settings_);
    std::vector<Finding> findings = detectInconsistencies(regions, settings_);
    double overall = scoreInconsistencies(findings, regions.size());

    size_t total_characters = 0;
    nlohmann::json sample = nlohmann::json::array();
    for (const auto &region : regions)
    {
        total_characters += region.text.size();
        if (sample.size() < 10)
            sample.push_back(regionToJson(region));
    }

    nlohmann::json details = {
        {"text_blocks_found", regions.size()},
        {"total_characters", total_characters},
        {"inconsistencies_found", findings.size()},
        {"ocr_raw_word_count", words.size()},
        {"text_regions", sample}};

    std::string summary = summarize(findings, overall);
    Logger::debug("Text layout analysis kept " + std::to_string(regions.size()) + " of " +
                  std::to_string(words.size()) + " words, " + std::to_string(findings.size()) + " inconsistencies");

    return SignalResult::completed(roundTo(overall), std::move(findings), summary, details);
}

cv::Mat TextLayoutAnalyzer::preprocess(const cv::Mat &gray)
{
    cv::Mat binary;
    cv::adaptiveThreshold(gray, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 11, 2);

    cv::Mat kernel = cv::Mat::ones(1, 1, CV_8U);
    cv::Mat dilated;
    cv::dilate(binary, dilated, kernel, cv::Point(-1, -1), 1);

    cv::Mat denoised;
    cv::medianBlur(dilated, denoised, 3);
    return denoised;
}

std::vector<TextRegion> TextLayoutAnalyzer::filterRegions(const std::vector<OcrWord> &words,
                                                          const OcrSettings &settings)
{
    std::vector<TextRegion> regions;
    for (const auto &word : words)
    {
        std::string text = trim(word.text);
        if (text.empty() || word.confidence < settings.min_word_confidence)
            continue;
        if (word.bbox.width < settings.min_region_size || word.bbox.height < settings.min_region_size)
            continue;

        TextRegion region;
        region.bbox = word.bbox;
        region.text = text;
        region.confidence = word.confidence;
        region.area = word.bbox.width * word.bbox.height;
        region.aspect_ratio = static_cast<double>(word.bbox.width) / word.bbox.height;
        region.font_size_estimate = word.bbox.height;
        region.line_id = word.line_id;
        region.block_id = word.block_id;
        region.paragraph_id = word.paragraph_id;
        regions.push_back(std::move(region));
    }
    return regions;
}

std::vector<TextLine> TextLayoutAnalyzer::groupIntoLines(const std::vector<TextRegion> &regions, int tolerance)
{
    std::vector<TextRegion> sorted = regions;
    std::stable_sort(sorted.begin(), sorted.end(), [](const TextRegion &a, const TextRegion &b)
                     { return a.bbox.y < b.bbox.y; });

    std::vector<TextLine> lines;
    int anchor_y = 0;
    for (const auto &region : sorted)
    {
        if (lines.empty() || std::abs(region.bbox.y - anchor_y) > tolerance)
        {
            anchor_y = region.bbox.y;
            lines.emplace_back();
        }
        lines.back().push_back(region);
    }
    return lines;
}

std::vector<Finding> TextLayoutAnalyzer::detectInconsistencies(const std::vector<TextRegion> &regions,
                                                               const OcrSettings &settings)
{
    std::vector<Finding> findings;
    if (regions.size() < 2)
        return findings;

    auto append = [&findings](std::vector<Finding> more)
    {
        for (auto &f : more)
            findings.push_back(std::move(f));
    };

    append(checkFontSizes(groupIntoLines(regions, settings.line_tolerance_px), settings));
    append(checkAlignment(regions, settings));
    append(checkSpacing(regions, settings));
    append(checkMixedFormatting(regions, settings));
    return findings;
}

std::vector<Finding> TextLayoutAnalyzer::checkFontSizes(const std::vector<TextLine> &lines,
                                                        const OcrSettings &settings)
{
    std::vector<Finding> findings;
    for (size_t line_index = 0; line_index < lines.size(); ++line_index)
    {
        const TextLine &line = lines[line_index];
        if (line.size() < 2)
            continue;

        double sum = 0.0;
        for (const auto &r : line)
            sum += r.font_size_estimate;
        const double mean = sum / line.size();

        double sq = 0.0;
        for (const auto &r : line)
            sq += (r.font_size_estimate - mean) * (r.font_size_estimate - mean);
        const double std_dev = std::sqrt(sq / line.size());

        // Strictly above the ratio; exactly at the ratio is consistent
        if (!(std_dev > mean * settings.font_variance_ratio))
            continue;

        std::vector<BoundingBox> boxes;
        nlohmann::json region_boxes = nlohmann::json::array();
        for (const auto &r : line)
        {
            boxes.push_back(r.bbox);
            region_boxes.push_back(boxToJson(r.bbox));
        }

        findings.emplace_back("font_size_inconsistency",
                              std::min(settings.font_confidence_cap, std_dev * 2.0),
                              "Font size varies significantly within line " + std::to_string(line_index),
                              nlohmann::json{{"line", line_index},
                                             {"regions", region_boxes},
                                             {"mean_font_size", roundTo(mean)},
                                             {"std_deviation", roundTo(std_dev)},
                                             {"variation_percentage", roundTo(std_dev / mean * 100.0)}},
                              unionOf(boxes));
    }
    return findings;
}

std::vector<Finding> TextLayoutAnalyzer::checkAlignment(const std::vector<TextRegion> &regions,
                                                        const OcrSettings &settings)
{
    std::vector<Finding> findings;
    for (size_t i = 0; i + 1 < regions.size(); ++i)
    {
        for (size_t j = i + 1; j < regions.size(); ++j)
        {
            const TextRegion &a = regions[i];
            const TextRegion &b = regions[j];

            int overlap = std::max(0, std::min(a.bbox.y + a.bbox.height, b.bbox.y + b.bbox.height) -
                                          std::max(a.bbox.y, b.bbox.y));
            int min_height = std::min(a.bbox.height, b.bbox.height);
            if (!(overlap > min_height * settings.overlap_ratio))
                continue;
            if (a.line_id != b.line_id)
                continue;

            int difference = std::abs(a.bbox.x - b.bbox.x);
            if (difference <= settings.alignment_tolerance_px)
                continue;

            findings.emplace_back("alignment_inconsistency", settings.alignment_confidence,
                                  "Text blocks on same line have different alignments",
                                  nlohmann::json{{"regions", {boxToJson(a.bbox), boxToJson(b.bbox)}},
                                                 {"block1_text", a.text.substr(0, 20)},
                                                 {"block2_text", b.text.substr(0, 20)},
                                                 {"x_positions", {a.bbox.x, b.bbox.x}},
                                                 {"difference", difference}},
                                  unionOf({a.bbox, b.bbox}));
        }
    }
    return findings;
}

std::vector<Finding> TextLayoutAnalyzer::checkSpacing(const std::vector<TextRegion> &regions,
                                                      const OcrSettings &settings)
{
    std::vector<Finding> findings;
    for (size_t i = 0; i + 1 < regions.size(); ++i)
    {
        const TextRegion &a = regions[i];
        const TextRegion &b = regions[i + 1];

        int gap = b.bbox.x - (a.bbox.x + a.bbox.width);
        if (gap <= settings.spacing_gap_px)
            continue;

        findings.emplace_back("abnormal_spacing",
                              std::min(settings.spacing_confidence_cap, gap / 10.0),
                              "Abnormally large gap between text blocks",
                              nlohmann::json{{"regions", {boxToJson(a.bbox), boxToJson(b.bbox)}},
                                             {"gap_pixels", gap},
                                             {"block1_text", a.text.substr(0, 20)},
                                             {"block2_text", b.text.substr(0, 20)}},
                              unionOf({a.bbox, b.bbox}));
    }
    return findings;
}

std::vector<Finding> TextLayoutAnalyzer::checkMixedFormatting(const std::vector<TextRegion> &regions,
                                                              const OcrSettings &settings)
{
    std::vector<Finding> findings;
    for (const auto &region : regions)
    {
        const std::string &text = region.text;
        if (text.size() <= 3 || text.size() >= 10)
            continue;

        bool has_lower = std::any_of(text.begin(), text.end(), [](unsigned char c)
                                     { return std::islower(c); });
        bool has_upper = std::any_of(text.begin(), text.end(), [](unsigned char c)
                                     { return std::isupper(c); });
        bool starts_upper = std::isupper(static_cast<unsigned char>(text[0])) != 0;

        // has_lower already rules out an all-uppercase word
        if (!has_lower || !has_upper || starts_upper)
            continue;

        findings.emplace_back("mixed_formatting", settings.mixed_formatting_confidence,
                              "Mixed character formatting in text: '" + text.substr(0, 30) + "'",
                              nlohmann::json{{"text", text}, {"length", text.size()}},
                              region.bbox);
    }
    return findings;
}

double TextLayoutAnalyzer::scoreInconsistencies(const std::vector<Finding> &findings, size_t region_count)
{
    if (region_count == 0)
        return 0.0;

    if (findings.empty())
    {
        return clampConfidence(100.0 - 2.0 * static_cast<double>(region_count));
    }

    double count_score = std::min(100.0, 20.0 * static_cast<double>(findings.size()));
    double severity = 0.0;
    for (const auto &f : findings)
        severity += f.confidence;
    severity /= static_cast<double>(findings.size());

    return clampConfidence(count_score * 0.4 + severity * 0.6);
}

std::string TextLayoutAnalyzer::summarize(const std::vector<Finding> &findings, double overall_confidence)
{
    if (findings.empty())
    {
        if (overall_confidence < 30)
            return "No text inconsistencies detected. Document formatting appears consistent.";
        return "Minor text anomalies detected. Document likely authentic.";
    }

    if (findings.size() >= 3)
        return "Multiple text inconsistencies detected (" + std::to_string(findings.size()) +
               " issues). Document shows signs of text editing or manipulation.";
    if (findings.size() == 2)
        return "Two text inconsistencies detected. Document may have been altered.";

    const std::string &kind = findings.front().kind;
    if (kind.find("font") != std::string::npos)
        return "Font inconsistency detected. Text appears to have been edited.";
    if (kind.find("alignment") != std::string::npos)
        return "Alignment inconsistency detected. Document formatting appears inconsistent.";
    return "Text inconsistency detected. Further verification recommended.";
}

cv::Mat TextLayoutAnalyzer::renderTextRegions(const cv::Mat &image, const std::vector<TextRegion> &regions)
{
    cv::Mat canvas = VisualOverlay::toBgr(image);
    for (const auto &region : regions)
    {
        VisualOverlay::drawLabeledBox(canvas, region.bbox, VisualOverlay::confidenceColor(region.confidence, 70, 40),
                                      2, region.text.substr(0, 15), 0.5, 1);
    }
    return canvas;
}
