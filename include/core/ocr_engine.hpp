#pragma once

#include "core/forensic_result.hpp"
#include "core/forensics_config.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

/**
 * @brief One recognized word, numbered the way Tesseract's TSV output numbers it
 * (block from 1, paragraph within block from 1, line within paragraph from 1)
 */
struct OcrWord
{
    BoundingBox bbox;
    std::string text;
    double confidence = 0.0; // 0-100
    int block_id = 0;
    int paragraph_id = 0;
    int line_id = 0;
};

struct OcrConfig
{
    int page_segmentation_mode = 6;
    int ocr_engine_mode = 3;
    std::string language = "eng";
    std::string tessdata_path; // Empty: TESSDATA_PREFIX or the library default

    static OcrConfig fromSettings(const OcrSettings &settings)
    {
        OcrConfig config;
        config.page_segmentation_mode = settings.page_segmentation_mode;
        config.ocr_engine_mode = settings.ocr_engine_mode;
        config.language = settings.language;
        config.tessdata_path = settings.tessdata_path;
        return config;
    }
};

/**
 * @brief Word-level text detection capability
 */
class OcrEngine
{
public:
    virtual ~OcrEngine() = default;

    /**
     * @brief Recognize words in an 8-bit image
     * @throws AnalyzerFailure when the engine cannot be initialized or recognition fails
     */
    virtual std::vector<OcrWord> detect(const cv::Mat &image, const OcrConfig &config) = 0;
};

/**
 * @brief OcrEngine backed by Tesseract. Every call builds its own TessBaseAPI,
 * so one instance may serve concurrent documents.
 */
class TesseractOcrEngine : public OcrEngine
{
public:
    std::vector<OcrWord> detect(const cv::Mat &image, const OcrConfig &config) override;

    static std::string version();
};
