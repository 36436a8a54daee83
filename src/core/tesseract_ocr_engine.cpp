#include "core/ocr_engine.hpp"
#include "core/forensic_errors.hpp"
#include "logging/logger.hpp"
#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>
#include <opencv2/imgproc.hpp>
#include <memory>

std::vector<OcrWord> TesseractOcrEngine::detect(const cv::Mat &image, const OcrConfig &config)
{
    if (image.empty())
    {
        throw AnalyzerFailure("Empty image passed to OCR");
    }

    cv::Mat input;
    if (image.channels() == 1)
    {
        input = image;
    }
    else if (image.channels() == 4)
    {
        cv::cvtColor(image, input, cv::COLOR_BGRA2RGB);
    }
    else
    {
        cv::cvtColor(image, input, cv::COLOR_BGR2RGB);
    }
    if (!input.isContinuous())
    {
        input = input.clone();
    }

    auto api = std::make_unique<tesseract::TessBaseAPI>();
    const char *datapath = config.tessdata_path.empty() ? nullptr : config.tessdata_path.c_str();
    int rc = api->Init(datapath, config.language.c_str(),
                       static_cast<tesseract::OcrEngineMode>(config.ocr_engine_mode));
    if (rc != 0)
    {
        throw AnalyzerFailure("Failed to initialize Tesseract with language: " + config.language);
    }

    api->SetPageSegMode(static_cast<tesseract::PageSegMode>(config.page_segmentation_mode));
    api->SetImage(input.data, input.cols, input.rows, input.channels(), static_cast<int>(input.step));

    // Must call Recognize before GetIterator
    if (api->Recognize(nullptr) != 0)
    {
        api->End();
        throw AnalyzerFailure("Tesseract recognition failed");
    }

    std::vector<OcrWord> words;
    std::unique_ptr<tesseract::ResultIterator> ri(api->GetIterator());
    const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;

    int block = 0;
    int paragraph = 0;
    int line = 0;
    if (ri)
    {
        do
        {
            if (ri->IsAtBeginningOf(tesseract::RIL_BLOCK))
            {
                ++block;
                paragraph = 0;
                line = 0;
            }
            if (ri->IsAtBeginningOf(tesseract::RIL_PARA))
            {
                ++paragraph;
                line = 0;
            }
            if (ri->IsAtBeginningOf(tesseract::RIL_TEXTLINE))
            {
                ++line;
            }
            if (ri->Empty(level))
                continue;

            std::unique_ptr<char[]> text(ri->GetUTF8Text(level));
            int x1 = 0, y1 = 0, x2 = 0, y2 = 0;
            if (!ri->BoundingBox(level, &x1, &y1, &x2, &y2))
                continue;

            OcrWord word;
            word.bbox = BoundingBox(x1, y1, x2 - x1, y2 - y1);
            word.text = text ? std::string(text.get()) : std::string();
            word.confidence = ri->Confidence(level);
            word.block_id = block;
            word.paragraph_id = paragraph;
            word.line_id = line;
            words.push_back(std::move(word));
        } while (ri->Next(level));
    }

    ri.reset();
    api->End();

    Logger::debug("Tesseract recognized " + std::to_string(words.size()) + " words");
    return words;
}

std::string TesseractOcrEngine::version()
{
    return tesseract::TessBaseAPI::Version();
}
