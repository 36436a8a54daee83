#pragma once

#include "core/signal_analyzer.hpp"
#include "core/ocr_engine.hpp"
#include "core/forensic_errors.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Test doubles for the fusion engine and the text-layout analyzer

/**
 * @brief Returns a fixed SignalResult, optionally after a delay or by throwing, and counts calls
 */
class StubAnalyzer : public SignalAnalyzer
{
public:
    enum class Behavior
    {
        RETURN_RESULT,
        THROW_STD,
        THROW_TIMEOUT,
        THROW_UNKNOWN
    };

    StubAnalyzer(SignalName name, SignalResult result)
        : name_(name), result_(std::move(result)) {}

    static std::shared_ptr<StubAnalyzer> withConfidence(SignalName name, double confidence,
                                                        std::vector<Finding> findings = {})
    {
        return std::make_shared<StubAnalyzer>(
            name, SignalResult::completed(confidence, std::move(findings), "stub " + toString(name)));
    }

    SignalName signal() const override { return name_; }

    SignalResult analyze(const std::string &) override
    {
        calls_.fetch_add(1);

        if (delay_.count() > 0)
            std::this_thread::sleep_for(delay_);
        completions_.fetch_add(1);

        switch (behavior_)
        {
        case Behavior::THROW_STD:
            throw std::runtime_error(error_message_);
        case Behavior::THROW_TIMEOUT:
            throw AnalyzerTimeout(error_message_);
        case Behavior::THROW_UNKNOWN:
            throw 42;
        case Behavior::RETURN_RESULT:
            break;
        }
        return result_;
    }

    void setDelay(std::chrono::milliseconds delay) { delay_ = delay; }

    void setThrows(const std::string &message)
    {
        behavior_ = Behavior::THROW_STD;
        error_message_ = message;
    }

    void setThrowsTimeout(const std::string &message)
    {
        behavior_ = Behavior::THROW_TIMEOUT;
        error_message_ = message;
    }

    void setThrowsUnknown() { behavior_ = Behavior::THROW_UNKNOWN; }

    int calls() const { return calls_.load(); }

    // Calls that got past the delay
    int completions() const { return completions_.load(); }

private:
    SignalName name_;
    SignalResult result_;
    std::chrono::milliseconds delay_{0};
    Behavior behavior_ = Behavior::RETURN_RESULT;
    std::string error_message_;
    std::atomic<int> calls_{0};
    std::atomic<int> completions_{0};
};

/**
 * @brief OcrEngine returning canned words and recording the config it was called with
 */
class FakeOcrEngine : public OcrEngine
{
public:
    explicit FakeOcrEngine(std::vector<OcrWord> words = {}) : words_(std::move(words)) {}

    std::vector<OcrWord> detect(const cv::Mat &image, const OcrConfig &config) override
    {
        calls_.fetch_add(1);
        last_config_ = config;
        last_image_size_ = image.size();
        if (fail_)
            throw std::runtime_error("OCR engine unavailable");
        return words_;
    }

    void setFails(bool fail) { fail_ = fail; }

    int calls() const { return calls_.load(); }

    // Calls that got past the delay
    int completions() const { return completions_.load(); }
    const OcrConfig &lastConfig() const { return last_config_; }
    cv::Size lastImageSize() const { return last_image_size_; }

private:
    std::vector<OcrWord> words_;
    bool fail_ = false;
    std::atomic<int> calls_{0};
    OcrConfig last_config_;
    cv::Size last_image_size_;
};

inline OcrWord makeWord(const std::string &text, int x, int y, int width, int height,
                        double confidence = 90.0, int line_id = 1, int block_id = 1, int paragraph_id = 1)
{
    OcrWord word;
    word.bbox = BoundingBox(x, y, width, height);
    word.text = text;
    word.confidence = confidence;
    word.line_id = line_id;
    word.block_id = block_id;
    word.paragraph_id = paragraph_id;
    return word;
}
