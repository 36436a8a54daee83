#include "core/forensic_result.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

SignalResult SignalResult::completed(double confidence, std::vector<Finding> findings,
                                     std::string summary, nlohmann::json details)
{
    SignalResult result;
    result.overall_confidence = clampConfidence(confidence);
    result.findings = std::move(findings);
    result.summary = std::move(summary);
    result.status = SignalStatus::COMPLETED;
    result.details = std::move(details);
    return result;
}

SignalResult SignalResult::failed(SignalStatus status, const std::string &message)
{
    SignalResult result;
    result.status = status == SignalStatus::COMPLETED ? SignalStatus::ERROR : status;
    result.overall_confidence = 0.0;
    result.summary = message;
    return result;
}

const SignalResult &FusionResult::signal(SignalName name) const
{
    auto it = per_signal.find(name);
    if (it == per_signal.end())
    {
        throw std::out_of_range("No result recorded for signal " + toString(name));
    }
    return it->second;
}

std::string toString(SignalName name)
{
    switch (name)
    {
    case SignalName::ELA:
        return "ela";
    case SignalName::OCR:
        return "ocr";
    case SignalName::METADATA:
        return "metadata";
    }
    return "unknown";
}

std::string toString(SignalStatus status)
{
    switch (status)
    {
    case SignalStatus::COMPLETED:
        return "completed";
    case SignalStatus::TIMEOUT:
        return "timeout";
    case SignalStatus::ERROR:
        return "error";
    }
    return "error";
}

std::string toString(Verdict verdict)
{
    switch (verdict)
    {
    case Verdict::HIGHLY_SUSPICIOUS:
        return "HIGHLY_SUSPICIOUS";
    case Verdict::SUSPICIOUS:
        return "SUSPICIOUS";
    case Verdict::MODERATELY_SUSPICIOUS:
        return "MODERATELY_SUSPICIOUS";
    case Verdict::SLIGHTLY_SUSPICIOUS:
        return "SLIGHTLY_SUSPICIOUS";
    case Verdict::NEEDS_REVIEW:
        return "NEEDS_REVIEW";
    case Verdict::LIKELY_AUTHENTIC:
        return "LIKELY_AUTHENTIC";
    case Verdict::PROCESSING_ERROR:
        return "PROCESSING_ERROR";
    }
    return "PROCESSING_ERROR";
}

std::string signalLabel(SignalName name)
{
    switch (name)
    {
    case SignalName::ELA:
        return "ELA";
    case SignalName::OCR:
        return "OCR";
    case SignalName::METADATA:
        return "Metadata";
    }
    return "Unknown";
}

const std::vector<SignalName> &allSignals()
{
    static const std::vector<SignalName> signals = {SignalName::ELA, SignalName::OCR, SignalName::METADATA};
    return signals;
}

double clampConfidence(double value)
{
    if (std::isnan(value))
        return 0.0;
    return std::min(100.0, std::max(0.0, value));
}

double roundTo(double value, int decimals)
{
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}
