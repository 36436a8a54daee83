#include "core/report_formatter.hpp"
#include <iomanip>
#include <sstream>

namespace
{
    nlohmann::json bboxToJson(const BoundingBox &bbox)
    {
        return nlohmann::json::array({bbox.x, bbox.y, bbox.width, bbox.height});
    }
}

nlohmann::json ReportFormatter::buildReport(const FusionResult &result)
{
    return buildReport(result, std::time(nullptr));
}

nlohmann::json ReportFormatter::buildReport(const FusionResult &result, std::time_t generated_at)
{
    nlohmann::json signal_analysis = nlohmann::json::object();
    for (SignalName name : allSignals())
    {
        auto it = result.per_signal.find(name);
        if (it == result.per_signal.end())
        {
            signal_analysis[toString(name)] = {
                {"confidence", 0.0},
                {"summary", "Analysis failed"},
                {"findings_count", 0},
                {"status", toString(SignalStatus::ERROR)}};
            continue;
        }

        const SignalResult &signal = it->second;
        signal_analysis[toString(name)] = {
            {"confidence", roundTo(signal.overall_confidence)},
            {"summary", signal.summary},
            {"findings_count", signal.findings.size()},
            {"status", toString(signal.status)}};
    }

    nlohmann::json detailed_findings = nlohmann::json::array();
    for (const auto &finding : result.combined_findings)
    {
        detailed_findings.push_back(findingToJson(finding));
    }

    nlohmann::json report;
    report["document_forensics_report"] = {
        {"metadata",
         {{"generated_at", formatTimestamp(generated_at)},
          {"document_id", result.document_id},
          {"analysis_version", kAnalysisVersion}}},
        {"overall_assessment",
         {{"confidence", result.overall_confidence},
          {"uncertainty", result.uncertainty},
          {"verdict", toString(result.verdict)},
          {"processing_time", result.processing_time_seconds}}},
        {"signal_analysis", signal_analysis},
        {"detailed_findings", detailed_findings},
        {"recommendations", result.recommendations}};
    return report;
}

nlohmann::json ReportFormatter::toJson(const FusionResult &result)
{
    nlohmann::json signals = nlohmann::json::object();
    nlohmann::json signal_confidences = nlohmann::json::object();
    for (const auto &[name, signal] : result.per_signal)
    {
        nlohmann::json findings = nlohmann::json::array();
        for (const auto &finding : signal.findings)
        {
            findings.push_back(findingToJson(finding));
        }

        signals[toString(name)] = {
            {"name", signalDisplayName(name)},
            {"confidence", roundTo(signal.overall_confidence)},
            {"summary", signal.summary},
            {"status", toString(signal.status)},
            {"findings", findings},
            {"details", signal.details}};
        signal_confidences[toString(name)] = roundTo(signal.overall_confidence);
    }

    nlohmann::json combined = nlohmann::json::array();
    for (const auto &finding : result.combined_findings)
    {
        combined.push_back(findingToJson(finding));
    }

    return {
        {"document_id", result.document_id},
        {"overall_confidence", result.overall_confidence},
        {"uncertainty", result.uncertainty},
        {"verdict", toString(result.verdict)},
        {"signals", signals},
        {"signal_confidences", signal_confidences},
        {"combined_findings", combined},
        {"recommendations", result.recommendations},
        {"errors", result.errors},
        {"processing_time", result.processing_time_seconds}};
}

nlohmann::json ReportFormatter::findingToJson(const SourcedFinding &finding)
{
    nlohmann::json json = findingToJson(finding.finding);
    json["type"] = signalLabel(finding.signal);
    json["signal"] = toString(finding.signal);
    return json;
}

nlohmann::json ReportFormatter::findingToJson(const Finding &finding)
{
    nlohmann::json json = {
        {"kind", finding.kind},
        {"confidence", roundTo(finding.confidence)},
        {"description", finding.description},
        {"details", finding.details}};
    if (finding.bbox)
    {
        json["bbox"] = bboxToJson(*finding.bbox);
    }
    return json;
}

std::string ReportFormatter::signalDisplayName(SignalName name)
{
    switch (name)
    {
    case SignalName::ELA:
        return "Error Level Analysis";
    case SignalName::OCR:
        return "Text Inconsistency";
    case SignalName::METADATA:
        return "Metadata Forensics";
    }
    return "Unknown";
}

std::string ReportFormatter::formatTimestamp(std::time_t time)
{
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}
