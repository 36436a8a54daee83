#pragma once

#include "core/forensic_result.hpp"
#include <ctime>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Renders FusionResults as JSON.
 *
 * buildReport() produces the persisted report document; its field names and
 * nesting are an external contract and must not change.
 */
class ReportFormatter
{
public:
    static constexpr const char *kAnalysisVersion = "1.0";

    /**
     * @brief The document_forensics_report structure, stamped with the current local time
     */
    static nlohmann::json buildReport(const FusionResult &result);
    static nlohmann::json buildReport(const FusionResult &result, std::time_t generated_at);

    /**
     * @brief Full result including per-signal findings, details and errors
     */
    static nlohmann::json toJson(const FusionResult &result);

    static nlohmann::json findingToJson(const SourcedFinding &finding);
    static nlohmann::json findingToJson(const Finding &finding);

    // Human readable signal name ("Error Level Analysis", ...)
    static std::string signalDisplayName(SignalName name);

    // Local time as "%Y-%m-%d %H:%M:%S"
    static std::string formatTimestamp(std::time_t time);
};
