#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief The three independent forensic signals, in fusion order
 */
enum class SignalName
{
    ELA,
    OCR,
    METADATA
};

enum class SignalStatus
{
    COMPLETED,
    TIMEOUT,
    ERROR
};

/**
 * @brief Final categorical judgment, ordered by severity
 */
enum class Verdict
{
    HIGHLY_SUSPICIOUS,
    SUSPICIOUS,
    MODERATELY_SUSPICIOUS,
    SLIGHTLY_SUSPICIOUS,
    NEEDS_REVIEW,
    LIKELY_AUTHENTIC,
    PROCESSING_ERROR
};

struct BoundingBox
{
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    BoundingBox() = default;
    BoundingBox(int x_, int y_, int w, int h) : x(x_), y(y_), width(w), height(h) {}

    bool operator==(const BoundingBox &other) const
    {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
};

/**
 * @brief One detected anomaly
 */
struct Finding
{
    std::string kind;                            // e.g. "ela_region", "font_size_inconsistency"
    double confidence = 0.0;                     // 0-100
    std::string description;
    std::optional<BoundingBox> bbox;
    nlohmann::json details = nlohmann::json::object();

    Finding() = default;
    Finding(std::string k, double c, std::string d,
            nlohmann::json det = nlohmann::json::object(),
            std::optional<BoundingBox> box = std::nullopt)
        : kind(std::move(k)), confidence(c), description(std::move(d)), bbox(box), details(std::move(det)) {}
};

/**
 * @brief Output of one analyzer.
 *
 * A non-completed result always carries zero confidence and no findings;
 * use failed() to build one.
 */
struct SignalResult
{
    double overall_confidence = 0.0;
    std::vector<Finding> findings;
    std::string summary;
    SignalStatus status = SignalStatus::COMPLETED;
    nlohmann::json details = nlohmann::json::object(); // Analyzer-specific audit data

    bool isCompleted() const { return status == SignalStatus::COMPLETED; }

    static SignalResult completed(double confidence, std::vector<Finding> findings,
                                  std::string summary,
                                  nlohmann::json details = nlohmann::json::object());
    static SignalResult failed(SignalStatus status, const std::string &message);
};

/**
 * @brief A finding tagged with the signal that produced it
 */
struct SourcedFinding
{
    SignalName signal = SignalName::ELA;
    Finding finding;
};

/**
 * @brief The pipeline's output for one document
 */
struct FusionResult
{
    std::string document_id;
    double overall_confidence = 0.0;
    double uncertainty = 100.0;
    Verdict verdict = Verdict::PROCESSING_ERROR;
    std::map<SignalName, SignalResult> per_signal;
    std::vector<SourcedFinding> combined_findings;
    std::vector<std::string> recommendations;
    std::vector<std::string> errors;
    double processing_time_seconds = 0.0;

    const SignalResult &signal(SignalName name) const;
};

// Canonical lower-case key ("ela", "ocr", "metadata")
std::string toString(SignalName name);
std::string toString(SignalStatus status);
std::string toString(Verdict verdict);

// Short label used in combined findings ("ELA", "OCR", "Metadata")
std::string signalLabel(SignalName name);

const std::vector<SignalName> &allSignals();

double clampConfidence(double value);
double roundTo(double value, int decimals = 2);
