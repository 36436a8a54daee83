#pragma once

#include "core/signal_analyzer.hpp"
#include "core/forensics_config.hpp"
#include "core/cache/result_cache.hpp"
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Accumulated pipeline statistics
 */
struct ProcessingStats
{
    size_t documents_processed = 0;
    double average_processing_time = 0.0; // Seconds, over computed documents
    size_t cache_size = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Runs the three forensic signals for a document and fuses them into one verdict.
 *
 * Each signal runs on its own thread with an independent timeout; a timed
 * out or failing signal is replaced by a zero-confidence placeholder and
 * never aborts the others. A timed out worker keeps running until its
 * analyzer returns and is joined at the latest when the engine is destroyed.
 * Results are cached per document id with single-flight semantics, so
 * concurrent calls for the same id run the pipeline once. process() never throws.
 */
class SignalFusionEngine
{
public:
    using SignalResults = std::map<SignalName, SignalResult>;
    using DocumentRequest = std::pair<std::string, std::string>; // (document_id, image_path)

    /**
     * @throws std::invalid_argument if an analyzer is null
     */
    SignalFusionEngine(std::shared_ptr<SignalAnalyzer> ela,
                       std::shared_ptr<SignalAnalyzer> ocr,
                       std::shared_ptr<SignalAnalyzer> metadata,
                       const FusionSettings &settings = FusionSettings{});

    /**
     * @brief Blocks until every timed out worker has returned
     */
    ~SignalFusionEngine();

    SignalFusionEngine(const SignalFusionEngine &) = delete;
    SignalFusionEngine &operator=(const SignalFusionEngine &) = delete;

    /**
     * @brief Engine wired with the production analyzers and a Tesseract OCR engine
     */
    static std::unique_ptr<SignalFusionEngine> createDefault(const ForensicsConfig &config);

    /**
     * @brief Analyze one prepared image, or return the cached result for document_id
     * @return A well-formed FusionResult; PROCESSING_ERROR when the pipeline itself failed
     */
    FusionResult process(const std::string &document_id, const std::string &image_path);

    /**
     * @brief Process many documents in parallel on the TBB pool
     * @return Results in request order
     */
    std::vector<FusionResult> processBatch(const std::vector<DocumentRequest> &documents);

    ProcessingStats getProcessingStats() const;

    /**
     * @brief Administrative reset of the result cache and the timing statistics
     */
    void clearCache();

    const ResultCache &cache() const { return cache_; }

    /**
     * @brief Deterministic fusion of already collected signal results
     */
    static FusionResult fuse(const std::string &document_id, const SignalResults &signals,
                             std::vector<std::string> errors, const FusionSettings &settings);

    static double fuseConfidence(const SignalResults &signals, const FusionSettings &settings);

    /**
     * @brief Threshold ladder on the fused confidence. Below the lowest rung a
     * single signal (or one of its findings) above the review threshold turns
     * LIKELY_AUTHENTIC into NEEDS_REVIEW. No completed signal at all gives PROCESSING_ERROR.
     */
    static Verdict classifyVerdict(double overall_confidence, const SignalResults &signals,
                                   const FusionSettings &settings);

    /**
     * @brief All findings tagged with their signal, sorted by descending confidence
     * (stable, so ties keep ELA, OCR, Metadata order) and truncated
     */
    static std::vector<SourcedFinding> combineFindings(const SignalResults &signals, size_t max_findings);

    /**
     * @brief Verdict tier recommendations plus signal-specific ones,
     * deduplicated in insertion order and capped
     */
    static std::vector<std::string> synthesizeRecommendations(Verdict verdict, const SignalResults &signals,
                                                              const FusionSettings &settings);

    static FusionResult buildErrorResult(const std::string &document_id, const std::string &error_message);

private:
    // A timed out worker; done only signals completion and is never read
    struct AbandonedWorker
    {
        std::thread thread;
        std::future<SignalResult> done;
    };

    FusionResult compute(const std::string &document_id, const std::string &image_path);

    /**
     * @throws PipelineFailure when the image cannot be opened at all
     */
    static void checkPreconditions(const std::string &image_path);

    SignalResults runSignals(const std::string &image_path, std::vector<std::string> &errors) const;

    std::shared_ptr<SignalAnalyzer> analyzerFor(SignalName name) const;

    /**
     * @brief Take ownership of a timed out worker and join the ones that have since finished
     */
    void abandonWorker(std::thread worker, std::future<SignalResult> done) const;

    std::shared_ptr<SignalAnalyzer> ela_;
    std::shared_ptr<SignalAnalyzer> ocr_;
    std::shared_ptr<SignalAnalyzer> metadata_;
    FusionSettings settings_;

    ResultCache cache_;

    mutable std::mutex stats_mutex_;
    std::unordered_map<std::string, double> processing_times_;

    mutable std::mutex abandoned_mutex_;
    mutable std::vector<AbandonedWorker> abandoned_workers_;
};
