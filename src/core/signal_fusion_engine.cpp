#include "core/signal_fusion_engine.hpp"
#include "core/compression_artifact_analyzer.hpp"
#include "core/text_layout_analyzer.hpp"
#include "core/metadata_anomaly_analyzer.hpp"
#include "core/forensic_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>

namespace
{
    const char *const kProcessingFailedRecommendation =
        "Processing failed. Please try again or upload a different document.";

    const std::vector<std::string> &tierRecommendations(Verdict verdict)
    {
        static const std::vector<std::string> suspicious = {
            "Verify document with issuing authority",
            "Cross-check dates and amounts with original records",
            "Request certified copy for comparison"};
        static const std::vector<std::string> moderate = {
            "Review highlighted regions carefully",
            "Check for supporting documentation",
            "Consider digital signature verification"};
        static const std::vector<std::string> slight = {
            "Minor anomalies detected - review if critical document",
            "Check for scanning artifacts",
            "Verify metadata consistency"};
        static const std::vector<std::string> authentic = {
            "Document appears authentic. No immediate action required."};
        static const std::vector<std::string> failed = {kProcessingFailedRecommendation};

        switch (verdict)
        {
        case Verdict::HIGHLY_SUSPICIOUS:
        case Verdict::SUSPICIOUS:
            return suspicious;
        case Verdict::MODERATELY_SUSPICIOUS:
            return moderate;
        case Verdict::SLIGHTLY_SUSPICIOUS:
            return slight;
        case Verdict::NEEDS_REVIEW:
        case Verdict::LIKELY_AUTHENTIC:
            return authentic;
        case Verdict::PROCESSING_ERROR:
            break;
        }
        return failed;
    }

    double weightFor(SignalName name, const FusionSettings &settings)
    {
        switch (name)
        {
        case SignalName::ELA:
            return settings.ela_weight;
        case SignalName::OCR:
            return settings.ocr_weight;
        case SignalName::METADATA:
            return settings.metadata_weight;
        }
        return 0.0;
    }

    struct SignalTask
    {
        SignalName name = SignalName::ELA;
        std::future<SignalResult> future;
        std::thread worker;
    };
}

nlohmann::json ProcessingStats::toJson() const
{
    return {
        {"documents_processed", documents_processed},
        {"average_processing_time", average_processing_time},
        {"cache_size", cache_size}};
}

SignalFusionEngine::SignalFusionEngine(std::shared_ptr<SignalAnalyzer> ela,
                                       std::shared_ptr<SignalAnalyzer> ocr,
                                       std::shared_ptr<SignalAnalyzer> metadata,
                                       const FusionSettings &settings)
    : ela_(std::move(ela)), ocr_(std::move(ocr)), metadata_(std::move(metadata)), settings_(settings)
{
    if (!ela_ || !ocr_ || !metadata_)
    {
        throw std::invalid_argument("SignalFusionEngine requires all three analyzers");
    }
}

SignalFusionEngine::~SignalFusionEngine()
{
    std::lock_guard<std::mutex> lock(abandoned_mutex_);
    if (!abandoned_workers_.empty())
    {
        Logger::debug("Waiting for " + std::to_string(abandoned_workers_.size()) + " timed out analysis threads");
    }
    for (auto &worker : abandoned_workers_)
    {
        if (worker.thread.joinable())
            worker.thread.join();
    }
}

std::unique_ptr<SignalFusionEngine> SignalFusionEngine::createDefault(const ForensicsConfig &config)
{
    config.validate();

    auto ela = std::make_shared<CompressionArtifactAnalyzer>(config.ela);
    auto ocr = std::make_shared<TextLayoutAnalyzer>(std::make_shared<TesseractOcrEngine>(), config.ocr);
    auto metadata = std::make_shared<MetadataAnomalyAnalyzer>(config.metadata);

    Logger::debug("Fusion engine created with OCR backend: " + TesseractOcrEngine::version());
    return std::make_unique<SignalFusionEngine>(ela, ocr, metadata, config.fusion);
}

FusionResult SignalFusionEngine::process(const std::string &document_id, const std::string &image_path)
{
    try
    {
        bool computed = false;
        FusionResult result = cache_.getOrCompute(
            document_id, [this, &document_id, &image_path]()
            { return compute(document_id, image_path); },
            &computed);

        if (computed)
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            processing_times_[document_id] = result.processing_time_seconds;
        }
        return result;
    }
    catch (const std::exception &e)
    {
        Logger::error("Processing of document " + document_id + " failed: " + std::string(e.what()));
        return buildErrorResult(document_id, e.what());
    }
}

std::vector<FusionResult> SignalFusionEngine::processBatch(const std::vector<DocumentRequest> &documents)
{
    std::vector<FusionResult> results(documents.size());
    if (documents.empty())
        return results;

    Logger::info("Processing batch of " + std::to_string(documents.size()) + " documents");

    tbb::parallel_for(tbb::blocked_range<size_t>(0, documents.size()),
                      [&](const tbb::blocked_range<size_t> &range)
                      {
                          for (size_t i = range.begin(); i != range.end(); ++i)
                          {
                              results[i] = process(documents[i].first, documents[i].second);
                          }
                      });

    Logger::info("Batch processing completed");
    return results;
}

ProcessingStats SignalFusionEngine::getProcessingStats() const
{
    ProcessingStats stats;
    stats.cache_size = cache_.size();
    stats.documents_processed = stats.cache_size;

    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (!processing_times_.empty())
    {
        double total = 0.0;
        for (const auto &[id, seconds] : processing_times_)
        {
            total += seconds;
        }
        stats.average_processing_time = total / static_cast<double>(processing_times_.size());
    }
    return stats;
}

void SignalFusionEngine::clearCache()
{
    cache_.clear();
    std::lock_guard<std::mutex> lock(stats_mutex_);
    processing_times_.clear();
}

FusionResult SignalFusionEngine::compute(const std::string &document_id, const std::string &image_path)
{
    const auto start = std::chrono::steady_clock::now();
    auto elapsedSeconds = [&start]()
    {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    Logger::info("Processing document " + document_id + ": " + image_path);

    try
    {
        checkPreconditions(image_path);

        std::vector<std::string> errors;
        SignalResults signals = runSignals(image_path, errors);
        FusionResult result = fuse(document_id, signals, std::move(errors), settings_);

        const double elapsed = elapsedSeconds();
        result.processing_time_seconds = roundTo(elapsed);
        if (elapsed > settings_.pipeline_deadline_seconds)
        {
            Logger::warn("Document " + document_id + " exceeded the pipeline deadline of " +
                         std::to_string(settings_.pipeline_deadline_seconds) + "s (took " +
                         std::to_string(elapsed) + "s)");
        }

        Logger::info("Document " + document_id + " verdict: " + toString(result.verdict) +
                     ", confidence " + std::to_string(result.overall_confidence));
        return result;
    }
    catch (const PipelineFailure &e)
    {
        Logger::error("Pipeline failure for document " + document_id + ": " + std::string(e.what()));
        FusionResult result = buildErrorResult(document_id, e.what());
        result.processing_time_seconds = roundTo(elapsedSeconds());
        return result;
    }
    catch (const std::exception &e)
    {
        Logger::error("Unexpected pipeline error for document " + document_id + ": " + std::string(e.what()));
        FusionResult result = buildErrorResult(document_id, e.what());
        result.processing_time_seconds = roundTo(elapsedSeconds());
        return result;
    }
}

void SignalFusionEngine::checkPreconditions(const std::string &image_path)
{
    if (image_path.empty())
    {
        throw PipelineFailure("No image path given");
    }

    std::ifstream image_file(image_path, std::ios::binary);
    if (!image_file.is_open())
    {
        throw PipelineFailure("Cannot open image: " + image_path);
    }
}

SignalFusionEngine::SignalResults SignalFusionEngine::runSignals(const std::string &image_path,
                                                                 std::vector<std::string> &errors) const
{
    const auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(settings_.signal_timeout_seconds));

    std::vector<SignalTask> tasks;
    tasks.reserve(allSignals().size());

    for (SignalName name : allSignals())
    {
        SignalTask task;
        task.name = name;

        auto promise = std::make_shared<std::promise<SignalResult>>();
        task.future = promise->get_future();
        auto analyzer = analyzerFor(name);

        try
        {
            // The worker owns its analyzer and promise so an abandoned task can finish on its own
            task.worker = std::thread([analyzer, promise, image_path]()
                                      {
                try
                {
                    promise->set_value(analyzer->analyze(image_path));
                }
                catch (...)
                {
                    promise->set_exception(std::current_exception());
                } });
        }
        catch (const std::system_error &e)
        {
            Logger::error("Could not start " + signalLabel(name) + " analysis thread: " + std::string(e.what()));
            promise->set_exception(std::current_exception());
        }

        tasks.push_back(std::move(task));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    SignalResults results;
    for (auto &task : tasks)
    {
        const std::string label = signalLabel(task.name);

        if (task.future.wait_until(deadline) != std::future_status::ready)
        {
            abandonWorker(std::move(task.worker), std::move(task.future));

            Logger::warn(label + " analysis timed out after " +
                         std::to_string(settings_.signal_timeout_seconds) + "s");
            errors.push_back(label + " analysis timeout");
            results[task.name] = SignalResult::failed(SignalStatus::TIMEOUT, "Timeout");
            continue;
        }

        if (task.worker.joinable())
            task.worker.join();

        try
        {
            SignalResult result = task.future.get();
            if (!result.isCompleted())
            {
                const std::string message = result.summary.empty() ? toString(result.status) : result.summary;
                Logger::warn(label + " analysis degraded: " + message);
                errors.push_back(result.status == SignalStatus::TIMEOUT ? label + " analysis timeout"
                                                                        : label + " error: " + message);
                result = SignalResult::failed(result.status, message);
            }
            results[task.name] = std::move(result);
        }
        catch (const AnalyzerTimeout &e)
        {
            Logger::warn(label + " analysis gave up: " + std::string(e.what()));
            errors.push_back(label + " analysis timeout");
            results[task.name] = SignalResult::failed(SignalStatus::TIMEOUT, "Timeout");
        }
        catch (const std::exception &e)
        {
            Logger::warn(label + " analysis failed: " + std::string(e.what()));
            errors.push_back(label + " error: " + std::string(e.what()));
            results[task.name] = SignalResult::failed(SignalStatus::ERROR, e.what());
        }
        catch (...)
        {
            Logger::warn(label + " analysis failed with an unknown error");
            errors.push_back(label + " error: unknown error");
            results[task.name] = SignalResult::failed(SignalStatus::ERROR, "unknown error");
        }
    }

    return results;
}

void SignalFusionEngine::abandonWorker(std::thread worker, std::future<SignalResult> done) const
{
    std::lock_guard<std::mutex> lock(abandoned_mutex_);

    auto finished = std::partition(abandoned_workers_.begin(), abandoned_workers_.end(),
                                   [](const AbandonedWorker &w)
                                   { return w.done.wait_for(std::chrono::seconds(0)) != std::future_status::ready; });
    for (auto it = finished; it != abandoned_workers_.end(); ++it)
    {
        if (it->thread.joinable())
            it->thread.join();
    }
    abandoned_workers_.erase(finished, abandoned_workers_.end());

    abandoned_workers_.push_back(AbandonedWorker{std::move(worker), std::move(done)});
}

std::shared_ptr<SignalAnalyzer> SignalFusionEngine::analyzerFor(SignalName name) const
{
    switch (name)
    {
    case SignalName::ELA:
        return ela_;
    case SignalName::OCR:
        return ocr_;
    case SignalName::METADATA:
        return metadata_;
    }
    return nullptr;
}

FusionResult SignalFusionEngine::fuse(const std::string &document_id, const SignalResults &signals,
                                      std::vector<std::string> errors, const FusionSettings &settings)
{
    FusionResult result;
    result.document_id = document_id;
    result.errors = std::move(errors);

    for (SignalName name : allSignals())
    {
        auto it = signals.find(name);
        result.per_signal[name] = it != signals.end() ? it->second
                                                      : SignalResult::failed(SignalStatus::ERROR, "Analysis not available");
    }

    result.overall_confidence = fuseConfidence(result.per_signal, settings);
    result.uncertainty = std::max(0.0, 100.0 - result.overall_confidence);
    result.verdict = classifyVerdict(result.overall_confidence, result.per_signal, settings);
    result.combined_findings = combineFindings(result.per_signal, static_cast<size_t>(settings.max_findings));
    result.recommendations = synthesizeRecommendations(result.verdict, result.per_signal, settings);
    return result;
}

double SignalFusionEngine::fuseConfidence(const SignalResults &signals, const FusionSettings &settings)
{
    double overall = 0.0;
    for (const auto &[name, signal] : signals)
    {
        if (!signal.isCompleted())
            continue;
        overall += weightFor(name, settings) * clampConfidence(signal.overall_confidence);
    }
    return roundTo(clampConfidence(overall));
}

Verdict SignalFusionEngine::classifyVerdict(double overall_confidence, const SignalResults &signals,
                                            const FusionSettings &settings)
{
    const bool any_completed = std::any_of(signals.begin(), signals.end(), [](const auto &entry)
                                           { return entry.second.isCompleted(); });
    if (!any_completed)
        return Verdict::PROCESSING_ERROR;

    if (overall_confidence >= settings.highly_suspicious_threshold)
        return Verdict::HIGHLY_SUSPICIOUS;
    if (overall_confidence >= settings.suspicious_threshold)
        return Verdict::SUSPICIOUS;
    if (overall_confidence >= settings.moderately_suspicious_threshold)
        return Verdict::MODERATELY_SUSPICIOUS;
    if (overall_confidence >= settings.slightly_suspicious_threshold)
        return Verdict::SLIGHTLY_SUSPICIOUS;

    for (const auto &[name, signal] : signals)
    {
        if (!signal.isCompleted())
            continue;

        if (signal.overall_confidence > settings.review_signal_threshold)
            return Verdict::NEEDS_REVIEW;

        for (const auto &finding : signal.findings)
        {
            if (finding.confidence > settings.review_signal_threshold)
                return Verdict::NEEDS_REVIEW;
        }
    }
    return Verdict::LIKELY_AUTHENTIC;
}

std::vector<SourcedFinding> SignalFusionEngine::combineFindings(const SignalResults &signals, size_t max_findings)
{
    std::vector<SourcedFinding> combined;
    for (SignalName name : allSignals())
    {
        auto it = signals.find(name);
        if (it == signals.end() || !it->second.isCompleted())
            continue;

        for (const auto &finding : it->second.findings)
        {
            SourcedFinding sourced{name, finding};
            sourced.finding.confidence = clampConfidence(finding.confidence);
            combined.push_back(std::move(sourced));
        }
    }

    std::stable_sort(combined.begin(), combined.end(), [](const SourcedFinding &a, const SourcedFinding &b)
                     { return a.finding.confidence > b.finding.confidence; });

    if (combined.size() > max_findings)
        combined.resize(max_findings);
    return combined;
}

std::vector<std::string> SignalFusionEngine::synthesizeRecommendations(Verdict verdict, const SignalResults &signals,
                                                                       const FusionSettings &settings)
{
    std::vector<std::string> candidates = tierRecommendations(verdict);

    if (verdict != Verdict::PROCESSING_ERROR)
    {
        auto ela = signals.find(SignalName::ELA);
        if (ela != signals.end() && ela->second.isCompleted() &&
            ela->second.overall_confidence > settings.ela_recommendation_threshold)
        {
            candidates.emplace_back("High ELA confidence: Document shows clear editing artifacts");
        }

        auto ocr = signals.find(SignalName::OCR);
        if (ocr != signals.end() && ocr->second.isCompleted() &&
            ocr->second.findings.size() >= static_cast<size_t>(settings.layout_recommendation_min_findings))
        {
            candidates.emplace_back("Multiple text inconsistencies: Verify font and formatting");
        }

        auto metadata = signals.find(SignalName::METADATA);
        if (metadata != signals.end() && metadata->second.isCompleted())
        {
            const auto &findings = metadata->second.findings;
            const bool has_date_anomaly = std::any_of(findings.begin(), findings.end(), [](const Finding &finding)
                                                      { return finding.kind.find("date") != std::string::npos; });
            if (has_date_anomaly)
            {
                candidates.emplace_back("Date anomalies: Verify creation and modification dates");
            }
        }
    }

    std::vector<std::string> recommendations;
    const size_t limit = static_cast<size_t>(settings.max_recommendations);
    for (auto &candidate : candidates)
    {
        if (recommendations.size() >= limit)
            break;
        if (std::find(recommendations.begin(), recommendations.end(), candidate) == recommendations.end())
        {
            recommendations.push_back(std::move(candidate));
        }
    }
    return recommendations;
}

FusionResult SignalFusionEngine::buildErrorResult(const std::string &document_id, const std::string &error_message)
{
    FusionResult result;
    result.document_id = document_id;
    result.overall_confidence = 0.0;
    result.uncertainty = 100.0;
    result.verdict = Verdict::PROCESSING_ERROR;
    for (SignalName name : allSignals())
    {
        result.per_signal[name] = SignalResult::failed(SignalStatus::ERROR, "Analysis failed");
    }
    result.errors.push_back(error_message);
    result.recommendations.emplace_back(kProcessingFailedRecommendation);
    return result;
}
