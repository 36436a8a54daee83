#include "test_base.hpp"
#include "stubs/stub_analyzers.hpp"
#include "core/signal_fusion_engine.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <set>
#include <thread>

class SignalFusionEngineTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        image_path_ = createFile("document.png", "placeholder image bytes");
    }

    std::unique_ptr<SignalFusionEngine> makeEngine(std::shared_ptr<StubAnalyzer> ela,
                                                   std::shared_ptr<StubAnalyzer> ocr,
                                                   std::shared_ptr<StubAnalyzer> metadata,
                                                   const FusionSettings &settings = FusionSettings{})
    {
        return std::make_unique<SignalFusionEngine>(ela, ocr, metadata, settings);
    }

    static SignalFusionEngine::SignalResults completedSignals(double ela, double ocr, double metadata)
    {
        return {
            {SignalName::ELA, SignalResult::completed(ela, {}, "ela")},
            {SignalName::OCR, SignalResult::completed(ocr, {}, "ocr")},
            {SignalName::METADATA, SignalResult::completed(metadata, {}, "metadata")}};
    }

    static bool containsText(const std::vector<std::string> &items, const std::string &needle)
    {
        return std::any_of(items.begin(), items.end(), [&](const std::string &item)
                           { return item.find(needle) != std::string::npos; });
    }

    std::string image_path_;
};

TEST_F(SignalFusionEngineTest, WeightedFusionScenarioIsModeratelySuspicious)
{
    auto engine = makeEngine(StubAnalyzer::withConfidence(SignalName::ELA, 90),
                             StubAnalyzer::withConfidence(SignalName::OCR, 10),
                             StubAnalyzer::withConfidence(SignalName::METADATA, 10));

    FusionResult result = engine->process("doc-a", image_path_);

    EXPECT_DOUBLE_EQ(result.overall_confidence, 42.0);
    EXPECT_DOUBLE_EQ(result.uncertainty, 58.0);
    EXPECT_EQ(result.verdict, Verdict::MODERATELY_SUSPICIOUS);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.document_id, "doc-a");
    ASSERT_EQ(result.recommendations.size(), 3u);
    EXPECT_EQ(result.recommendations[0], "Review highlighted regions carefully");
}

TEST_F(SignalFusionEngineTest, StrongFindingInQuietSignalNeedsReview)
{
    std::vector<Finding> ocr_findings = {Finding("font_size_inconsistency", 75.0, "Font size varies")};
    auto engine = makeEngine(StubAnalyzer::withConfidence(SignalName::ELA, 5),
                             StubAnalyzer::withConfidence(SignalName::OCR, 5, ocr_findings),
                             StubAnalyzer::withConfidence(SignalName::METADATA, 5));

    FusionResult result = engine->process("doc-b", image_path_);

    EXPECT_DOUBLE_EQ(result.overall_confidence, 5.0);
    EXPECT_EQ(result.verdict, Verdict::NEEDS_REVIEW);
    ASSERT_EQ(result.combined_findings.size(), 1u);
    EXPECT_EQ(result.combined_findings[0].signal, SignalName::OCR);
}

TEST_F(SignalFusionEngineTest, QuietSignalsAreLikelyAuthentic)
{
    auto engine = makeEngine(StubAnalyzer::withConfidence(SignalName::ELA, 5),
                             StubAnalyzer::withConfidence(SignalName::OCR, 5),
                             StubAnalyzer::withConfidence(SignalName::METADATA, 5));

    FusionResult result = engine->process("doc-quiet", image_path_);

    EXPECT_EQ(result.verdict, Verdict::LIKELY_AUTHENTIC);
    ASSERT_EQ(result.recommendations.size(), 1u);
    EXPECT_EQ(result.recommendations[0], "Document appears authentic. No immediate action required.");
}

TEST_F(SignalFusionEngineTest, VerdictLadderBoundaries)
{
    const FusionSettings settings;
    const auto signals = completedSignals(0, 0, 0);

    EXPECT_EQ(SignalFusionEngine::classifyVerdict(100.0, signals, settings), Verdict::HIGHLY_SUSPICIOUS);
    EXPECT_EQ(SignalFusionEngine::classifyVerdict(80.0, signals, settings), Verdict::HIGHLY_SUSPICIOUS);
    EXPECT_EQ(SignalFusionEngine::classifyVerdict(79.99, signals, settings), Verdict::SUSPICIOUS);
    EXPECT_EQ(SignalFusionEngine::classifyVerdict(60.0, signals, settings), Verdict::SUSPICIOUS);
    EXPECT_EQ(SignalFusionEngine::classifyVerdict(59.99, signals, settings), Verdict::MODERATELY_SUSPICIOUS);
    EXPECT_EQ(SignalFusionEngine::classifyVerdict(40.0, signals, settings), Verdict::MODERATELY_SUSPICIOUS);
    EXPECT_EQ(SignalFusionEngine::classifyVerdict(39.99, signals, settings), Verdict::SLIGHTLY_SUSPICIOUS);
    EXPECT_EQ(SignalFusionEngine::classifyVerdict(20.0, signals, settings), Verdict::SLIGHTLY_SUSPICIOUS);
    EXPECT_EQ(SignalFusionEngine::classifyVerdict(19.99, signals, settings), Verdict::LIKELY_AUTHENTIC);
    EXPECT_EQ(SignalFusionEngine::classifyVerdict(0.0, signals, settings), Verdict::LIKELY_AUTHENTIC);
}

TEST_F(SignalFusionEngineTest, SingleStrongSignalBelowLadderNeedsReview)
{
    const FusionSettings settings;
    auto signals = completedSignals(0, 0, 75);
    EXPECT_EQ(SignalFusionEngine::classifyVerdict(10.0, signals, settings), Verdict::NEEDS_REVIEW);

    // Exactly at the review threshold does not count
    signals = completedSignals(0, 0, 70);
    EXPECT_EQ(SignalFusionEngine::classifyVerdict(10.0, signals, settings), Verdict::LIKELY_AUTHENTIC);
}

TEST_F(SignalFusionEngineTest, SecondCallReturnsCachedResultWithoutRunningAnalyzers)
{
    auto ela = StubAnalyzer::withConfidence(SignalName::ELA, 50);
    auto ocr = StubAnalyzer::withConfidence(SignalName::OCR, 20);
    auto metadata = StubAnalyzer::withConfidence(SignalName::METADATA, 30);
    auto engine = makeEngine(ela, ocr, metadata);

    FusionResult first = engine->process("doc-idem", image_path_);
    FusionResult second = engine->process("doc-idem", image_path_);

    EXPECT_EQ(ela->calls(), 1);
    EXPECT_EQ(ocr->calls(), 1);
    EXPECT_EQ(metadata->calls(), 1);

    EXPECT_EQ(second.document_id, first.document_id);
    EXPECT_DOUBLE_EQ(second.overall_confidence, first.overall_confidence);
    EXPECT_DOUBLE_EQ(second.uncertainty, first.uncertainty);
    EXPECT_DOUBLE_EQ(second.processing_time_seconds, first.processing_time_seconds);
    EXPECT_EQ(second.verdict, first.verdict);
    EXPECT_EQ(second.recommendations, first.recommendations);
    EXPECT_EQ(second.errors, first.errors);

    ProcessingStats stats = engine->getProcessingStats();
    EXPECT_EQ(stats.documents_processed, 1u);
    EXPECT_EQ(stats.cache_size, 1u);
}

TEST_F(SignalFusionEngineTest, ClearCacheForcesRecomputation)
{
    auto ela = StubAnalyzer::withConfidence(SignalName::ELA, 50);
    auto engine = makeEngine(ela, StubAnalyzer::withConfidence(SignalName::OCR, 20),
                             StubAnalyzer::withConfidence(SignalName::METADATA, 30));

    engine->process("doc-clear", image_path_);
    engine->clearCache();

    ProcessingStats cleared = engine->getProcessingStats();
    EXPECT_EQ(cleared.cache_size, 0u);
    EXPECT_DOUBLE_EQ(cleared.average_processing_time, 0.0);
    EXPECT_FALSE(engine->cache().contains("doc-clear"));

    engine->process("doc-clear", image_path_);
    EXPECT_EQ(ela->calls(), 2);
}

TEST_F(SignalFusionEngineTest, TimedOutSignalDegradesWithoutBlockingOthers)
{
    FusionSettings settings;
    settings.signal_timeout_seconds = 0.2;

    auto slow_ocr = StubAnalyzer::withConfidence(SignalName::OCR, 99);
    slow_ocr->setDelay(std::chrono::milliseconds(2000));

    auto engine = makeEngine(StubAnalyzer::withConfidence(SignalName::ELA, 50), slow_ocr,
                             StubAnalyzer::withConfidence(SignalName::METADATA, 50), settings);

    const auto start = std::chrono::steady_clock::now();
    FusionResult result = engine->process("doc-timeout", image_path_);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));

    const SignalResult &ocr = result.signal(SignalName::OCR);
    EXPECT_EQ(ocr.status, SignalStatus::TIMEOUT);
    EXPECT_DOUBLE_EQ(ocr.overall_confidence, 0.0);
    EXPECT_TRUE(ocr.findings.empty());

    EXPECT_TRUE(result.signal(SignalName::ELA).isCompleted());
    EXPECT_TRUE(result.signal(SignalName::METADATA).isCompleted());
    EXPECT_NE(std::find(result.errors.begin(), result.errors.end(), "OCR analysis timeout"), result.errors.end());

    // 0.4 * 50 + 0.3 * 50; the late OCR result never contributes
    EXPECT_DOUBLE_EQ(result.overall_confidence, 35.0);
}

TEST_F(SignalFusionEngineTest, DestructionWaitsForTimedOutWorker)
{
    FusionSettings settings;
    settings.signal_timeout_seconds = 0.2;

    auto slow_ela = StubAnalyzer::withConfidence(SignalName::ELA, 99);
    slow_ela->setDelay(std::chrono::milliseconds(1000));

    auto engine = makeEngine(slow_ela, StubAnalyzer::withConfidence(SignalName::OCR, 10),
                             StubAnalyzer::withConfidence(SignalName::METADATA, 10), settings);

    FusionResult result = engine->process("doc-abandoned", image_path_);
    EXPECT_EQ(result.signal(SignalName::ELA).status, SignalStatus::TIMEOUT);
    EXPECT_EQ(slow_ela->calls(), 1);
    EXPECT_EQ(slow_ela->completions(), 0);

    engine.reset();

    // The worker ran to completion before the engine went away
    EXPECT_EQ(slow_ela->completions(), 1);
    EXPECT_EQ(slow_ela.use_count(), 1);
}

TEST_F(SignalFusionEngineTest, FinishedTimedOutWorkersAreReaped)
{
    FusionSettings settings;
    settings.signal_timeout_seconds = 0.1;

    auto slow_metadata = StubAnalyzer::withConfidence(SignalName::METADATA, 40);
    slow_metadata->setDelay(std::chrono::milliseconds(300));

    auto engine = makeEngine(StubAnalyzer::withConfidence(SignalName::ELA, 10),
                             StubAnalyzer::withConfidence(SignalName::OCR, 10), slow_metadata, settings);

    FusionResult first = engine->process("doc-late-1", image_path_);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    FusionResult second = engine->process("doc-late-2", image_path_);

    EXPECT_EQ(first.signal(SignalName::METADATA).status, SignalStatus::TIMEOUT);
    EXPECT_EQ(second.signal(SignalName::METADATA).status, SignalStatus::TIMEOUT);
    EXPECT_EQ(slow_metadata->calls(), 2);
    EXPECT_EQ(slow_metadata->completions(), 1);

    engine.reset();
    EXPECT_EQ(slow_metadata->completions(), 2);
}

TEST_F(SignalFusionEngineTest, ThrowingAnalyzerIsIsolated)
{
    auto metadata = StubAnalyzer::withConfidence(SignalName::METADATA, 90);
    metadata->setThrows("corrupt metadata block");

    auto engine = makeEngine(StubAnalyzer::withConfidence(SignalName::ELA, 50),
                             StubAnalyzer::withConfidence(SignalName::OCR, 50), metadata);

    FusionResult result = engine->process("doc-throw", image_path_);

    const SignalResult &failed = result.signal(SignalName::METADATA);
    EXPECT_EQ(failed.status, SignalStatus::ERROR);
    EXPECT_DOUBLE_EQ(failed.overall_confidence, 0.0);
    EXPECT_TRUE(failed.findings.empty());

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Metadata error: corrupt metadata block");
    EXPECT_DOUBLE_EQ(result.overall_confidence, 35.0);
    EXPECT_EQ(result.verdict, Verdict::SLIGHTLY_SUSPICIOUS);
}

TEST_F(SignalFusionEngineTest, AnalyzerRaisedTimeoutIsReportedAsTimeout)
{
    auto ocr = StubAnalyzer::withConfidence(SignalName::OCR, 90);
    ocr->setThrowsTimeout("OCR engine deadline exceeded");

    auto engine = makeEngine(StubAnalyzer::withConfidence(SignalName::ELA, 50), ocr,
                             StubAnalyzer::withConfidence(SignalName::METADATA, 50));

    FusionResult result = engine->process("doc-analyzer-timeout", image_path_);

    EXPECT_EQ(result.signal(SignalName::OCR).status, SignalStatus::TIMEOUT);
    EXPECT_EQ(result.errors, std::vector<std::string>{"OCR analysis timeout"});
    EXPECT_DOUBLE_EQ(result.overall_confidence, 35.0);
}

TEST_F(SignalFusionEngineTest, NonStandardExceptionIsIsolated)
{
    auto ela = StubAnalyzer::withConfidence(SignalName::ELA, 90);
    ela->setThrowsUnknown();

    auto engine = makeEngine(ela, StubAnalyzer::withConfidence(SignalName::OCR, 10),
                             StubAnalyzer::withConfidence(SignalName::METADATA, 10));

    FusionResult result = engine->process("doc-unknown", image_path_);

    EXPECT_EQ(result.signal(SignalName::ELA).status, SignalStatus::ERROR);
    EXPECT_TRUE(containsText(result.errors, "ELA error: unknown error"));
    EXPECT_DOUBLE_EQ(result.overall_confidence, 6.0);
}

TEST_F(SignalFusionEngineTest, AnalyzerReportedErrorIsRecorded)
{
    auto ela = std::make_shared<StubAnalyzer>(
        SignalName::ELA, SignalResult::failed(SignalStatus::ERROR, "Analysis failed: Could not read image"));

    auto engine = makeEngine(ela, StubAnalyzer::withConfidence(SignalName::OCR, 40),
                             StubAnalyzer::withConfidence(SignalName::METADATA, 40));

    FusionResult result = engine->process("doc-reported", image_path_);

    EXPECT_EQ(result.signal(SignalName::ELA).status, SignalStatus::ERROR);
    EXPECT_TRUE(containsText(result.errors, "ELA error: Analysis failed: Could not read image"));
    EXPECT_DOUBLE_EQ(result.overall_confidence, 24.0);
}

TEST_F(SignalFusionEngineTest, AllSignalsFailingIsProcessingError)
{
    auto ela = StubAnalyzer::withConfidence(SignalName::ELA, 10);
    auto ocr = StubAnalyzer::withConfidence(SignalName::OCR, 10);
    auto metadata = StubAnalyzer::withConfidence(SignalName::METADATA, 10);
    ela->setThrows("a");
    ocr->setThrows("b");
    metadata->setThrows("c");

    auto engine = makeEngine(ela, ocr, metadata);
    FusionResult result = engine->process("doc-all-fail", image_path_);

    EXPECT_EQ(result.verdict, Verdict::PROCESSING_ERROR);
    EXPECT_DOUBLE_EQ(result.overall_confidence, 0.0);
    EXPECT_DOUBLE_EQ(result.uncertainty, 100.0);
    EXPECT_TRUE(result.combined_findings.empty());
    EXPECT_EQ(result.errors.size(), 3u);
    ASSERT_EQ(result.recommendations.size(), 1u);
    EXPECT_EQ(result.recommendations[0], "Processing failed. Please try again or upload a different document.");
}

TEST_F(SignalFusionEngineTest, UnopenableImageIsProcessingErrorWithoutRunningAnalyzers)
{
    auto ela = StubAnalyzer::withConfidence(SignalName::ELA, 90);
    auto ocr = StubAnalyzer::withConfidence(SignalName::OCR, 90);
    auto metadata = StubAnalyzer::withConfidence(SignalName::METADATA, 90);
    auto engine = makeEngine(ela, ocr, metadata);

    FusionResult result = engine->process("doc-missing", testFilePath("does_not_exist.png"));

    EXPECT_EQ(result.verdict, Verdict::PROCESSING_ERROR);
    EXPECT_DOUBLE_EQ(result.overall_confidence, 0.0);
    EXPECT_DOUBLE_EQ(result.uncertainty, 100.0);
    for (SignalName name : allSignals())
    {
        EXPECT_EQ(result.signal(name).status, SignalStatus::ERROR);
    }
    EXPECT_TRUE(containsText(result.errors, "Cannot open image"));
    ASSERT_EQ(result.recommendations.size(), 1u);
    EXPECT_EQ(ela->calls() + ocr->calls() + metadata->calls(), 0);
}

TEST_F(SignalFusionEngineTest, CombinedFindingsAreSortedStableAndTruncated)
{
    std::vector<Finding> ela_findings;
    std::vector<Finding> ocr_findings;
    for (int i = 0; i < 6; ++i)
    {
        ela_findings.emplace_back("ela_region", 50.0, "ela " + std::to_string(i));
        ocr_findings.emplace_back("mixed_formatting", 50.0, "ocr " + std::to_string(i));
    }
    std::vector<Finding> metadata_findings = {Finding("mime_mismatch", 80.0, "mismatch"),
                                              Finding("missing_exif", 10.0, "missing")};

    SignalFusionEngine::SignalResults signals = {
        {SignalName::ELA, SignalResult::completed(30, ela_findings, "ela")},
        {SignalName::OCR, SignalResult::completed(30, ocr_findings, "ocr")},
        {SignalName::METADATA, SignalResult::completed(30, metadata_findings, "metadata")}};

    auto combined = SignalFusionEngine::combineFindings(signals, 10);

    ASSERT_EQ(combined.size(), 10u);
    EXPECT_EQ(combined[0].signal, SignalName::METADATA);
    EXPECT_DOUBLE_EQ(combined[0].finding.confidence, 80.0);
    for (size_t i = 1; i <= 6; ++i)
    {
        EXPECT_EQ(combined[i].signal, SignalName::ELA) << "position " << i;
    }
    for (size_t i = 7; i < 10; ++i)
    {
        EXPECT_EQ(combined[i].signal, SignalName::OCR) << "position " << i;
    }
    EXPECT_EQ(combined[1].finding.description, "ela 0");
    EXPECT_EQ(combined[7].finding.description, "ocr 0");

    for (size_t i = 1; i < combined.size(); ++i)
    {
        EXPECT_GE(combined[i - 1].finding.confidence, combined[i].finding.confidence);
    }
}

TEST_F(SignalFusionEngineTest, FailedSignalsContributeNoFindings)
{
    SignalFusionEngine::SignalResults signals = {
        {SignalName::ELA, SignalResult::completed(30, {Finding("ela_region", 40, "region")}, "ela")},
        {SignalName::OCR, SignalResult::failed(SignalStatus::TIMEOUT, "Timeout")},
        {SignalName::METADATA, SignalResult::failed(SignalStatus::ERROR, "boom")}};

    auto combined = SignalFusionEngine::combineFindings(signals, 10);
    ASSERT_EQ(combined.size(), 1u);
    EXPECT_EQ(combined[0].signal, SignalName::ELA);
}

TEST_F(SignalFusionEngineTest, RecommendationsAreCappedAndUnique)
{
    const FusionSettings settings;
    std::vector<Finding> ocr_findings = {Finding("font_size_inconsistency", 60, "a"),
                                         Finding("alignment_inconsistency", 65, "b"),
                                         Finding("abnormal_spacing", 30, "c")};
    std::vector<Finding> metadata_findings = {Finding("date_anomaly", 85, "d")};

    SignalFusionEngine::SignalResults signals = {
        {SignalName::ELA, SignalResult::completed(95, {}, "ela")},
        {SignalName::OCR, SignalResult::completed(60, ocr_findings, "ocr")},
        {SignalName::METADATA, SignalResult::completed(70, metadata_findings, "metadata")}};

    auto recommendations = SignalFusionEngine::synthesizeRecommendations(Verdict::SUSPICIOUS, signals, settings);

    ASSERT_EQ(recommendations.size(), 5u);
    std::set<std::string> unique(recommendations.begin(), recommendations.end());
    EXPECT_EQ(unique.size(), recommendations.size());

    EXPECT_EQ(recommendations[0], "Verify document with issuing authority");
    EXPECT_TRUE(unique.count("High ELA confidence: Document shows clear editing artifacts"));
    EXPECT_TRUE(unique.count("Multiple text inconsistencies: Verify font and formatting"));
}

TEST_F(SignalFusionEngineTest, SignalSpecificRecommendationsFollowThresholds)
{
    const FusionSettings settings;
    std::vector<Finding> ocr_findings = {Finding("font_size_inconsistency", 60, "a"),
                                         Finding("abnormal_spacing", 30, "b")};
    std::vector<Finding> metadata_findings = {Finding("date_format_error", 50, "c")};

    SignalFusionEngine::SignalResults signals = {
        {SignalName::ELA, SignalResult::completed(70, {}, "ela")},
        {SignalName::OCR, SignalResult::completed(60, ocr_findings, "ocr")},
        {SignalName::METADATA, SignalResult::completed(50, metadata_findings, "metadata")}};

    auto recommendations =
        SignalFusionEngine::synthesizeRecommendations(Verdict::SLIGHTLY_SUSPICIOUS, signals, settings);

    // ELA at exactly 70 and only two layout findings stay below their thresholds
    ASSERT_EQ(recommendations.size(), 4u);
    EXPECT_EQ(recommendations[0], "Minor anomalies detected - review if critical document");
    EXPECT_EQ(recommendations[3], "Date anomalies: Verify creation and modification dates");
}

TEST_F(SignalFusionEngineTest, FusionIsDeterministic)
{
    const FusionSettings settings;
    SignalFusionEngine::SignalResults signals = {
        {SignalName::ELA, SignalResult::completed(63.3, {Finding("ela_region", 70, "r")}, "ela")},
        {SignalName::OCR, SignalResult::completed(41.7, {Finding("mixed_formatting", 70, "m")}, "ocr")},
        {SignalName::METADATA, SignalResult::completed(12.9, {Finding("missing_exif", 60, "x")}, "metadata")}};

    FusionResult a = SignalFusionEngine::fuse("doc", signals, {}, settings);
    FusionResult b = SignalFusionEngine::fuse("doc", signals, {}, settings);

    EXPECT_DOUBLE_EQ(a.overall_confidence, b.overall_confidence);
    EXPECT_EQ(a.verdict, b.verdict);
    ASSERT_EQ(a.combined_findings.size(), b.combined_findings.size());
    for (size_t i = 0; i < a.combined_findings.size(); ++i)
    {
        EXPECT_EQ(a.combined_findings[i].signal, b.combined_findings[i].signal);
        EXPECT_EQ(a.combined_findings[i].finding.description, b.combined_findings[i].finding.description);
    }
    EXPECT_EQ(a.recommendations, b.recommendations);
}

TEST_F(SignalFusionEngineTest, ConfidenceAndUncertaintyInvariantsHold)
{
    const FusionSettings settings;
    const std::vector<std::array<double, 3>> cases = {
        {0, 0, 0}, {100, 100, 100}, {33.33, 66.67, 12.5}, {71.1, 0.3, 99.9}, {150, -20, 50}};

    for (const auto &values : cases)
    {
        FusionResult result =
            SignalFusionEngine::fuse("doc", completedSignals(values[0], values[1], values[2]), {}, settings);

        EXPECT_GE(result.overall_confidence, 0.0);
        EXPECT_LE(result.overall_confidence, 100.0);
        EXPECT_EQ(result.uncertainty, 100.0 - result.overall_confidence);
        EXPECT_LE(result.combined_findings.size(), 10u);
        EXPECT_LE(result.recommendations.size(), 5u);
    }
}

TEST_F(SignalFusionEngineTest, ConcurrentCallsForSameDocumentComputeOnce)
{
    auto ela = StubAnalyzer::withConfidence(SignalName::ELA, 50);
    ela->setDelay(std::chrono::milliseconds(300));
    auto ocr = StubAnalyzer::withConfidence(SignalName::OCR, 20);
    auto metadata = StubAnalyzer::withConfidence(SignalName::METADATA, 30);
    auto engine = makeEngine(ela, ocr, metadata);

    constexpr int kCallers = 8;
    std::vector<FusionResult> results(kCallers);
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i)
    {
        callers.emplace_back([&, i]()
                             { results[i] = engine->process("doc-shared", image_path_); });
    }
    for (auto &caller : callers)
    {
        caller.join();
    }

    EXPECT_EQ(ela->calls(), 1);
    EXPECT_EQ(ocr->calls(), 1);
    EXPECT_EQ(metadata->calls(), 1);
    for (const auto &result : results)
    {
        EXPECT_EQ(result.document_id, "doc-shared");
        EXPECT_DOUBLE_EQ(result.overall_confidence, results[0].overall_confidence);
    }
}

TEST_F(SignalFusionEngineTest, BatchProcessesEveryDocumentInOrder)
{
    auto ela = StubAnalyzer::withConfidence(SignalName::ELA, 90);
    auto ocr = StubAnalyzer::withConfidence(SignalName::OCR, 10);
    auto metadata = StubAnalyzer::withConfidence(SignalName::METADATA, 10);
    auto engine = makeEngine(ela, ocr, metadata);

    std::vector<SignalFusionEngine::DocumentRequest> documents = {
        {"batch-1", image_path_},
        {"batch-2", image_path_},
        {"batch-3", testFilePath("missing.png")}};

    auto results = engine->processBatch(documents);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].document_id, "batch-1");
    EXPECT_EQ(results[1].document_id, "batch-2");
    EXPECT_EQ(results[2].document_id, "batch-3");
    EXPECT_EQ(results[0].verdict, Verdict::MODERATELY_SUSPICIOUS);
    EXPECT_EQ(results[2].verdict, Verdict::PROCESSING_ERROR);
    EXPECT_EQ(ela->calls(), 2);

    ProcessingStats stats = engine->getProcessingStats();
    EXPECT_EQ(stats.documents_processed, 3u);
    EXPECT_GE(stats.average_processing_time, 0.0);

    nlohmann::json stats_json = stats.toJson();
    EXPECT_EQ(stats_json["cache_size"], 3);
    EXPECT_TRUE(stats_json.contains("average_processing_time"));
}

TEST_F(SignalFusionEngineTest, RejectsMissingAnalyzer)
{
    EXPECT_THROW(SignalFusionEngine(nullptr, StubAnalyzer::withConfidence(SignalName::OCR, 0),
                                    StubAnalyzer::withConfidence(SignalName::METADATA, 0)),
                 std::invalid_argument);
}

TEST_F(SignalFusionEngineTest, ErrorResultIsWellFormed)
{
    FusionResult result = SignalFusionEngine::buildErrorResult("doc-err", "disk on fire");

    EXPECT_EQ(result.document_id, "doc-err");
    EXPECT_EQ(result.verdict, Verdict::PROCESSING_ERROR);
    EXPECT_DOUBLE_EQ(result.overall_confidence, 0.0);
    EXPECT_DOUBLE_EQ(result.uncertainty, 100.0);
    EXPECT_EQ(result.per_signal.size(), 3u);
    EXPECT_EQ(result.errors, std::vector<std::string>{"disk on fire"});
    EXPECT_EQ(result.recommendations.size(), 1u);
}
