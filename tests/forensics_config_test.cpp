#include <gtest/gtest.h>
#include "core/forensics_config.hpp"

TEST(ForensicsConfigTest, DefaultsAreValid)
{
    ForensicsConfig config;
    EXPECT_NO_THROW(config.validate());

    EXPECT_EQ(config.ela.jpeg_quality, 95);
    EXPECT_EQ(config.ela.diff_threshold, 10);
    EXPECT_EQ(config.ela.min_region_area, 100);
    EXPECT_DOUBLE_EQ(config.fusion.ela_weight, 0.4);
    EXPECT_DOUBLE_EQ(config.fusion.ocr_weight, 0.3);
    EXPECT_DOUBLE_EQ(config.fusion.metadata_weight, 0.3);
    EXPECT_DOUBLE_EQ(config.fusion.signal_timeout_seconds, 15.0);
    EXPECT_EQ(config.fusion.max_findings, 10);
    EXPECT_EQ(config.fusion.max_recommendations, 5);
}

TEST(ForensicsConfigTest, RejectsWeightsNotSummingToOne)
{
    ForensicsConfig config;
    config.fusion.ela_weight = 0.5;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ForensicsConfigTest, RejectsUnorderedThresholds)
{
    ForensicsConfig config;
    config.fusion.suspicious_threshold = 85;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ForensicsConfigTest, RejectsOutOfRangeValues)
{
    ForensicsConfig quality;
    quality.ela.jpeg_quality = 0;
    EXPECT_THROW(quality.validate(), std::invalid_argument);

    ForensicsConfig timeout;
    timeout.fusion.signal_timeout_seconds = 0;
    EXPECT_THROW(timeout.validate(), std::invalid_argument);

    ForensicsConfig threads;
    threads.max_processing_threads = 65;
    EXPECT_THROW(threads.validate(), std::invalid_argument);

    ForensicsConfig language;
    language.ocr.language.clear();
    EXPECT_THROW(language.validate(), std::invalid_argument);
}

TEST(ForensicsConfigTest, FromJsonOverridesOnlyGivenKeys)
{
    nlohmann::json json = {
        {"log_level", "DEBUG"},
        {"ela", {{"jpeg_quality", 90}}},
        {"fusion", {{"signal_timeout_seconds", 5.0}}},
        {"metadata", {{"editor_names", {"gimp"}}}}};

    ForensicsConfig config = ForensicsConfig::fromJson(json);

    EXPECT_EQ(config.log_level, "DEBUG");
    EXPECT_EQ(config.ela.jpeg_quality, 90);
    EXPECT_EQ(config.ela.diff_threshold, 10);
    EXPECT_DOUBLE_EQ(config.fusion.signal_timeout_seconds, 5.0);
    EXPECT_DOUBLE_EQ(config.fusion.ela_weight, 0.4);
    EXPECT_EQ(config.metadata.editor_names, std::vector<std::string>{"gimp"});
}

TEST(ForensicsConfigTest, FromJsonAcceptsListsStoredAsText)
{
    nlohmann::json json = {{"metadata", {{"geographic_hints", "[\"atlas\", \"gps\"]"}}}};

    ForensicsConfig config = ForensicsConfig::fromJson(json);
    EXPECT_EQ(config.metadata.geographic_hints, (std::vector<std::string>{"atlas", "gps"}));
}

TEST(ForensicsConfigTest, FromJsonRejectsWrongTypes)
{
    EXPECT_THROW(ForensicsConfig::fromJson({{"ela", {{"jpeg_quality", "high"}}}}), std::invalid_argument);
    EXPECT_THROW(ForensicsConfig::fromJson({{"metadata", {{"editor_names", 3}}}}), std::invalid_argument);
    EXPECT_THROW(ForensicsConfig::fromJson({{"fusion", {{"ocr_weight", 0.9}}}}), std::invalid_argument);
}

TEST(ForensicsConfigTest, ToJsonRoundTripsThroughFromJson)
{
    ForensicsConfig original;
    original.ela.jpeg_quality = 85;
    original.ocr.language = "deu";
    original.fusion.max_findings = 7;
    original.metadata.editor_names = {"lightroom"};

    ForensicsConfig restored = ForensicsConfig::fromJson(original.toJson());

    EXPECT_EQ(restored.ela.jpeg_quality, 85);
    EXPECT_EQ(restored.ocr.language, "deu");
    EXPECT_EQ(restored.fusion.max_findings, 7);
    EXPECT_EQ(restored.metadata.editor_names, std::vector<std::string>{"lightroom"});
    EXPECT_EQ(restored.toJson(), original.toJson());
}

TEST(ForensicsConfigTest, RenderingAndSizeRuleSettings)
{
    ForensicsConfig defaults;
    EXPECT_TRUE(defaults.ela.heatmap_dir.empty());
    EXPECT_TRUE(defaults.ocr.visualization_dir.empty());
    EXPECT_DOUBLE_EQ(defaults.metadata.size_estimate_bytes_per_pixel, 0.1);
    EXPECT_DOUBLE_EQ(defaults.metadata.min_size_fraction, 0.1);

    ForensicsConfig config = ForensicsConfig::fromJson({{"ela", {{"heatmap_dir", "out/heatmaps"}}},
                                                        {"ocr", {{"visualization_dir", "out/ocr"}}},
                                                        {"metadata", {{"min_size_fraction", 0.25}}}});
    EXPECT_EQ(config.ela.heatmap_dir, "out/heatmaps");
    EXPECT_EQ(config.ocr.visualization_dir, "out/ocr");
    EXPECT_DOUBLE_EQ(config.metadata.min_size_fraction, 0.25);
    EXPECT_DOUBLE_EQ(config.metadata.min_bytes_per_pixel, 0.1);

    EXPECT_THROW(ForensicsConfig::fromJson({{"metadata", {{"min_size_fraction", 1.5}}}}), std::invalid_argument);
    EXPECT_THROW(ForensicsConfig::fromJson({{"metadata", {{"size_estimate_bytes_per_pixel", -1}}}}),
                 std::invalid_argument);
}
