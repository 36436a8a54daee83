#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Tunables for the compression-artifact (error level) analysis
 */
struct ElaSettings
{
    int jpeg_quality = 95;              // Re-encode quality factor Q
    int diff_threshold = 10;            // Threshold T on the normalized difference (0-255)
    int min_region_area = 100;          // Components smaller than this many pixels are noise
    double min_region_confidence = 20;  // Regions below this confidence are dropped
    double area_ratio_scale = 200;      // overall = suspicious_ratio * scale, capped at 100
    double high_confidence = 70;        // Summary tiers
    double medium_confidence = 40;
    std::string heatmap_dir;            // Where region heatmaps are written; empty disables them
};

/**
 * @brief Tunables for the text-layout analysis and the OCR engine invocation
 */
struct OcrSettings
{
    int page_segmentation_mode = 6;
    int ocr_engine_mode = 3;
    std::string language = "eng";
    std::string tessdata_path; // Empty: use TESSDATA_PREFIX or the Tesseract default

    double min_word_confidence = 30;
    int min_region_size = 10;           // Boxes narrower or shorter than this are dropped
    int line_tolerance_px = 10;         // Vertical tolerance against the line anchor
    double font_variance_ratio = 0.2;   // Rule fires when std > ratio * mean
    double font_confidence_cap = 90;
    double overlap_ratio = 0.5;         // Vertical overlap vs. smaller height for "same line"
    int alignment_tolerance_px = 20;
    double alignment_confidence = 65;
    int spacing_gap_px = 100;
    double spacing_confidence_cap = 80;
    double mixed_formatting_confidence = 70;
    std::string visualization_dir;      // Where text-region overlays are written; empty disables them
};

/**
 * @brief Tunables for the metadata-anomaly analysis
 */
struct MetadataSettings
{
    std::vector<std::string> editor_names = {"photoshop", "gimp", "paint", "editor", "adobe"};
    std::vector<std::string> geographic_hints = {"map", "location", "geo"};
    double min_bytes_per_pixel = 0.1;           // Compression rule floor
    double size_estimate_bytes_per_pixel = 0.1; // Expected size = pixels * this
    double min_size_fraction = 0.1;             // Files below this share of the expected size are flagged
    double date_weight = 1.5;
    double mime_weight = 1.3;
    int anomaly_saturation_count = 5;
};

/**
 * @brief Tunables for the fusion policy and the orchestration deadlines
 */
struct FusionSettings
{
    double ela_weight = 0.4;
    double ocr_weight = 0.3;
    double metadata_weight = 0.3;

    double highly_suspicious_threshold = 80;
    double suspicious_threshold = 60;
    double moderately_suspicious_threshold = 40;
    double slightly_suspicious_threshold = 20;
    double review_signal_threshold = 70;

    double ela_recommendation_threshold = 70;
    int layout_recommendation_min_findings = 3;

    double signal_timeout_seconds = 15;
    double pipeline_deadline_seconds = 20;

    int max_findings = 10;
    int max_recommendations = 5;
};

/**
 * @brief Every tunable constant of the forensic pipeline in one place.
 *
 * Defaults reproduce the reference calibration. validate() throws
 * std::invalid_argument describing the first offending field.
 */
struct ForensicsConfig
{
    ElaSettings ela;
    OcrSettings ocr;
    MetadataSettings metadata;
    FusionSettings fusion;

    std::string log_level = "INFO";
    int max_processing_threads = 4;

    void validate() const;

    static ForensicsConfig fromJson(const nlohmann::json &config);
    nlohmann::json toJson() const;
};
