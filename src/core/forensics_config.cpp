#include "core/forensics_config.hpp"
#include <cmath>
#include <stdexcept>

namespace
{
    const nlohmann::json &section(const nlohmann::json &config, const std::string &name)
    {
        static const nlohmann::json empty = nlohmann::json::object();
        if (config.is_object() && config.contains(name) && config[name].is_object())
            return config[name];
        return empty;
    }

    template <typename T>
    T read(const nlohmann::json &node, const std::string &key, const T &def)
    {
        if (!node.contains(key) || node[key].is_null())
            return def;
        try
        {
            return node[key].get<T>();
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::invalid_argument("Invalid value for '" + key + "': " + e.what());
        }
    }

    // Lists may arrive as native arrays or, after a Poco round-trip, as their JSON text
    std::vector<std::string> readList(const nlohmann::json &node, const std::string &key,
                                      const std::vector<std::string> &def)
    {
        if (!node.contains(key) || node[key].is_null())
            return def;
        nlohmann::json value = node[key];
        if (value.is_string())
        {
            try
            {
                value = nlohmann::json::parse(value.get<std::string>());
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::invalid_argument("Invalid list for '" + key + "': " + e.what());
            }
        }
        if (!value.is_array())
            throw std::invalid_argument("Expected a list for '" + key + "'");
        std::vector<std::string> out;
        for (const auto &item : value)
        {
            if (!item.is_string())
                throw std::invalid_argument("Expected only strings in '" + key + "'");
            out.push_back(item.get<std::string>());
        }
        return out;
    }

    void require(bool condition, const std::string &message)
    {
        if (!condition)
            throw std::invalid_argument("Invalid forensics configuration: " + message);
    }

    bool isPercentage(double value)
    {
        return value >= 0.0 && value <= 100.0;
    }
}

void ForensicsConfig::validate() const
{
    require(ela.jpeg_quality >= 1 && ela.jpeg_quality <= 100, "ela.jpeg_quality must be in [1, 100]");
    require(ela.diff_threshold >= 0 && ela.diff_threshold <= 255, "ela.diff_threshold must be in [0, 255]");
    require(ela.min_region_area >= 0, "ela.min_region_area must be non-negative");
    require(isPercentage(ela.min_region_confidence), "ela.min_region_confidence must be in [0, 100]");
    require(ela.area_ratio_scale > 0, "ela.area_ratio_scale must be positive");
    require(ela.medium_confidence <= ela.high_confidence, "ela.medium_confidence must not exceed ela.high_confidence");

    require(ocr.page_segmentation_mode >= 0 && ocr.page_segmentation_mode <= 13, "ocr.page_segmentation_mode must be in [0, 13]");
    require(ocr.ocr_engine_mode >= 0 && ocr.ocr_engine_mode <= 3, "ocr.ocr_engine_mode must be in [0, 3]");
    require(!ocr.language.empty(), "ocr.language must not be empty");
    require(isPercentage(ocr.min_word_confidence), "ocr.min_word_confidence must be in [0, 100]");
    require(ocr.min_region_size >= 0, "ocr.min_region_size must be non-negative");
    require(ocr.line_tolerance_px >= 0, "ocr.line_tolerance_px must be non-negative");
    require(ocr.font_variance_ratio > 0, "ocr.font_variance_ratio must be positive");
    require(ocr.overlap_ratio > 0 && ocr.overlap_ratio <= 1, "ocr.overlap_ratio must be in (0, 1]");
    require(ocr.alignment_tolerance_px >= 0, "ocr.alignment_tolerance_px must be non-negative");
    require(ocr.spacing_gap_px >= 0, "ocr.spacing_gap_px must be non-negative");
    require(isPercentage(ocr.font_confidence_cap) && isPercentage(ocr.alignment_confidence) &&
                isPercentage(ocr.spacing_confidence_cap) && isPercentage(ocr.mixed_formatting_confidence),
            "ocr rule confidences must be in [0, 100]");

    require(metadata.min_bytes_per_pixel >= 0, "metadata.min_bytes_per_pixel must be non-negative");
    require(metadata.size_estimate_bytes_per_pixel >= 0, "metadata.size_estimate_bytes_per_pixel must be non-negative");
    require(metadata.min_size_fraction >= 0 && metadata.min_size_fraction <= 1, "metadata.min_size_fraction must be in [0, 1]");
    require(metadata.date_weight > 0 && metadata.mime_weight > 0, "metadata weights must be positive");
    require(metadata.anomaly_saturation_count > 0, "metadata.anomaly_saturation_count must be positive");

    require(fusion.ela_weight >= 0 && fusion.ocr_weight >= 0 && fusion.metadata_weight >= 0,
            "fusion weights must be non-negative");
    require(std::fabs(fusion.ela_weight + fusion.ocr_weight + fusion.metadata_weight - 1.0) <= 1e-6,
            "fusion weights must sum to 1");
    require(fusion.highly_suspicious_threshold > fusion.suspicious_threshold &&
                fusion.suspicious_threshold > fusion.moderately_suspicious_threshold &&
                fusion.moderately_suspicious_threshold > fusion.slightly_suspicious_threshold &&
                fusion.slightly_suspicious_threshold >= 0 && fusion.highly_suspicious_threshold <= 100,
            "fusion verdict thresholds must be strictly descending within [0, 100]");
    require(isPercentage(fusion.review_signal_threshold), "fusion.review_signal_threshold must be in [0, 100]");
    require(isPercentage(fusion.ela_recommendation_threshold), "fusion.ela_recommendation_threshold must be in [0, 100]");
    require(fusion.layout_recommendation_min_findings > 0, "fusion.layout_recommendation_min_findings must be positive");
    require(fusion.signal_timeout_seconds > 0, "fusion.signal_timeout_seconds must be positive");
    require(fusion.pipeline_deadline_seconds > 0, "fusion.pipeline_deadline_seconds must be positive");
    require(fusion.max_findings > 0, "fusion.max_findings must be positive");
    require(fusion.max_recommendations > 0, "fusion.max_recommendations must be positive");

    require(max_processing_threads >= 1 && max_processing_threads <= 64, "max_processing_threads must be in [1, 64]");
}

ForensicsConfig ForensicsConfig::fromJson(const nlohmann::json &config)
{
    ForensicsConfig out;

    const auto &e = section(config, "ela");
    out.ela.jpeg_quality = read(e, "jpeg_quality", out.ela.jpeg_quality);
    out.ela.diff_threshold = read(e, "diff_threshold", out.ela.diff_threshold);
    out.ela.min_region_area = read(e, "min_region_area", out.ela.min_region_area);
    out.ela.min_region_confidence = read(e, "min_region_confidence", out.ela.min_region_confidence);
    out.ela.area_ratio_scale = read(e, "area_ratio_scale", out.ela.area_ratio_scale);
    out.ela.high_confidence = read(e, "high_confidence", out.ela.high_confidence);
    out.ela.medium_confidence = read(e, "medium_confidence", out.ela.medium_confidence);
    out.ela.heatmap_dir = read(e, "heatmap_dir", out.ela.heatmap_dir);

    const auto &o = section(config, "ocr");
    out.ocr.page_segmentation_mode = read(o, "page_segmentation_mode", out.ocr.page_segmentation_mode);
    out.ocr.ocr_engine_mode = read(o, "ocr_engine_mode", out.ocr.ocr_engine_mode);
    out.ocr.language = read(o, "language", out.ocr.language);
    out.ocr.tessdata_path = read(o, "tessdata_path", out.ocr.tessdata_path);
    out.ocr.min_word_confidence = read(o, "min_word_confidence", out.ocr.min_word_confidence);
    out.ocr.min_region_size = read(o, "min_region_size", out.ocr.min_region_size);
    out.ocr.line_tolerance_px = read(o, "line_tolerance_px", out.ocr.line_tolerance_px);
    out.ocr.font_variance_ratio = read(o, "font_variance_ratio", out.ocr.font_variance_ratio);
    out.ocr.font_confidence_cap = read(o, "font_confidence_cap", out.ocr.font_confidence_cap);
    out.ocr.overlap_ratio = read(o, "overlap_ratio", out.ocr.overlap_ratio);
    out.ocr.alignment_tolerance_px = read(o, "alignment_tolerance_px", out.ocr.alignment_tolerance_px);
    out.ocr.alignment_confidence = read(o, "alignment_confidence", out.ocr.alignment_confidence);
    out.ocr.spacing_gap_px = read(o, "spacing_gap_px", out.ocr.spacing_gap_px);
    out.ocr.spacing_confidence_cap = read(o, "spacing_confidence_cap", out.ocr.spacing_confidence_cap);
    out.ocr.mixed_formatting_confidence = read(o, "mixed_formatting_confidence", out.ocr.mixed_formatting_confidence);
    out.ocr.visualization_dir = read(o, "visualization_dir", out.ocr.visualization_dir);

    const auto &m = section(config, "metadata");
    out.metadata.editor_names = readList(m, "editor_names", out.metadata.editor_names);
    out.metadata.geographic_hints = readList(m, "geographic_hints", out.metadata.geographic_hints);
    out.metadata.min_bytes_per_pixel = read(m, "min_bytes_per_pixel", out.metadata.min_bytes_per_pixel);
    out.metadata.size_estimate_bytes_per_pixel = read(m, "size_estimate_bytes_per_pixel", out.metadata.size_estimate_bytes_per_pixel);
    out.metadata.min_size_fraction = read(m, "min_size_fraction", out.metadata.min_size_fraction);
    out.metadata.date_weight = read(m, "date_weight", out.metadata.date_weight);
    out.metadata.mime_weight = read(m, "mime_weight", out.metadata.mime_weight);
    out.metadata.anomaly_saturation_count = read(m, "anomaly_saturation_count", out.metadata.anomaly_saturation_count);

    const auto &f = section(config, "fusion");
    out.fusion.ela_weight = read(f, "ela_weight", out.fusion.ela_weight);
    out.fusion.ocr_weight = read(f, "ocr_weight", out.fusion.ocr_weight);
    out.fusion.metadata_weight = read(f, "metadata_weight", out.fusion.metadata_weight);
    out.fusion.highly_suspicious_threshold = read(f, "highly_suspicious_threshold", out.fusion.highly_suspicious_threshold);
    out.fusion.suspicious_threshold = read(f, "suspicious_threshold", out.fusion.suspicious_threshold);
    out.fusion.moderately_suspicious_threshold = read(f, "moderately_suspicious_threshold", out.fusion.moderately_suspicious_threshold);
    out.fusion.slightly_suspicious_threshold = read(f, "slightly_suspicious_threshold", out.fusion.slightly_suspicious_threshold);
    out.fusion.review_signal_threshold = read(f, "review_signal_threshold", out.fusion.review_signal_threshold);
    out.fusion.ela_recommendation_threshold = read(f, "ela_recommendation_threshold", out.fusion.ela_recommendation_threshold);
    out.fusion.layout_recommendation_min_findings = read(f, "layout_recommendation_min_findings", out.fusion.layout_recommendation_min_findings);
    out.fusion.signal_timeout_seconds = read(f, "signal_timeout_seconds", out.fusion.signal_timeout_seconds);
    out.fusion.pipeline_deadline_seconds = read(f, "pipeline_deadline_seconds", out.fusion.pipeline_deadline_seconds);
    out.fusion.max_findings = read(f, "max_findings", out.fusion.max_findings);
    out.fusion.max_recommendations = read(f, "max_recommendations", out.fusion.max_recommendations);

    if (config.is_object())
    {
        out.log_level = read(config, "log_level", out.log_level);
        out.max_processing_threads = read(config, "max_processing_threads", out.max_processing_threads);
    }

    out.validate();
    return out;
}

nlohmann::json ForensicsConfig::toJson() const
{
    return {
        {"log_level", log_level},
        {"max_processing_threads", max_processing_threads},
        {"ela",
         {{"jpeg_quality", ela.jpeg_quality},
          {"diff_threshold", ela.diff_threshold},
          {"min_region_area", ela.min_region_area},
          {"min_region_confidence", ela.min_region_confidence},
          {"area_ratio_scale", ela.area_ratio_scale},
          {"high_confidence", ela.high_confidence},
          {"medium_confidence", ela.medium_confidence},
          {"heatmap_dir", ela.heatmap_dir}}},
        {"ocr",
         {{"page_segmentation_mode", ocr.page_segmentation_mode},
          {"ocr_engine_mode", ocr.ocr_engine_mode},
          {"language", ocr.language},
          {"tessdata_path", ocr.tessdata_path},
          {"min_word_confidence", ocr.min_word_confidence},
          {"min_region_size", ocr.min_region_size},
          {"line_tolerance_px", ocr.line_tolerance_px},
          {"font_variance_ratio", ocr.font_variance_ratio},
          {"font_confidence_cap", ocr.font_confidence_cap},
          {"overlap_ratio", ocr.overlap_ratio},
          {"alignment_tolerance_px", ocr.alignment_tolerance_px},
          {"alignment_confidence", ocr.alignment_confidence},
          {"spacing_gap_px", ocr.spacing_gap_px},
          {"spacing_confidence_cap", ocr.spacing_confidence_cap},
          {"mixed_formatting_confidence", ocr.mixed_formatting_confidence},
          {"visualization_dir", ocr.visualization_dir}}},
        {"metadata",
         {{"editor_names", metadata.editor_names},
          {"geographic_hints", metadata.geographic_hints},
          {"min_bytes_per_pixel", metadata.min_bytes_per_pixel},
          {"size_estimate_bytes_per_pixel", metadata.size_estimate_bytes_per_pixel},
          {"min_size_fraction", metadata.min_size_fraction},
          {"date_weight", metadata.date_weight},
          {"mime_weight", metadata.mime_weight},
          {"anomaly_saturation_count", metadata.anomaly_saturation_count}}},
        {"fusion",
         {{"ela_weight", fusion.ela_weight},
          {"ocr_weight", fusion.ocr_weight},
          {"metadata_weight", fusion.metadata_weight},
          {"highly_suspicious_threshold", fusion.highly_suspicious_threshold},
          {"suspicious_threshold", fusion.suspicious_threshold},
          {"moderately_suspicious_threshold", fusion.moderately_suspicious_threshold},
          {"slightly_suspicious_threshold", fusion.slightly_suspicious_threshold},
          {"review_signal_threshold", fusion.review_signal_threshold},
          {"ela_recommendation_threshold", fusion.ela_recommendation_threshold},
          {"layout_recommendation_min_findings", fusion.layout_recommendation_min_findings},
          {"signal_timeout_seconds", fusion.signal_timeout_seconds},
          {"pipeline_deadline_seconds", fusion.pipeline_deadline_seconds},
          {"max_findings", fusion.max_findings},
          {"max_recommendations", fusion.max_recommendations}}}};
}
