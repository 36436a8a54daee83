#pragma once

#include "core/signal_analyzer.hpp"
#include "core/forensics_config.hpp"
#include "core/exif_reader.hpp"
#include "core/pdf_metadata_reader.hpp"
#include "core/file_utils.hpp"
#include <ctime>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Decoded raster properties used by the size/compression rules
 */
struct ImageProperties
{
    int width = 0;
    int height = 0;
    int channels = 0;
    std::string format;

    nlohmann::json toJson() const;
};

/**
 * @brief Rule-based anomalies in embedded metadata (EXIF for images, document
 * info and page geometry for PDFs) plus file-level consistency checks.
 *
 * Type-specific extraction problems become anomalies; only an unreadable
 * file fails the signal. The result details carry a SHA-256 of the file.
 */
class MetadataAnomalyAnalyzer : public SignalAnalyzer
{
public:
    explicit MetadataAnomalyAnalyzer(const MetadataSettings &settings = MetadataSettings{});

    SignalName signal() const override { return SignalName::METADATA; }

    SignalResult analyze(const std::string &file_path) override;

    static std::vector<Finding> checkImageMetadata(const ExifData &exif, const ImageProperties &image,
                                                   const FileInfo &file_info, const MetadataSettings &settings);

    static std::vector<Finding> checkPdfMetadata(const PdfMetadata &pdf);

    static std::vector<Finding> checkCrossType(const FileInfo &file_info, const std::string &mime_type,
                                               const std::optional<ImageProperties> &image,
                                               const MetadataSettings &settings);

    static double scoreAnomalies(const std::vector<Finding> &anomalies, size_t metadata_field_count,
                                 const MetadataSettings &settings);

    static std::string summarize(const std::vector<Finding> &anomalies, double overall_confidence);

    /**
     * @brief Parse an EXIF "YYYY:MM:DD HH:MM:SS" timestamp as local time
     */
    static std::optional<std::time_t> parseExifDateTime(const std::string &text);

    /**
     * @throws AnalyzerFailure when the image cannot be decoded
     */
    static ImageProperties readImageProperties(const std::string &file_path, const std::string &mime_type);

private:
    MetadataSettings settings_;
};
