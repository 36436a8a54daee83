#include "core/metadata_anomaly_analyzer.hpp"
#include "core/forensic_errors.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace
{
    std::string toLower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string formatLocalTime(std::time_t time)
    {
        std::tm tm{};
        localtime_r(&time, &tm);
        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        return ss.str();
    }

    std::string joinStrings(const std::vector<std::string> &items, const std::string &separator)
    {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i)
        {
            if (i > 0)
                out += separator;
            out += items[i];
        }
        return out;
    }

    nlohmann::json fileInfoToJson(const FileInfo &info)
    {
        std::error_code ec;
        std::string absolute = std::filesystem::absolute(info.file_path, ec).string();
        return {
            {"filename", info.file_name},
            {"file_size", info.file_size},
            {"created", formatLocalTime(info.creation_time)},
            {"modified", formatLocalTime(info.modification_time)},
            {"file_extension", info.extension},
            {"absolute_path", ec ? info.file_path : absolute}};
    }
}

nlohmann::json ImageProperties::toJson() const
{
    return {{"format", format}, {"width", width}, {"height", height}, {"channels", channels}};
}

MetadataAnomalyAnalyzer::MetadataAnomalyAnalyzer(const MetadataSettings &settings)
    : settings_(settings)
{
}

SignalResult MetadataAnomalyAnalyzer::analyze(const std::string &file_path)
{
    Logger::info("Running metadata analysis on: " + file_path);

    try
    {
        auto file_info = FileUtils::getFileInfo(file_path);
        if (!file_info)
        {
            throw AnalyzerFailure("File not found or not a regular file: " + file_path);
        }

        const std::string mime_type = FileUtils::detectMimeType(file_path);
        std::vector<Finding> anomalies;
        nlohmann::json metadata_extracted = nlohmann::json::object();
        std::optional<ImageProperties> image;
        std::string file_type = "other";

        if (FileUtils::isImageMimeType(mime_type))
        {
            file_type = "image";
            try
            {
                ExifData exif = ExifReader::readFile(file_path);
                image = readImageProperties(file_path, mime_type);
                metadata_extracted = {{"exif", exif.toJson()}, {"image_info", image->toJson()}};
                anomalies = checkImageMetadata(exif, *image, *file_info, settings_);
            }
            catch (const AnalyzerFailure &e)
            {
                Logger::warn("Image metadata extraction failed for " + file_path + ": " + e.what());
                metadata_extracted = {{"error", e.what()}};
                anomalies.emplace_back("analysis_error", 50.0,
                                       "Image analysis failed: " + std::string(e.what()));
            }
        }
        else if (mime_type == "application/pdf")
        {
            file_type = "pdf";
            try
            {
                PdfMetadata pdf = PdfMetadataReader::readFile(file_path);
                metadata_extracted = pdf.toJson();
                anomalies = checkPdfMetadata(pdf);
            }
            catch (const AnalyzerFailure &e)
            {
                Logger::warn("PDF metadata extraction failed for " + file_path + ": " + e.what());
                metadata_extracted = {{"error", e.what()}};
                anomalies.emplace_back("pdf_analysis_error", 30.0,
                                       "PDF anomaly detection failed: " + std::string(e.what()));
            }
        }
        else
        {
            Logger::debug("Unsupported file type for detailed metadata analysis: " + mime_type);
        }

        for (auto &anomaly : checkCrossType(*file_info, mime_type, image, settings_))
        {
            anomalies.push_back(std::move(anomaly));
        }

        // One field per extracted group ("exif", "image_info", "document_info", ...)
        const size_t field_count = metadata_extracted.size();
        const double overall = scoreAnomalies(anomalies, field_count, settings_);
        std::string summary = summarize(anomalies, overall);

        nlohmann::json details = {
            {"file_info", fileInfoToJson(*file_info)},
            {"mime_type", mime_type},
            {"file_type", file_type},
            {"metadata_extracted", metadata_extracted},
            {"metadata_field_count", field_count},
            {"anomalies_found", anomalies.size()},
            {"file_hash", {{"algorithm", "sha256"}, {"hash", FileUtils::computeFileHash(file_path)}}}};

        Logger::debug("Metadata analysis found " + std::to_string(anomalies.size()) + " anomalies in " + file_path);
        return SignalResult::completed(roundTo(overall), std::move(anomalies), summary, details);
    }
    catch (const std::exception &e)
    {
        Logger::error("Metadata analysis failed: " + std::string(e.what()));
        return SignalResult::failed(SignalStatus::ERROR, "Metadata analysis failed: " + std::string(e.what()));
    }
}

ImageProperties MetadataAnomalyAnalyzer::readImageProperties(const std::string &file_path,
                                                             const std::string &mime_type)
{
    cv::Mat image;
    try
    {
        image = cv::imread(file_path, cv::IMREAD_UNCHANGED);
    }
    catch (const cv::Exception &e)
    {
        throw AnalyzerFailure("OpenCV error: " + std::string(e.what()));
    }
    if (image.empty())
    {
        throw AnalyzerFailure("Could not decode image: " + file_path);
    }

    ImageProperties props;
    props.width = image.cols;
    props.height = image.rows;
    props.channels = image.channels();
    props.format = mime_type.substr(mime_type.find('/') + 1);
    return props;
}

std::vector<Finding> MetadataAnomalyAnalyzer::checkImageMetadata(const ExifData &exif, const ImageProperties &image,
                                                                 const FileInfo &file_info,
                                                                 const MetadataSettings &settings)
{
    std::vector<Finding> anomalies;

    static const std::vector<std::string> essential_tags = {"DateTime", "Make", "Model", "Software"};
    std::vector<std::string> missing;
    for (const auto &tag : essential_tags)
    {
        if (!exif.has(tag))
            missing.push_back(tag);
    }
    if (missing.size() >= 2)
    {
        anomalies.emplace_back("missing_exif", 60.0,
                               "Missing essential EXIF tags: " + joinStrings(missing, ", "),
                               nlohmann::json{{"missing_tags", missing}});
    }

    if (auto date_text = exif.get("DateTime"))
    {
        auto exif_time = parseExifDateTime(*date_text);
        if (!exif_time)
        {
            anomalies.emplace_back("date_format_error", 50.0,
                                   "Invalid or tampered EXIF DateTime format: " + *date_text,
                                   nlohmann::json{{"value", *date_text}});
        }
        else if (*exif_time > file_info.modification_time)
        {
            double hours = std::difftime(*exif_time, file_info.modification_time) / 3600.0;
            anomalies.emplace_back("date_anomaly", 85.0,
                                   "EXIF DateTime (" + formatLocalTime(*exif_time) +
                                       ") is after file modification time (" +
                                       formatLocalTime(file_info.modification_time) + ")",
                                   nlohmann::json{{"exif_date", formatLocalTime(*exif_time)},
                                                  {"file_mtime", formatLocalTime(file_info.modification_time)},
                                                  {"difference_hours", roundTo(hours)}});
        }
    }

    if (auto software = exif.get("Software"))
    {
        const std::string lowered = toLower(*software);
        bool edited = std::any_of(settings.editor_names.begin(), settings.editor_names.end(),
                                  [&](const std::string &editor)
                                  { return lowered.find(toLower(editor)) != std::string::npos; });
        if (edited)
        {
            anomalies.emplace_back("editing_software", 70.0,
                                   "Document created/edited with: " + *software,
                                   nlohmann::json{{"software", *software}});
        }
    }

    std::vector<std::string> gps_tags;
    for (const auto &entry : exif.tags)
    {
        if (toLower(entry.first).find("gps") != std::string::npos)
            gps_tags.push_back(entry.first);
    }
    if (!gps_tags.empty())
    {
        const std::string lowered_path = toLower(file_info.file_path);
        bool geographic = std::any_of(settings.geographic_hints.begin(), settings.geographic_hints.end(),
                                      [&](const std::string &hint)
                                      { return lowered_path.find(toLower(hint)) != std::string::npos; });
        if (!geographic)
        {
            anomalies.emplace_back("unexpected_gps", 55.0, "GPS data found in non-geographic document",
                                   nlohmann::json{{"gps_tags_found", gps_tags}});
        }
    }

    if (image.width > 0 && image.height > 0)
    {
        const double pixels = static_cast<double>(image.width) * image.height;
        const double bytes_per_pixel = static_cast<double>(file_info.file_size) / pixels;
        if (bytes_per_pixel < settings.min_bytes_per_pixel)
        {
            std::ostringstream ratio;
            ratio << std::fixed << std::setprecision(4) << bytes_per_pixel;
            anomalies.emplace_back("compression_anomaly", 65.0,
                                   "Unusually high compression (" + ratio.str() + " bytes/pixel)",
                                   nlohmann::json{{"file_size_bytes", file_info.file_size},
                                                  {"dimensions", std::to_string(image.width) + "x" +
                                                                     std::to_string(image.height)},
                                                  {"bytes_per_pixel", bytes_per_pixel}});
        }
    }

    return anomalies;
}

std::vector<Finding> MetadataAnomalyAnalyzer::checkPdfMetadata(const PdfMetadata &pdf)
{
    std::vector<Finding> anomalies;

    const std::string creation = pdf.info("CreationDate");
    const std::string modified = pdf.info("ModDate");
    if (!creation.empty() && !modified.empty() && creation != modified)
    {
        anomalies.emplace_back("pdf_modified", 75.0, "PDF has been modified since creation",
                               nlohmann::json{{"creation_date", creation}, {"modification_date", modified}});
    }

    if (!pdf.form_field_types.empty())
    {
        std::vector<std::string> unique_types;
        for (const auto &type : pdf.form_field_types)
        {
            if (std::find(unique_types.begin(), unique_types.end(), type) == unique_types.end())
                unique_types.push_back(type);
        }
        anomalies.emplace_back("form_fields", 60.0,
                               "PDF contains " + std::to_string(pdf.form_field_types.size()) +
                                   " form field(s) - could be editable",
                               nlohmann::json{{"field_types", unique_types}});
    }

    if (pdf.page_sizes.size() > 1)
    {
        const PdfPageSize &first = pdf.page_sizes.front();
        std::vector<int> inconsistent;
        for (size_t i = 1; i < pdf.page_sizes.size(); ++i)
        {
            const PdfPageSize &page = pdf.page_sizes[i];
            if (page.width != first.width || page.height != first.height)
                inconsistent.push_back(page.page);
        }
        if (!inconsistent.empty())
        {
            std::string pages;
            for (size_t i = 0; i < inconsistent.size(); ++i)
                pages += (i > 0 ? ", " : "") + std::to_string(inconsistent[i]);

            anomalies.emplace_back("inconsistent_page_sizes", 70.0,
                                   "Inconsistent page sizes on pages: [" + pages + "]",
                                   nlohmann::json{{"expected_size", {first.width, first.height}},
                                                  {"inconsistent_pages", inconsistent},
                                                  {"all_page_sizes", pdf.toJson()["page_sizes"]}});
        }
    }

    return anomalies;
}

std::vector<Finding> MetadataAnomalyAnalyzer::checkCrossType(const FileInfo &file_info, const std::string &mime_type,
                                                             const std::optional<ImageProperties> &image,
                                                             const MetadataSettings &settings)
{
    std::vector<Finding> anomalies;

    const std::string expected = FileUtils::expectedMimeType(file_info.extension);
    if (!expected.empty() && mime_type != expected)
    {
        anomalies.emplace_back("mime_mismatch", 80.0,
                               "File extension (" + file_info.extension + ") doesn't match actual type (" +
                                   mime_type + ")",
                               nlohmann::json{{"extension", file_info.extension},
                                              {"expected_mime", expected},
                                              {"actual_mime", mime_type}});
    }

    if (FileUtils::isImageMimeType(mime_type) && image && image->width > 0 && image->height > 0)
    {
        const double expected_min_size =
            static_cast<double>(image->width) * image->height * settings.size_estimate_bytes_per_pixel;
        if (static_cast<double>(file_info.file_size) < expected_min_size * settings.min_size_fraction)
        {
            anomalies.emplace_back("suspicious_file_size", 65.0,
                                   "Image file size (" + std::to_string(file_info.file_size) +
                                       " bytes) suspiciously small for " + std::to_string(image->width) + "x" +
                                       std::to_string(image->height) + " resolution",
                                   nlohmann::json{{"file_size", file_info.file_size},
                                                  {"dimensions", std::to_string(image->width) + "x" +
                                                                     std::to_string(image->height)},
                                                  {"expected_min_size", static_cast<int64_t>(expected_min_size)}});
        }
    }

    return anomalies;
}

double MetadataAnomalyAnalyzer::scoreAnomalies(const std::vector<Finding> &anomalies, size_t metadata_field_count,
                                               const MetadataSettings &settings)
{
    if (anomalies.empty())
    {
        if (metadata_field_count > 0)
            return clampConfidence(100.0 - 0.5 * static_cast<double>(metadata_field_count));
        return 50.0;
    }

    double total = 0.0;
    double weight_sum = 0.0;
    for (const auto &anomaly : anomalies)
    {
        double weight = 1.0;
        if (anomaly.kind.find("date") != std::string::npos)
            weight = settings.date_weight;
        else if (anomaly.kind.find("mime") != std::string::npos)
            weight = settings.mime_weight;

        total += anomaly.confidence * weight;
        weight_sum += weight;
    }

    const double average = weight_sum > 0 ? total / weight_sum : 0.0;
    const double count_factor = std::min(1.0, static_cast<double>(anomalies.size()) / settings.anomaly_saturation_count);
    return clampConfidence(average * (0.7 + 0.3 * count_factor));
}

std::string MetadataAnomalyAnalyzer::summarize(const std::vector<Finding> &anomalies, double overall_confidence)
{
    if (anomalies.empty())
    {
        if (overall_confidence < 30)
            return "No metadata anomalies detected. Document metadata appears authentic.";
        return "Limited metadata available. Document may have been stripped of metadata.";
    }

    if (anomalies.size() >= 3)
        return "Multiple metadata anomalies detected (" + std::to_string(anomalies.size()) +
               " issues). Strong evidence of document tampering.";

    if (anomalies.size() == 2)
    {
        std::vector<std::string> kinds;
        for (const auto &anomaly : anomalies)
        {
            if (std::find(kinds.begin(), kinds.end(), anomaly.kind) == kinds.end())
                kinds.push_back(anomaly.kind);
        }
        return "Two metadata anomalies detected (" + joinStrings(kinds, ", ") + "). Document likely manipulated.";
    }

    const std::string &kind = anomalies.front().kind;
    if (kind.find("date") != std::string::npos)
        return "Date anomaly detected. Document creation/modification times inconsistent.";
    if (kind.find("mime") != std::string::npos)
        return "File type mismatch detected. Actual file type doesn't match extension.";
    if (kind.find("software") != std::string::npos)
        return "Editing software signature detected. Document was created/edited with image software.";
    return "Metadata anomaly detected. Document may have been altered.";
}

std::optional<std::time_t> MetadataAnomalyAnalyzer::parseExifDateTime(const std::string &text)
{
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y:%m:%d %H:%M:%S");
    if (ss.fail())
        return std::nullopt;

    // Trailing garbage makes the value unparsable
    ss >> std::ws;
    if (!ss.eof())
        return std::nullopt;

    tm.tm_isdst = -1;
    std::time_t time = std::mktime(&tm);
    if (time == static_cast<std::time_t>(-1))
        return std::nullopt;
    return time;
}
