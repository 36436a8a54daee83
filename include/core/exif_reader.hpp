#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief EXIF tags keyed by tag name ("DateTime", "Make", "GPSLatitude", ...)
 */
struct ExifData
{
    std::map<std::string, std::string> tags;
    bool big_endian = false;

    bool empty() const { return tags.empty(); }
    bool has(const std::string &name) const { return tags.count(name) > 0; }
    std::optional<std::string> get(const std::string &name) const;
    nlohmann::json toJson() const;
};

/**
 * @brief Bounds-checked TIFF/IFD reader for the EXIF block of JPEG, PNG and TIFF files.
 *
 * Reads IFD0 plus the Exif and GPS sub-IFDs. Entries pointing outside the
 * block are skipped; a block without a valid TIFF header is an error.
 */
class ExifReader
{
public:
    /**
     * @brief Read EXIF tags from a file
     * @return Empty ExifData when the file carries no EXIF block
     * @throws AnalyzerFailure if the file cannot be read or the EXIF block is malformed
     */
    static ExifData readFile(const std::string &file_path);

    static ExifData fromBytes(const std::vector<uint8_t> &file_data);

    /**
     * @brief Parse a TIFF structure ("II*\0" or "MM\0*" header)
     * @throws AnalyzerFailure on a malformed header
     */
    static ExifData parseTiff(const uint8_t *data, size_t size);

    // Locate the TIFF block inside a JPEG APP1 "Exif\0\0" segment
    static std::optional<std::vector<uint8_t>> findJpegExif(const std::vector<uint8_t> &file_data);

    // Locate the TIFF block inside a PNG eXIf chunk
    static std::optional<std::vector<uint8_t>> findPngExif(const std::vector<uint8_t> &file_data);

    static uint16_t readWord(const uint8_t *data, bool big_endian);
    static uint32_t readDWord(const uint8_t *data, bool big_endian);

private:
    enum class IfdKind
    {
        PRIMARY,
        EXIF,
        GPS
    };

    static void parseIfd(const uint8_t *tiff, size_t size, uint32_t offset, bool big_endian,
                         IfdKind kind, ExifData &out, std::vector<uint32_t> &visited);
    static std::string tagName(uint16_t tag, IfdKind kind);
    static std::optional<std::string> formatValue(const uint8_t *tiff, size_t size, const uint8_t *entry,
                                                  bool big_endian);
};
