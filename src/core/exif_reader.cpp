#include "core/exif_reader.hpp"
#include "core/file_utils.hpp"
#include "core/forensic_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace
{
    constexpr uint16_t TAG_EXIF_IFD = 0x8769;
    constexpr uint16_t TAG_GPS_IFD = 0x8825;
    constexpr size_t MAX_VALUES = 16;

    size_t typeSize(uint16_t type)
    {
        switch (type)
        {
        case 1:  // BYTE
        case 2:  // ASCII
        case 6:  // SBYTE
        case 7:  // UNDEFINED
            return 1;
        case 3:  // SHORT
        case 8:  // SSHORT
            return 2;
        case 4:  // LONG
        case 9:  // SLONG
        case 11: // FLOAT
            return 4;
        case 5:  // RATIONAL
        case 10: // SRATIONAL
        case 12: // DOUBLE
            return 8;
        default:
            return 0;
        }
    }

    bool isTiffHeader(const std::vector<uint8_t> &data)
    {
        if (data.size() < 4)
            return false;
        return (data[0] == 'I' && data[1] == 'I' && data[2] == 0x2A && data[3] == 0x00) ||
               (data[0] == 'M' && data[1] == 'M' && data[2] == 0x00 && data[3] == 0x2A);
    }
}

std::optional<std::string> ExifData::get(const std::string &name) const
{
    auto it = tags.find(name);
    if (it == tags.end())
        return std::nullopt;
    return it->second;
}

nlohmann::json ExifData::toJson() const
{
    nlohmann::json out = nlohmann::json::object();
    for (const auto &[name, value] : tags)
    {
        out[name] = value;
    }
    return out;
}

uint16_t ExifReader::readWord(const uint8_t *data, bool big_endian)
{
    if (big_endian)
        return static_cast<uint16_t>((data[0] << 8) | data[1]);
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

uint32_t ExifReader::readDWord(const uint8_t *data, bool big_endian)
{
    if (big_endian)
        return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
               (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
    return static_cast<uint32_t>(data[0]) | (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) | (static_cast<uint32_t>(data[3]) << 24);
}

ExifData ExifReader::readFile(const std::string &file_path)
{
    std::vector<uint8_t> data;
    try
    {
        data = FileUtils::readBytes(file_path);
    }
    catch (const std::exception &e)
    {
        throw AnalyzerFailure(e.what());
    }
    return fromBytes(data);
}

ExifData ExifReader::fromBytes(const std::vector<uint8_t> &file_data)
{
    if (isTiffHeader(file_data))
    {
        return parseTiff(file_data.data(), file_data.size());
    }

    std::optional<std::vector<uint8_t>> block;
    if (file_data.size() >= 2 && file_data[0] == 0xFF && file_data[1] == 0xD8)
    {
        block = findJpegExif(file_data);
    }
    else if (file_data.size() >= 8 && file_data[0] == 0x89 && file_data[1] == 'P')
    {
        block = findPngExif(file_data);
    }

    if (!block)
    {
        return ExifData{};
    }
    return parseTiff(block->data(), block->size());
}

ExifData ExifReader::parseTiff(const uint8_t *data, size_t size)
{
    if (data == nullptr || size < 8)
    {
        throw AnalyzerFailure("EXIF block too short");
    }

    bool big_endian;
    if (data[0] == 'I' && data[1] == 'I')
        big_endian = false;
    else if (data[0] == 'M' && data[1] == 'M')
        big_endian = true;
    else
        throw AnalyzerFailure("Invalid EXIF byte order marker");

    if (readWord(data + 2, big_endian) != 0x2A)
    {
        throw AnalyzerFailure("Invalid TIFF magic number in EXIF block");
    }

    ExifData out;
    out.big_endian = big_endian;
    std::vector<uint32_t> visited;
    parseIfd(data, size, readDWord(data + 4, big_endian), big_endian, IfdKind::PRIMARY, out, visited);
    return out;
}

void ExifReader::parseIfd(const uint8_t *tiff, size_t size, uint32_t offset, bool big_endian,
                          IfdKind kind, ExifData &out, std::vector<uint32_t> &visited)
{
    if (static_cast<uint64_t>(offset) + 2 > size)
        return;
    if (std::find(visited.begin(), visited.end(), offset) != visited.end())
        return;
    visited.push_back(offset);

    uint16_t entry_count = readWord(tiff + offset, big_endian);
    uint32_t exif_offset = 0;
    uint32_t gps_offset = 0;

    for (uint16_t i = 0; i < entry_count; ++i)
    {
        uint64_t entry_pos = static_cast<uint64_t>(offset) + 2 + 12ull * i;
        if (entry_pos + 12 > size)
            break;

        const uint8_t *entry = tiff + entry_pos;
        uint16_t tag = readWord(entry, big_endian);

        if (kind == IfdKind::PRIMARY && tag == TAG_EXIF_IFD)
        {
            exif_offset = readDWord(entry + 8, big_endian);
            continue;
        }
        if (kind == IfdKind::PRIMARY && tag == TAG_GPS_IFD)
        {
            gps_offset = readDWord(entry + 8, big_endian);
            continue;
        }

        auto value = formatValue(tiff, size, entry, big_endian);
        if (value)
        {
            out.tags.emplace(tagName(tag, kind), *value);
        }
    }

    if (exif_offset > 0)
        parseIfd(tiff, size, exif_offset, big_endian, IfdKind::EXIF, out, visited);
    if (gps_offset > 0)
        parseIfd(tiff, size, gps_offset, big_endian, IfdKind::GPS, out, visited);
}

std::optional<std::string> ExifReader::formatValue(const uint8_t *tiff, size_t size, const uint8_t *entry,
                                                   bool big_endian)
{
    uint16_t type = readWord(entry + 2, big_endian);
    uint32_t count = readDWord(entry + 4, big_endian);
    size_t unit = typeSize(type);
    if (unit == 0 || count == 0)
        return std::nullopt;

    uint64_t total = static_cast<uint64_t>(count) * unit;
    const uint8_t *value = entry + 8;
    if (total > 4)
    {
        uint32_t value_offset = readDWord(entry + 8, big_endian);
        if (static_cast<uint64_t>(value_offset) + total > size)
            return std::nullopt;
        value = tiff + value_offset;
    }

    if (type == 2 || type == 7)
    {
        std::string text(reinterpret_cast<const char *>(value), static_cast<size_t>(total));
        auto nul = text.find('\0');
        if (nul != std::string::npos)
            text.resize(nul);
        bool printable = std::all_of(text.begin(), text.end(), [](unsigned char c)
                                     { return c >= 0x20 && c < 0x7F; });
        if (type == 7 && !printable)
            return "<" + std::to_string(total) + " bytes>";
        return text;
    }

    std::ostringstream ss;
    size_t shown = std::min<size_t>(count, MAX_VALUES);
    for (size_t i = 0; i < shown; ++i)
    {
        if (i > 0)
            ss << ' ';
        const uint8_t *p = value + i * unit;
        switch (type)
        {
        case 1:
            ss << static_cast<unsigned>(p[0]);
            break;
        case 6:
            ss << static_cast<int>(static_cast<int8_t>(p[0]));
            break;
        case 3:
            ss << readWord(p, big_endian);
            break;
        case 8:
            ss << static_cast<int16_t>(readWord(p, big_endian));
            break;
        case 4:
            ss << readDWord(p, big_endian);
            break;
        case 9:
            ss << static_cast<int32_t>(readDWord(p, big_endian));
            break;
        case 5:
            ss << readDWord(p, big_endian) << '/' << readDWord(p + 4, big_endian);
            break;
        case 10:
            ss << static_cast<int32_t>(readDWord(p, big_endian)) << '/'
               << static_cast<int32_t>(readDWord(p + 4, big_endian));
            break;
        case 11:
        {
            uint32_t bits = readDWord(p, big_endian);
            float f;
            std::memcpy(&f, &bits, sizeof(f));
            ss << f;
            break;
        }
        case 12:
        {
            uint64_t bits = big_endian
                                ? (static_cast<uint64_t>(readDWord(p, true)) << 32) | readDWord(p + 4, true)
                                : readDWord(p, false) | (static_cast<uint64_t>(readDWord(p + 4, false)) << 32);
            double d;
            std::memcpy(&d, &bits, sizeof(d));
            ss << d;
            break;
        }
        default:
            break;
        }
    }
    return ss.str();
}

std::optional<std::vector<uint8_t>> ExifReader::findJpegExif(const std::vector<uint8_t> &file_data)
{
    const size_t size = file_data.size();
    if (size < 4 || file_data[0] != 0xFF || file_data[1] != 0xD8)
        return std::nullopt;

    size_t offset = 2;
    while (offset + 4 <= size)
    {
        if (file_data[offset] != 0xFF)
            break;

        uint8_t marker = file_data[offset + 1];
        if (marker == 0xFF)
        {
            ++offset; // fill byte
            continue;
        }
        // Start of scan or end of image: no metadata segments follow
        if (marker == 0xDA || marker == 0xD9)
            break;
        if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01)
        {
            offset += 2;
            continue;
        }

        uint16_t segment_length = readWord(file_data.data() + offset + 2, true);
        if (segment_length < 2)
            break;

        if (marker == 0xE1 && segment_length >= 8 && offset + 10 <= size &&
            std::memcmp(file_data.data() + offset + 4, "Exif\0\0", 6) == 0)
        {
            size_t start = offset + 10;
            size_t end = std::min(size, offset + 2 + segment_length);
            return std::vector<uint8_t>(file_data.begin() + static_cast<std::ptrdiff_t>(start),
                                        file_data.begin() + static_cast<std::ptrdiff_t>(end));
        }
        offset += 2 + segment_length;
    }
    return std::nullopt;
}

std::optional<std::vector<uint8_t>> ExifReader::findPngExif(const std::vector<uint8_t> &file_data)
{
    static const uint8_t png_signature[8] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
    const size_t size = file_data.size();
    if (size < 8 || std::memcmp(file_data.data(), png_signature, 8) != 0)
        return std::nullopt;

    uint64_t offset = 8;
    while (offset + 8 <= size)
    {
        uint32_t length = readDWord(file_data.data() + offset, true);
        const char *type = reinterpret_cast<const char *>(file_data.data() + offset + 4);
        uint64_t data_start = offset + 8;
        if (data_start + length > size)
            break;

        if (std::memcmp(type, "eXIf", 4) == 0)
        {
            return std::vector<uint8_t>(file_data.begin() + static_cast<std::ptrdiff_t>(data_start),
                                        file_data.begin() + static_cast<std::ptrdiff_t>(data_start + length));
        }
        if (std::memcmp(type, "IEND", 4) == 0)
            break;

        offset = data_start + length + 4; // skip CRC
    }
    return std::nullopt;
}

std::string ExifReader::tagName(uint16_t tag, IfdKind kind)
{
    static const std::map<uint16_t, const char *> primary = {
        {0x0100, "ImageWidth"},
        {0x0101, "ImageLength"},
        {0x010E, "ImageDescription"},
        {0x010F, "Make"},
        {0x0110, "Model"},
        {0x0112, "Orientation"},
        {0x011A, "XResolution"},
        {0x011B, "YResolution"},
        {0x0128, "ResolutionUnit"},
        {0x0131, "Software"},
        {0x0132, "DateTime"},
        {0x013B, "Artist"},
        {0x0213, "YCbCrPositioning"},
        {0x8298, "Copyright"},
    };
    static const std::map<uint16_t, const char *> exif = {
        {0x829A, "ExposureTime"},
        {0x829D, "FNumber"},
        {0x8827, "ISOSpeedRatings"},
        {0x9000, "ExifVersion"},
        {0x9003, "DateTimeOriginal"},
        {0x9004, "DateTimeDigitized"},
        {0x920A, "FocalLength"},
        {0x9286, "UserComment"},
        {0xA001, "ColorSpace"},
        {0xA002, "ExifImageWidth"},
        {0xA003, "ExifImageHeight"},
        {0xA431, "BodySerialNumber"},
        {0xA434, "LensModel"},
    };
    static const std::map<uint16_t, const char *> gps = {
        {0x0000, "GPSVersionID"},
        {0x0001, "GPSLatitudeRef"},
        {0x0002, "GPSLatitude"},
        {0x0003, "GPSLongitudeRef"},
        {0x0004, "GPSLongitude"},
        {0x0005, "GPSAltitudeRef"},
        {0x0006, "GPSAltitude"},
        {0x0007, "GPSTimeStamp"},
        {0x001D, "GPSDateStamp"},
    };

    const auto &table = kind == IfdKind::GPS ? gps : (kind == IfdKind::EXIF ? exif : primary);
    auto it = table.find(tag);
    if (it != table.end())
        return it->second;

    // Tags from the other tables can legally appear anywhere but the GPS IFD
    if (kind != IfdKind::GPS)
    {
        const auto &other = kind == IfdKind::EXIF ? primary : exif;
        auto alt = other.find(tag);
        if (alt != other.end())
            return alt->second;
    }

    std::ostringstream ss;
    ss << (kind == IfdKind::GPS ? "GPSTag0x" : "Tag0x") << std::hex << std::uppercase << std::setw(4)
       << std::setfill('0') << tag;
    return ss.str();
}
