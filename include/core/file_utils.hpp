#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Filesystem facts recorded for the metadata audit trail
 */
struct FileInfo
{
    std::string file_path;
    std::string file_name;
    std::string extension;       // Lower-case, including the dot (".jpg"); empty when absent
    uint64_t file_size = 0;      // Bytes
    std::time_t modification_time = 0;
    std::time_t creation_time = 0; // Inode change time where birth time is unavailable
};

/**
 * @brief File utilities shared by the analyzers
 */
class FileUtils
{
public:
    /**
     * @brief Get file information without reading content
     * @param file_path Path to the file
     * @return FileInfo if the file exists and is a regular file
     */
    static std::optional<FileInfo> getFileInfo(const std::string &file_path);

    /**
     * @brief Lower-cased extension including the leading dot
     */
    static std::string getFileExtension(const std::string &file_path);

    /**
     * @brief Detect the media type from the leading bytes of the file
     * @return MIME type, "application/octet-stream" when unrecognized or unreadable
     */
    static std::string detectMimeType(const std::string &file_path);
    static std::string detectMimeType(const std::vector<uint8_t> &header);

    /**
     * @brief MIME type implied by a known document/image extension
     * @return Empty string for extensions outside the known table
     */
    static std::string expectedMimeType(const std::string &extension);

    static bool isImageMimeType(const std::string &mime_type);

    /**
     * @brief Read at most max_bytes from the start of a file (0 reads the whole file)
     * @throws std::runtime_error if the file cannot be opened
     */
    static std::vector<uint8_t> readBytes(const std::string &file_path, size_t max_bytes = 0);

    /**
     * Computes SHA256 hash of a file
     * @param file_path Path to the file
     * @return SHA256 hash as hexadecimal string, empty on failure
     */
    static std::string computeFileHash(const std::string &file_path);
};
