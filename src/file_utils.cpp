#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
    struct MagicSignature
    {
        std::vector<uint8_t> bytes;
        size_t offset;
        const char *mime_type;
    };

    // Leading-byte signatures, most specific first
    const std::vector<MagicSignature> &signatures()
    {
        static const std::vector<MagicSignature> table = {
            {{0xFF, 0xD8, 0xFF}, 0, "image/jpeg"},
            {{0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}, 0, "image/png"},
            {{'G', 'I', 'F', '8', '7', 'a'}, 0, "image/gif"},
            {{'G', 'I', 'F', '8', '9', 'a'}, 0, "image/gif"},
            {{'I', 'I', 0x2A, 0x00}, 0, "image/tiff"},
            {{'M', 'M', 0x00, 0x2A}, 0, "image/tiff"},
            {{'%', 'P', 'D', 'F', '-'}, 0, "application/pdf"},
            {{'B', 'M'}, 0, "image/bmp"},
        };
        return table;
    }

    bool matchesAt(const std::vector<uint8_t> &data, const std::vector<uint8_t> &sig, size_t offset)
    {
        if (data.size() < offset + sig.size())
            return false;
        return std::equal(sig.begin(), sig.end(), data.begin() + static_cast<std::ptrdiff_t>(offset));
    }
}

std::optional<FileInfo> FileUtils::getFileInfo(const std::string &file_path)
{
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        return std::nullopt;
    }

    FileInfo info;
    info.file_path = file_path;
    info.file_name = fs::path(file_path).filename().string();
    info.extension = getFileExtension(file_path);
    info.file_size = static_cast<uint64_t>(st.st_size);
    info.modification_time = st.st_mtime;
    info.creation_time = st.st_ctime;
    return info;
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string FileUtils::detectMimeType(const std::string &file_path)
{
    try
    {
        return detectMimeType(readBytes(file_path, 16));
    }
    catch (const std::exception &e)
    {
        Logger::warn("Cannot sniff media type of " + file_path + ": " + e.what());
        return "application/octet-stream";
    }
}

std::string FileUtils::detectMimeType(const std::vector<uint8_t> &header)
{
    for (const auto &sig : signatures())
    {
        if (matchesAt(header, sig.bytes, sig.offset))
        {
            return sig.mime_type;
        }
    }
    // RIFF....WEBP
    if (matchesAt(header, {'R', 'I', 'F', 'F'}, 0) && matchesAt(header, {'W', 'E', 'B', 'P'}, 8))
    {
        return "image/webp";
    }
    return "application/octet-stream";
}

std::string FileUtils::expectedMimeType(const std::string &extension)
{
    static const std::map<std::string, std::string> table = {
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
        {".pdf", "application/pdf"},
    };
    auto it = table.find(extension);
    return it == table.end() ? std::string() : it->second;
}

bool FileUtils::isImageMimeType(const std::string &mime_type)
{
    return mime_type.rfind("image/", 0) == 0;
}

std::vector<uint8_t> FileUtils::readBytes(const std::string &file_path, size_t max_bytes)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
    {
        throw std::runtime_error("Cannot open file: " + file_path);
    }

    std::vector<uint8_t> data;
    if (max_bytes == 0)
    {
        data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        return data;
    }

    data.resize(max_bytes);
    file.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(max_bytes));
    data.resize(static_cast<size_t>(file.gcount()));
    return data;
}

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    Logger::debug("Reading entire file for hash computation: " + file_path);
    constexpr size_t buffer_size = 8192;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
        return "";
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return "";
    std::vector<char> buffer(buffer_size);
    while (file.good())
    {
        file.read(buffer.data(), buffer_size);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (SHA256_Update(&sha256, buffer.data(), static_cast<size_t>(bytes_read)) != 1)
                return "";
        }
    }
    if (SHA256_Final(hash, &sha256) != 1)
        return "";
    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return ss.str();
}
