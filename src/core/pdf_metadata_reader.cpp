#include "core/pdf_metadata_reader.hpp"
#include "core/forensic_errors.hpp"
#include "logging/logger.hpp"
#include <poppler-document.h>
#include <poppler-page.h>
#include <fstream>
#include <memory>
#include <regex>
#include <sstream>

namespace
{
    std::string toUtf8(const poppler::ustring &text)
    {
        poppler::byte_array bytes = text.to_utf8();
        return std::string(bytes.begin(), bytes.end());
    }
}

std::string PdfMetadata::info(const std::string &key) const
{
    auto it = document_info.find(key);
    return it == document_info.end() ? std::string() : it->second;
}

nlohmann::json PdfMetadata::toJson() const
{
    nlohmann::json sizes = nlohmann::json::array();
    for (const auto &size : page_sizes)
    {
        sizes.push_back({{"page", size.page}, {"width", size.width}, {"height", size.height}});
    }

    nlohmann::json info_json = nlohmann::json::object();
    for (const auto &entry : document_info)
    {
        info_json[entry.first] = entry.second;
    }

    return {
        {"page_count", page_count},
        {"pdf_version", pdf_version},
        {"document_info", info_json},
        {"page_sizes", sizes},
        {"form_field_count", form_field_types.size()}};
}

PdfMetadata PdfMetadataReader::readFile(const std::string &file_path)
{
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(file_path));
    if (!doc)
    {
        throw AnalyzerFailure("Failed to load PDF: " + file_path);
    }
    if (doc->is_locked())
    {
        throw AnalyzerFailure("PDF is encrypted: " + file_path);
    }

    PdfMetadata metadata;
    metadata.page_count = doc->pages();

    int major = 0;
    int minor = 0;
    doc->get_pdf_version(&major, &minor);
    metadata.pdf_version = std::to_string(major) + "." + std::to_string(minor);

    for (const auto &key : doc->info_keys())
    {
        metadata.document_info[key] = toUtf8(doc->info_key(key));
    }

    for (int index = 0; index < metadata.page_count; ++index)
    {
        std::unique_ptr<poppler::page> page(doc->create_page(index));
        if (!page)
        {
            Logger::warn("Could not load page " + std::to_string(index + 1) + " of " + file_path);
            continue;
        }
        poppler::rectf rect = page->page_rect();
        metadata.page_sizes.push_back({index + 1, rect.width(), rect.height()});
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
    {
        throw AnalyzerFailure("Cannot open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    metadata.form_field_types = scanFormFieldTypes(buffer.str());

    Logger::debug("PDF " + file_path + ": " + std::to_string(metadata.page_count) + " pages, " +
                  std::to_string(metadata.form_field_types.size()) + " form fields");
    return metadata;
}

std::vector<std::string> PdfMetadataReader::scanFormFieldTypes(const std::string &content)
{
    std::vector<std::string> field_types;

    // Simplified object parser: objects packed in compressed object streams are not visible here
    static const std::regex obj_pattern(R"((\d+)\s+(\d+)\s+obj)");
    static const std::regex field_pattern(R"(/FT\s*/([A-Za-z]+))");

    auto it = std::sregex_iterator(content.begin(), content.end(), obj_pattern);
    auto end = std::sregex_iterator();
    for (; it != end; ++it)
    {
        size_t obj_start = static_cast<size_t>(it->position());
        size_t obj_end = content.find("endobj", obj_start);
        if (obj_end == std::string::npos)
            continue;

        std::string obj_content = content.substr(obj_start, obj_end - obj_start);
        if (obj_content.find("/FT") == std::string::npos)
            continue;

        auto field = std::sregex_iterator(obj_content.begin(), obj_content.end(), field_pattern);
        for (; field != end; ++field)
        {
            field_types.push_back((*field)[1].str());
        }
    }
    return field_types;
}
