#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct PdfPageSize
{
    int page = 0; // 1-based
    double width = 0.0;
    double height = 0.0;
};

/**
 * @brief Document information dictionary, page geometry and form fields of a PDF
 */
struct PdfMetadata
{
    int page_count = 0;
    std::string pdf_version; // "major.minor"
    std::map<std::string, std::string> document_info;
    std::vector<PdfPageSize> page_sizes;
    std::vector<std::string> form_field_types; // One entry per /FT occurrence ("Tx", "Btn", ...)

    std::string info(const std::string &key) const;
    nlohmann::json toJson() const;
};

class PdfMetadataReader
{
public:
    /**
     * @brief Load a PDF and extract its metadata
     * @throws AnalyzerFailure if the document cannot be opened or is encrypted
     */
    static PdfMetadata readFile(const std::string &file_path);

    /**
     * @brief Scan raw PDF content object by object for interactive form field types
     */
    static std::vector<std::string> scanFormFieldTypes(const std::string &content);
};
