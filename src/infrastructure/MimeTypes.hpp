/**
 * @file MimeTypes.hpp
 * @brief Mapping between file extensions and MIME types.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

namespace docingest::infrastructure {

class MimeTypes {
public:
    /** @brief MIME type for a file name, "text/plain" when unknown. */
    static std::string ForName(const std::string& name) {
        std::string ext = std::filesystem::path(name).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
        if (ext == ".pdf") return "application/pdf";
        if (ext == ".doc") return "application/msword";
        if (ext == ".docx") return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
        if (ext == ".xls") return "application/vnd.ms-excel";
        if (ext == ".xlsx") return "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
        if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
        if (ext == ".png") return "image/png";
        if (ext == ".tif" || ext == ".tiff") return "image/tiff";
        if (ext == ".bmp") return "image/bmp";
        if (ext == ".gif") return "image/gif";
        if (ext == ".json") return "application/json";
        return "text/plain";
    }

    /** @brief True when the name ends with an extension of a document type listed above. */
    static bool IsKnownName(const std::string& name) {
        return ForName(name) != "text/plain";
    }

    /** @brief Extension (with dot) for a Content-Type header value, empty when unknown. */
    static std::string ExtensionForContentType(const std::string& contentType) {
        std::string type = contentType.substr(0, contentType.find(';'));
        type.erase(std::remove_if(type.begin(), type.end(), [](unsigned char c) { return std::isspace(c); }), type.end());
        std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c) { return std::tolower(c); });
        if (type == "application/pdf") return ".pdf";
        if (type == "application/msword") return ".doc";
        if (type == "application/vnd.openxmlformats-officedocument.wordprocessingml.document") return ".docx";
        if (type == "application/vnd.ms-excel") return ".xls";
        if (type == "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet") return ".xlsx";
        if (type == "image/jpeg") return ".jpg";
        if (type == "image/png") return ".png";
        if (type == "image/tiff") return ".tiff";
        if (type == "image/bmp") return ".bmp";
        if (type == "image/gif") return ".gif";
        if (type == "application/json") return ".json";
        return "";
    }
};

} // namespace docingest::infrastructure
