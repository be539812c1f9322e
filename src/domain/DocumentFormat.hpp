/**
 * @file DocumentFormat.hpp
 * @brief Canonical document formats recognised by the extraction pipeline.
 */

#pragma once
#include <string>

namespace docingest::domain {

/**
 * @enum CanonicalFormat
 * @brief Single resolved document type used to select an extraction chain.
 */
enum class CanonicalFormat {
    Pdf,
    Doc,
    Docx,
    Xls,
    Xlsx,
    Jpeg,
    Png,
    Tiff,
    Bmp,
    Gif,
    ManifestJson,
    Unsupported
};

inline std::string ToTag(CanonicalFormat format) {
    switch (format) {
        case CanonicalFormat::Pdf: return "pdf";
        case CanonicalFormat::Doc: return "doc";
        case CanonicalFormat::Docx: return "docx";
        case CanonicalFormat::Xls: return "xls";
        case CanonicalFormat::Xlsx: return "xlsx";
        case CanonicalFormat::Jpeg: return "jpeg";
        case CanonicalFormat::Png: return "png";
        case CanonicalFormat::Tiff: return "tiff";
        case CanonicalFormat::Bmp: return "bmp";
        case CanonicalFormat::Gif: return "gif";
        case CanonicalFormat::ManifestJson: return "json";
        case CanonicalFormat::Unsupported: return "unsupported";
    }
    return "unsupported";
}

inline CanonicalFormat FromTag(const std::string& tag) {
    if (tag == "pdf") return CanonicalFormat::Pdf;
    if (tag == "doc") return CanonicalFormat::Doc;
    if (tag == "docx") return CanonicalFormat::Docx;
    if (tag == "xls") return CanonicalFormat::Xls;
    if (tag == "xlsx") return CanonicalFormat::Xlsx;
    if (tag == "jpeg") return CanonicalFormat::Jpeg;
    if (tag == "png") return CanonicalFormat::Png;
    if (tag == "tiff") return CanonicalFormat::Tiff;
    if (tag == "bmp") return CanonicalFormat::Bmp;
    if (tag == "gif") return CanonicalFormat::Gif;
    if (tag == "json") return CanonicalFormat::ManifestJson;
    return CanonicalFormat::Unsupported;
}

inline bool IsImage(CanonicalFormat format) {
    return format == CanonicalFormat::Jpeg || format == CanonicalFormat::Png ||
           format == CanonicalFormat::Tiff || format == CanonicalFormat::Bmp ||
           format == CanonicalFormat::Gif;
}

inline bool IsSpreadsheet(CanonicalFormat format) {
    return format == CanonicalFormat::Xls || format == CanonicalFormat::Xlsx;
}

} // namespace docingest::domain
