/**
 * @file FormatResolver.cpp
 * @brief Implementation of FormatResolver.
 */

#include "application/FormatResolver.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace docingest::application {

namespace {

const std::map<std::string, std::string>& SynonymTable() {
    static const std::map<std::string, std::string> table = {
        {"pdf", "pdf"},
        {"doc", "doc"},
        {"docx", "docx"},
        {"xls", "xls"},
        {"xlsx", "xlsx"},
        {"jpeg", "jpeg"},
        {"jpg", "jpeg"},
        {"png", "png"},
        {"tiff", "tiff"},
        {"tif", "tiff"},
        {"bmp", "bmp"},
        {"gif", "gif"},
        {"json", "json"},
    };
    return table;
}

std::string ToLowerTrimmed(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return "";
    std::string out(begin, end);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

} // namespace

std::string FormatResolver::NormalizeTag(const std::string& tag) {
    const auto& table = SynonymTable();
    auto it = table.find(tag);
    return it != table.end() ? it->second : tag;
}

bool FormatResolver::IsKnownTag(const std::string& tag) {
    for (const auto& entry : SynonymTable()) {
        if (entry.second == tag) return true;
    }
    return false;
}

std::string FormatResolver::ExtensionOf(const std::string& sourceNameOrURL) {
    std::string path = sourceNameOrURL.substr(0, sourceNameOrURL.find_first_of("?#"));
    auto slash = path.find_last_of("/\\");
    std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = base.find_last_of('.');
    // A leading dot marks a hidden file, not an extension.
    if (dot == std::string::npos || dot == 0) return "";
    return ToLowerTrimmed(base.substr(dot + 1));
}

std::string FormatResolver::ResolveTag(const std::string& declaredFormat, const std::string& sourceNameOrURL) {
    std::string declared = NormalizeTag(ToLowerTrimmed(declaredFormat));
    std::string fromExtension = NormalizeTag(ExtensionOf(sourceNameOrURL));

    if (fromExtension != declared && IsKnownTag(fromExtension)) {
        return fromExtension;
    }
    return declared;
}

domain::CanonicalFormat FormatResolver::Resolve(const std::string& declaredFormat, const std::string& sourceNameOrURL) {
    std::string tag = ResolveTag(declaredFormat, sourceNameOrURL);
    if (!IsKnownTag(tag)) return domain::CanonicalFormat::Unsupported;
    return domain::FromTag(tag);
}

} // namespace docingest::application
