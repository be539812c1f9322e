/**
 * @file ManifestShape.hpp
 * @brief Known shapes of JSON manifests referencing remote documents.
 */

#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docingest::domain {

/** @brief Procurement release listing: releases[].tender.documents[].url */
struct TedRelease {
    std::vector<std::string> documents;
};

/** @brief Single-notice listing: links.pdf.DEU */
struct BeschaLinks {
    std::optional<std::string> germanURL;
};

struct Unrecognized {};

using ManifestShape = std::variant<TedRelease, BeschaLinks, Unrecognized>;

/** @brief Remote document URLs carried by a classified manifest. */
inline std::vector<std::string> ManifestUrls(const ManifestShape& shape) {
    if (const auto* ted = std::get_if<TedRelease>(&shape)) {
        return ted->documents;
    }
    if (const auto* bescha = std::get_if<BeschaLinks>(&shape)) {
        if (bescha->germanURL) return {*bescha->germanURL};
    }
    return {};
}

inline std::string ManifestShapeName(const ManifestShape& shape) {
    if (std::holds_alternative<TedRelease>(shape)) return "TedRelease";
    if (std::holds_alternative<BeschaLinks>(shape)) return "BeschaLinks";
    return "Unrecognized";
}

} // namespace docingest::domain
