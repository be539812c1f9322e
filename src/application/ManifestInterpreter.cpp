/**
 * @file ManifestInterpreter.cpp
 * @brief Implementation of ManifestInterpreter.
 */

#include "application/ManifestInterpreter.hpp"
#include <iostream>
#include <regex>
#include "domain/PipelineError.hpp"

namespace docingest::application {

using json = nlohmann::json;

namespace {

// releases[].tender.documents[].url, tolerating missing or mistyped levels.
std::vector<std::string> CollectReleaseDocuments(const json& releases) {
    std::vector<std::string> urls;
    if (!releases.is_array()) return urls;

    for (const auto& release : releases) {
        if (!release.is_object()) continue;
        auto tender = release.find("tender");
        if (tender == release.end() || !tender->is_object()) continue;
        auto documents = tender->find("documents");
        if (documents == tender->end() || !documents->is_array()) continue;

        for (const auto& doc : *documents) {
            if (!doc.is_object()) continue;
            auto url = doc.find("url");
            if (url != doc.end() && url->is_string() && !url->get<std::string>().empty()) {
                urls.push_back(url->get<std::string>());
            }
        }
    }
    return urls;
}

std::optional<std::string> FindGermanPdf(const json& manifest) {
    auto links = manifest.find("links");
    if (links == manifest.end() || !links->is_object()) return std::nullopt;
    auto pdf = links->find("pdf");
    if (pdf == links->end() || !pdf->is_object()) return std::nullopt;
    auto deu = pdf->find("DEU");
    if (deu == pdf->end() || !deu->is_string() || deu->get<std::string>().empty()) return std::nullopt;
    return deu->get<std::string>();
}

} // namespace

domain::ManifestShape ManifestInterpreter::Classify(const json& manifest) {
    if (!manifest.is_object()) {
        return domain::Unrecognized{};
    }
    if (manifest.contains("releases")) {
        return domain::TedRelease{CollectReleaseDocuments(manifest.at("releases"))};
    }
    return domain::BeschaLinks{FindGermanPdf(manifest)};
}

std::string ManifestInterpreter::RewriteIdentifierTokens(const std::string& rawText) {
    static const std::regex objectId(R"re(ObjectId\(\s*"([0-9a-fA-F]+)"\s*\))re");
    return std::regex_replace(rawText, objectId, "\"$1\"");
}

json ManifestInterpreter::Parse(const std::string& rawText) {
    try {
        return json::parse(RewriteIdentifierTokens(rawText));
    } catch (const json::parse_error& e) {
        throw domain::PipelineError(domain::ErrorKind::ParseError, std::string("Invalid manifest JSON: ") + e.what());
    }
}

std::vector<std::string> ManifestInterpreter::DiscoverUrls(const json& manifest) {
    domain::ManifestShape shape = Classify(manifest);
    std::vector<std::string> urls = domain::ManifestUrls(shape);

    if (std::holds_alternative<domain::Unrecognized>(shape)) {
        std::cout << "[ManifestInterpreter] Unrecognized manifest shape, nothing to ingest." << std::endl;
    } else if (std::holds_alternative<domain::BeschaLinks>(shape) && urls.empty()) {
        std::cerr << "[ManifestInterpreter] No German (DEU) PDF URL found in manifest." << std::endl;
    } else {
        std::cout << "[ManifestInterpreter] " << domain::ManifestShapeName(shape) << " manifest with "
                  << urls.size() << " document URL(s)." << std::endl;
    }
    return urls;
}

} // namespace docingest::application
