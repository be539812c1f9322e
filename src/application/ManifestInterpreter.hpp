/**
 * @file ManifestInterpreter.hpp
 * @brief Classifies JSON manifests and extracts the remote document URLs they reference.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/ManifestShape.hpp"

namespace docingest::application {

class ManifestInterpreter {
public:
    /**
     * @brief First-match classification on top-level keys.
     *
     * An object with "releases" is a TedRelease, any other object is BeschaLinks
     * (its URL may be absent), a non-object value is Unrecognized.
     */
    static domain::ManifestShape Classify(const nlohmann::json& manifest);

    /** @brief Rewrites ObjectId("<hex>") tokens to plain quoted "<hex>" strings. */
    static std::string RewriteIdentifierTokens(const std::string& rawText);

    /**
     * @brief Rewrites identifier tokens, then parses.
     * @throws domain::PipelineError (ParseError) when the text is not JSON.
     */
    static nlohmann::json Parse(const std::string& rawText);

    /** @brief Classify + collect URLs, logging the shape found. */
    static std::vector<std::string> DiscoverUrls(const nlohmann::json& manifest);
};

} // namespace docingest::application
