/**
 * @file FormatResolver.hpp
 * @brief Reconciles a declared format label with the file name extension.
 */

#pragma once
#include <string>
#include "domain/DocumentFormat.hpp"

namespace docingest::application {

/**
 * @class FormatResolver
 * @brief Pure mapping (declaredFormat, sourceNameOrURL) -> canonical format.
 *
 * A known extension wins over the declared label; an unknown extension never
 * overrides it. File content is never consulted.
 */
class FormatResolver {
public:
    static domain::CanonicalFormat Resolve(const std::string& declaredFormat, const std::string& sourceNameOrURL);

    /** @brief Same decision as Resolve, returning the raw tag (useful for logging unknown labels). */
    static std::string ResolveTag(const std::string& declaredFormat, const std::string& sourceNameOrURL);

    /** @brief Maps a synonym ("jpg", "tif") to its canonical tag, or returns the input unchanged. */
    static std::string NormalizeTag(const std::string& tag);

    /** @brief True when the tag is one of the synonym table's canonical values. */
    static bool IsKnownTag(const std::string& tag);

    /** @brief Lower-cased extension after the last '.', without the dot. Query strings are ignored. */
    static std::string ExtensionOf(const std::string& sourceNameOrURL);
};

} // namespace docingest::application
