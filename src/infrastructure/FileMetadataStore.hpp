/**
 * @file FileMetadataStore.hpp
 * @brief File-backed ResultSink: one JSON object per document.
 */

#pragma once
#include <filesystem>
#include <string>
#include "domain/ResultSink.hpp"

namespace docingest::infrastructure {

/**
 * @class FileMetadataStore
 * @brief Stores each document's metadata map in <root>/metadata/<escaped id>.json.
 *
 * Writes go to a temp file in the same directory and are renamed over the target.
 */
class FileMetadataStore : public domain::ResultSink {
public:
    explicit FileMetadataStore(std::filesystem::path root);

    domain::MetadataMap getMetadata(const std::string& documentId) override;
    void updateMetadata(const std::string& documentId, const domain::MetadataMap& merged) override;

    /** @brief Path holding a document's metadata. */
    std::filesystem::path pathFor(const std::string& documentId) const;

    /** @brief File-name-safe form of an identifier; bytes outside [A-Za-z0-9._-] become %XX. */
    static std::string EscapeId(const std::string& documentId);

private:
    std::filesystem::path m_dir;
};

} // namespace docingest::infrastructure
