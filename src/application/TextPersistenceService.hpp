/**
 * @file TextPersistenceService.hpp
 * @brief Writes extraction results into the host metadata store.
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "application/PipelineSettings.hpp"
#include "domain/ExtractionOutcome.hpp"
#include "domain/ResultSink.hpp"

namespace docingest::application {

/**
 * @class TextPersistenceService
 * @brief Merges one "extracted_text_data" entry into a document's metadata.
 *
 * Updates for the same document are serialised through a per-record mutex since
 * the sink merge is last-writer-wins.
 */
class TextPersistenceService {
public:
    static constexpr const char* kMetadataKey = "extracted_text_data";
    static constexpr const char* kFormatVersion = "1.0";

    TextPersistenceService(std::shared_ptr<domain::ResultSink> sink,
                           std::shared_ptr<domain::ArtifactUploader> uploader,
                           PersistMode mode,
                           std::string scratchDir);

    /**
     * @brief Persists text and provenance for a document.
     * @param originalName File name the text came from; the .txt artifact is named after its stem.
     * @throws domain::PipelineError (PersistFailure) when the sink or uploader rejects the write.
     */
    void store(const std::string& documentId,
               const std::string& collectionId,
               const std::string& originalName,
               const domain::ExtractionResult& result);

    PersistMode mode() const { return m_mode; }

    /** @brief "<stem>.txt" for a source file name. */
    static std::string TextArtifactName(const std::string& originalName);

    /** @brief Current UTC time as ISO-8601 without zone suffix. */
    static std::string UtcTimestamp();

private:
    std::shared_ptr<std::mutex> lockFor(const std::string& documentId);
    std::string uploadText(const std::string& collectionId, const std::string& originalName, const std::string& text);

    std::shared_ptr<domain::ResultSink> m_sink;
    std::shared_ptr<domain::ArtifactUploader> m_uploader;
    PersistMode m_mode;
    std::string m_scratchDir;

    std::mutex m_locksMutex;
    std::map<std::string, std::weak_ptr<std::mutex>> m_recordLocks;
};

} // namespace docingest::application
