/**
 * @file ExtractionOrchestrator.hpp
 * @brief Drives format resolution, extraction chains, manifest ingestion and persistence.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/BoundedExecutor.hpp"
#include "application/ExtractionChains.hpp"
#include "application/TextPersistenceService.hpp"
#include "domain/DocumentFetcher.hpp"
#include "domain/DocumentRef.hpp"
#include "domain/ExtractionOutcome.hpp"
#include "domain/ResultSink.hpp"

namespace docingest::application {

/**
 * @struct PersistTarget
 * @brief Record that receives the extracted text.
 */
struct PersistTarget {
    std::string documentId;
    std::string collectionId;
};

/**
 * @class ExtractionOrchestrator
 * @brief Resolving -> Dispatching -> Extracting -> Persisting, one unit of work per call.
 *
 * Holds no per-call state, so concurrent calls for different documents are
 * independent and a repeated call on an unchanged file yields the same text.
 */
class ExtractionOrchestrator {
public:
    ExtractionOrchestrator(ExtractionChains chains,
                           std::shared_ptr<domain::DocumentFetcher> fetcher,
                           std::shared_ptr<TextPersistenceService> persistence,
                           std::shared_ptr<domain::ArtifactUploader> manifestUploader,
                           size_t maxWorkers);

    /**
     * @brief Extracts a local file and, when a target is given, persists the text.
     *
     * Manifests are ingested instead of extracted; the returned Success carries no
     * text and one warning per failed URL.
     */
    domain::ExtractionOutcome process(const domain::DocumentRef& ref,
                                      const std::optional<PersistTarget>& target = std::nullopt) const;

    /** @brief process() for a host record whose file lives at localPath. */
    domain::ExtractionOutcome process(const domain::ResourceRecord& record, const std::string& localPath) const;

    /**
     * @brief Fetches and processes every URL a manifest references, best effort.
     * @return One outcome per discovered URL, in manifest order.
     */
    std::vector<domain::ExtractionOutcome> ingestManifest(const nlohmann::json& manifest,
                                                          const std::string& collectionId) const;

    /** @brief Reads, repairs and parses a manifest file, then ingests it. */
    domain::ExtractionOutcome ingestManifestFile(const std::string& localPath, const std::string& collectionId) const;

    /** @brief File name portion of a URL or name, query string removed. */
    static std::string OriginalName(const std::string& sourceNameOrURL);

private:
    static constexpr int kMaxManifestDepth = 2;

    domain::ExtractionOutcome processAt(const domain::DocumentRef& ref,
                                        const std::optional<PersistTarget>& target,
                                        int depth) const;
    std::vector<domain::ExtractionOutcome> ingestManifestAt(const nlohmann::json& manifest,
                                                            const std::string& collectionId,
                                                            int depth) const;
    domain::ExtractionOutcome ingestManifestFileAt(const std::string& localPath,
                                                   const std::string& collectionId,
                                                   int depth) const;
    domain::ExtractionOutcome ingestUrl(const std::string& url, const std::string& collectionId, int depth) const;

    ExtractionChains m_chains;
    std::shared_ptr<domain::DocumentFetcher> m_fetcher;
    std::shared_ptr<TextPersistenceService> m_persistence;
    std::shared_ptr<domain::ArtifactUploader> m_manifestUploader;
    BoundedExecutor m_executor;
};

} // namespace docingest::application
