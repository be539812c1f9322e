/**
 * @file ExtractionOrchestrator.cpp
 * @brief Implementation of ExtractionOrchestrator.
 */

#include "application/ExtractionOrchestrator.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include "application/FormatResolver.hpp"
#include "application/ManifestInterpreter.hpp"
#include "domain/PipelineError.hpp"
#include "infrastructure/MimeTypes.hpp"

namespace docingest::application {

using domain::CanonicalFormat;
using domain::ErrorKind;
using domain::ExtractionOutcome;
using domain::PipelineError;

ExtractionOrchestrator::ExtractionOrchestrator(ExtractionChains chains,
                                               std::shared_ptr<domain::DocumentFetcher> fetcher,
                                               std::shared_ptr<TextPersistenceService> persistence,
                                               std::shared_ptr<domain::ArtifactUploader> manifestUploader,
                                               size_t maxWorkers)
    : m_chains(std::move(chains)),
      m_fetcher(std::move(fetcher)),
      m_persistence(std::move(persistence)),
      m_manifestUploader(std::move(manifestUploader)),
      m_executor(maxWorkers) {}

std::string ExtractionOrchestrator::OriginalName(const std::string& sourceNameOrURL) {
    std::string path = sourceNameOrURL.substr(0, sourceNameOrURL.find('?'));
    auto slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

ExtractionOutcome ExtractionOrchestrator::process(const domain::DocumentRef& ref,
                                                  const std::optional<PersistTarget>& target) const {
    return processAt(ref, target, 0);
}

ExtractionOutcome ExtractionOrchestrator::process(const domain::ResourceRecord& record,
                                                  const std::string& localPath) const {
    domain::DocumentRef ref{localPath, record.formatTag, record.sourceNameOrURL()};
    return processAt(ref, PersistTarget{record.id, record.parentId}, 0);
}

ExtractionOutcome ExtractionOrchestrator::processAt(const domain::DocumentRef& ref,
                                                    const std::optional<PersistTarget>& target,
                                                    int depth) const {
    // Resolving
    const std::string tag = FormatResolver::ResolveTag(ref.declaredFormat, ref.sourceNameOrURL);
    const CanonicalFormat format = FormatResolver::Resolve(ref.declaredFormat, ref.sourceNameOrURL);
    std::cout << "[Orchestrator] Declared format '" << ref.declaredFormat << "', source '" << ref.sourceNameOrURL
              << "', resolved '" << tag << "'" << std::endl;

    if (format == CanonicalFormat::Unsupported) {
        std::cout << "[Orchestrator] Unsupported format for text extraction: '" << tag << "', skipping." << std::endl;
        return ExtractionOutcome::Unsupported(tag);
    }

    // Dispatching
    if (format == CanonicalFormat::ManifestJson) {
        return ingestManifestFileAt(ref.localPath, target ? target->collectionId : std::string(), depth);
    }

    const StrategyChain* chain = m_chains.find(format);
    if (!chain) {
        std::cerr << "[Orchestrator] No extraction chain available for '" << tag << "'" << std::endl;
        return ExtractionOutcome::Failure(ErrorKind::EngineMissing, "No extraction chain available for format '" + tag + "'");
    }

    // Extracting
    ExtractionOutcome outcome = chain->run(ref.localPath);
    if (!outcome.isSuccess()) {
        std::cerr << "[Orchestrator] Extraction failed for " << ref.sourceNameOrURL << ": " << outcome.describe() << std::endl;
        return outcome;
    }
    std::cout << "[Orchestrator] " << ref.sourceNameOrURL << ": " << outcome.describe() << std::endl;

    // Persisting
    if (!target || !m_persistence) {
        return outcome;
    }
    try {
        m_persistence->store(target->documentId, target->collectionId, OriginalName(ref.sourceNameOrURL), outcome.result());
    } catch (const PipelineError& e) {
        return ExtractionOutcome::Failure(ErrorKind::PersistFailure, e.what());
    }
    return outcome;
}

ExtractionOutcome ExtractionOrchestrator::ingestManifestFile(const std::string& localPath,
                                                             const std::string& collectionId) const {
    return ingestManifestFileAt(localPath, collectionId, 0);
}

ExtractionOutcome ExtractionOrchestrator::ingestManifestFileAt(const std::string& localPath,
                                                               const std::string& collectionId,
                                                               int depth) const {
    if (depth >= kMaxManifestDepth) {
        return ExtractionOutcome::Failure(ErrorKind::ParseError,
                                          "Manifest nesting exceeds " + std::to_string(kMaxManifestDepth) + " levels: " + localPath);
    }

    std::ifstream file(localPath, std::ios::binary);
    if (!file.is_open()) {
        return ExtractionOutcome::Failure(ErrorKind::FileNotFound, "File not found: " + localPath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json manifest;
    try {
        manifest = ManifestInterpreter::Parse(buffer.str());
    } catch (const PipelineError& e) {
        std::cerr << "[Orchestrator] Error processing manifest " << localPath << ": " << e.what() << std::endl;
        return ExtractionOutcome::Failure(e.kind(), e.what());
    }

    std::vector<ExtractionOutcome> outcomes = ingestManifestAt(manifest, collectionId, depth + 1);

    domain::ExtractionResult summary;
    summary.strategyUsed = "manifest";
    size_t failed = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.isFailure()) {
            ++failed;
            summary.warnings.push_back(outcome.describe());
        }
    }
    std::cout << "[Orchestrator] Manifest " << localPath << ": " << outcomes.size() << " URL(s), "
              << failed << " failed." << std::endl;
    return ExtractionOutcome::Success(std::move(summary));
}

std::vector<ExtractionOutcome> ExtractionOrchestrator::ingestManifest(const nlohmann::json& manifest,
                                                                      const std::string& collectionId) const {
    return ingestManifestAt(manifest, collectionId, 1);
}

std::vector<ExtractionOutcome> ExtractionOrchestrator::ingestManifestAt(const nlohmann::json& manifest,
                                                                        const std::string& collectionId,
                                                                        int depth) const {
    const std::vector<std::string> urls = ManifestInterpreter::DiscoverUrls(manifest);
    if (urls.empty()) {
        return {};
    }

    std::function<ExtractionOutcome(size_t)> work = [&](size_t i) {
        return ingestUrl(urls[i], collectionId, depth);
    };
    std::function<ExtractionOutcome(size_t, const std::string&)> onError = [&](size_t i, const std::string& message) {
        std::cerr << "[Orchestrator] Error ingesting " << urls[i] << ": " << message << std::endl;
        return ExtractionOutcome::Failure(ErrorKind::EngineFailure, urls[i] + ": " + message);
    };
    return m_executor.Run<ExtractionOutcome>(urls.size(), work, onError);
}

ExtractionOutcome ExtractionOrchestrator::ingestUrl(const std::string& url, const std::string& collectionId, int depth) const {
    if (!m_fetcher) {
        return ExtractionOutcome::Failure(ErrorKind::NetworkError, "No document fetcher configured for " + url);
    }

    try {
        std::cout << "[Orchestrator] Downloading " << url << std::endl;
        domain::FetchedFile file = m_fetcher->fetch(url);

        std::string documentId;
        if (m_manifestUploader) {
            documentId = m_manifestUploader->upload(file.tempPath(), collectionId, file.suggestedName(),
                                                    infrastructure::MimeTypes::ForName(file.suggestedName()));
        } else {
            // Keyed by URL: distinct links may derive the same file name.
            documentId = collectionId.empty() ? url : collectionId + "/" + url;
        }

        domain::DocumentRef ref{file.tempPath(), "", file.suggestedName()};
        ExtractionOutcome outcome = processAt(ref, PersistTarget{documentId, collectionId}, depth);

        const std::string tempPath = file.tempPath();
        file.release();
        std::cout << "[Orchestrator] Temp file " << tempPath << " removed after extraction" << std::endl;

        if (outcome.isFailure()) {
            return ExtractionOutcome::Failure(outcome.failure().kind, url + ": " + outcome.failure().message);
        }
        return outcome;
    } catch (const PipelineError& e) {
        if (e.kind() == ErrorKind::Timeout) {
            std::cerr << "[Orchestrator] Timeout while downloading file: " << url << std::endl;
        } else {
            std::cerr << "[Orchestrator] Error downloading/processing " << url << ": " << e.what() << std::endl;
        }
        return ExtractionOutcome::Failure(e.kind(), url + ": " + e.what());
    }
}

} // namespace docingest::application
