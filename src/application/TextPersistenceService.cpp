/**
 * @file TextPersistenceService.cpp
 * @brief Implementation of TextPersistenceService.
 */

#include "application/TextPersistenceService.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "domain/FetchedFile.hpp"
#include "domain/PipelineError.hpp"
#include "infrastructure/TempFiles.hpp"

namespace docingest::application {

namespace fs = std::filesystem;
using json = nlohmann::json;
using domain::ErrorKind;
using domain::PipelineError;

TextPersistenceService::TextPersistenceService(std::shared_ptr<domain::ResultSink> sink,
                                               std::shared_ptr<domain::ArtifactUploader> uploader,
                                               PersistMode mode,
                                               std::string scratchDir)
    : m_sink(std::move(sink)), m_uploader(std::move(uploader)), m_mode(mode), m_scratchDir(std::move(scratchDir)) {}

std::string TextPersistenceService::TextArtifactName(const std::string& originalName) {
    std::string stem = fs::path(originalName).stem().string();
    if (stem.empty()) stem = "document";
    return stem + ".txt";
}

std::string TextPersistenceService::UtcTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

std::shared_ptr<std::mutex> TextPersistenceService::lockFor(const std::string& documentId) {
    std::lock_guard<std::mutex> guard(m_locksMutex);
    for (auto it = m_recordLocks.begin(); it != m_recordLocks.end();) {
        if (it->second.expired()) {
            it = m_recordLocks.erase(it);
        } else {
            ++it;
        }
    }
    auto lock = m_recordLocks[documentId].lock();
    if (!lock) {
        lock = std::make_shared<std::mutex>();
        m_recordLocks[documentId] = lock;
    }
    return lock;
}

std::string TextPersistenceService::uploadText(const std::string& collectionId,
                                               const std::string& originalName,
                                               const std::string& text) {
    const std::string displayName = TextArtifactName(originalName);
    std::string path;
    try {
        path = infrastructure::TempFiles::CreateWithContent(m_scratchDir, ".txt", text);
    } catch (const std::exception& e) {
        throw PipelineError(ErrorKind::PersistFailure, e.what());
    }
    domain::FetchedFile artifact(path, displayName);

    std::string resourceId = m_uploader->upload(artifact.tempPath(), collectionId, displayName, "text/plain");
    std::cout << "[TextPersistence] Uploaded " << displayName << " as " << resourceId << std::endl;
    return resourceId;
}

void TextPersistenceService::store(const std::string& documentId,
                                   const std::string& collectionId,
                                   const std::string& originalName,
                                   const domain::ExtractionResult& result) {
    if (!m_sink) {
        throw PipelineError(ErrorKind::PersistFailure, "No result sink configured");
    }

    json textData = {
        {"text_length", result.text.size()},
        {"extraction_date", UtcTimestamp()},
        {"version", kFormatVersion},
        {"strategy", result.strategyUsed}
    };

    try {
        if (m_mode == PersistMode::Embed) {
            textData["extracted_text"] = result.text;
        } else if (!result.text.empty()) {
            if (!m_uploader) {
                throw PipelineError(ErrorKind::PersistFailure, "Upload mode selected but no uploader configured");
            }
            textData["text_resource_id"] = uploadText(collectionId, originalName, result.text);
        }

        auto recordLock = lockFor(documentId);
        std::lock_guard<std::mutex> guard(*recordLock);

        domain::MetadataMap metadata = m_sink->getMetadata(documentId);
        metadata[kMetadataKey] = textData.dump();
        m_sink->updateMetadata(documentId, metadata);
    } catch (const PipelineError& e) {
        std::cerr << "[TextPersistence] Error storing text for " << documentId << ": " << e.what() << std::endl;
        throw PipelineError(ErrorKind::PersistFailure, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[TextPersistence] Error storing text for " << documentId << ": " << e.what() << std::endl;
        throw PipelineError(ErrorKind::PersistFailure, std::string("Error storing extracted text: ") + e.what());
    }

    std::cout << "[TextPersistence] Stored " << result.text.size() << " chars for document " << documentId
              << " (" << PersistModeToString(m_mode) << ")" << std::endl;
}

} // namespace docingest::application
