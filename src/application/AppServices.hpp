/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/DocumentActionService.hpp"
#include "application/ExtractionOrchestrator.hpp"
#include "application/PipelineSettings.hpp"
#include "application/TextPersistenceService.hpp"
#include "domain/DocumentCatalog.hpp"
#include "domain/DocumentFetcher.hpp"
#include "domain/ResultSink.hpp"

namespace docingest::application {

struct AppServices {
    PipelineSettings settings;
    std::shared_ptr<domain::ResultSink> sink;
    std::shared_ptr<domain::DocumentCatalog> catalog;
    std::shared_ptr<domain::DocumentFetcher> fetcher;
    std::shared_ptr<domain::ArtifactUploader> uploader;   ///< Null without an upload target.
    std::shared_ptr<TextPersistenceService> persistence;
    std::shared_ptr<ExtractionOrchestrator> orchestrator;
    std::unique_ptr<DocumentActionService> actions;
};

} // namespace docingest::application
