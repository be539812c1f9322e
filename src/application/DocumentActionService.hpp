/**
 * @file DocumentActionService.hpp
 * @brief Host-facing "process document" action.
 */

#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "application/ExtractionOrchestrator.hpp"
#include "domain/DocumentCatalog.hpp"

namespace docingest::application {

/**
 * @struct ActionResponse
 * @brief Reply of the action endpoint: a success message or a single descriptive error.
 */
struct ActionResponse {
    bool success = false;
    std::string message;

    nlohmann::json toJson() const {
        return {{"success", success}, {"message", message}};
    }
};

/**
 * @class DocumentActionService
 * @brief Validates { "documentId": ... } requests and runs the pipeline on the referenced document.
 */
class DocumentActionService {
public:
    DocumentActionService(std::shared_ptr<domain::DocumentCatalog> catalog,
                          std::shared_ptr<ExtractionOrchestrator> orchestrator);

    ActionResponse handle(const nlohmann::json& request) const;

    ActionResponse processDocument(const std::string& documentId) const;

private:
    std::shared_ptr<domain::DocumentCatalog> m_catalog;
    std::shared_ptr<ExtractionOrchestrator> m_orchestrator;
};

} // namespace docingest::application
