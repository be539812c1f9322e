/**
 * @file DocumentActionService.cpp
 * @brief Implementation of DocumentActionService.
 */

#include "application/DocumentActionService.hpp"
#include <iostream>
#include "domain/PipelineError.hpp"

namespace docingest::application {

DocumentActionService::DocumentActionService(std::shared_ptr<domain::DocumentCatalog> catalog,
                                             std::shared_ptr<ExtractionOrchestrator> orchestrator)
    : m_catalog(std::move(catalog)), m_orchestrator(std::move(orchestrator)) {}

ActionResponse DocumentActionService::handle(const nlohmann::json& request) const {
    if (!request.is_object()) {
        return {false, "Request body must be a JSON object."};
    }
    auto id = request.find("documentId");
    if (id == request.end() || !id->is_string() || id->get<std::string>().empty()) {
        return {false, "Missing 'documentId' in request data."};
    }
    return processDocument(id->get<std::string>());
}

ActionResponse DocumentActionService::processDocument(const std::string& documentId) const {
    std::optional<domain::ResourceRecord> record;
    std::string localPath;
    try {
        record = m_catalog->find(documentId);
        if (record) {
            localPath = m_catalog->localPath(*record);
        }
    } catch (const std::exception& e) {
        std::cerr << "[DocumentAction] Error fetching document " << documentId << ": " << e.what() << std::endl;
        return {false, std::string("Error fetching document: ") + e.what()};
    }
    if (!record) {
        return {false, "Document with id '" + documentId + "' not found."};
    }

    domain::ExtractionOutcome outcome = m_orchestrator->process(*record, localPath);

    if (outcome.isUnsupported()) {
        return {false, "Document format '" + outcome.unsupported().resolvedTag + "' is not supported for text extraction."};
    }
    if (outcome.isFailure()) {
        return {false, "Error processing document: " + outcome.failure().message};
    }

    const auto& result = outcome.result();
    std::string message = "Text extraction completed for document " + documentId + " (" +
                          std::to_string(result.text.size()) + " chars via " + result.strategyUsed + ").";
    if (!result.warnings.empty()) {
        message += " " + std::to_string(result.warnings.size()) + " warning(s).";
    }
    return {true, message};
}

} // namespace docingest::application
