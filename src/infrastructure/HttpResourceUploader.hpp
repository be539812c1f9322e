/**
 * @file HttpResourceUploader.hpp
 * @brief ArtifactUploader posting multipart resource-creation requests.
 */

#pragma once
#include <chrono>
#include <string>
#include "domain/ResultSink.hpp"

namespace docingest::infrastructure {

/**
 * @class HttpResourceUploader
 * @brief Creates a resource in a collection by POSTing the file as multipart form data.
 *
 * Form fields: package_id, name, format (extension without dot, "bin" when none),
 * mimetype, and the file part "upload". The token is sent as the Authorization header.
 * A reply must be JSON with "success": true and carry "result.id".
 */
class HttpResourceUploader : public domain::ArtifactUploader {
public:
    HttpResourceUploader(std::string endpoint, std::string apiToken, std::chrono::seconds timeout);

    std::string upload(const std::string& localPath,
                       const std::string& collectionId,
                       const std::string& displayName,
                       const std::string& mimeType) override;

    /** @brief Format field value for a display name: extension without dot, lower-cased, or "bin". */
    static std::string FormatField(const std::string& displayName);

    /**
     * @brief Extracts result.id from a resource-creation reply.
     * @throws domain::PipelineError ParseError for malformed JSON, PersistFailure when rejected.
     */
    static std::string ParseCreatedId(const std::string& responseBody);

private:
    std::string m_endpoint;
    std::string m_apiToken;
    std::chrono::seconds m_timeout;
};

} // namespace docingest::infrastructure
