/**
 * @file ResultSink.hpp
 * @brief Interfaces of the external store that receives extraction results.
 */

#pragma once
#include <map>
#include <string>

namespace docingest::domain {

using MetadataMap = std::map<std::string, std::string>;

/**
 * @class ResultSink
 * @brief Key/value metadata store owned by the host platform.
 *
 * Read-modify-write through this interface is not atomic; callers serialise
 * updates to the same document.
 */
class ResultSink {
public:
    virtual ~ResultSink() = default;

    /** @brief Current metadata of a document (empty map when none stored yet). */
    virtual MetadataMap getMetadata(const std::string& documentId) = 0;

    /** @brief Replaces the document metadata with the merged map. Throws on rejection. */
    virtual void updateMetadata(const std::string& documentId, const MetadataMap& merged) = 0;
};

/**
 * @class ArtifactUploader
 * @brief Creates a new document in a collection from a local file.
 */
class ArtifactUploader {
public:
    virtual ~ArtifactUploader() = default;

    /**
     * @return Identifier of the created document.
     * @throws PipelineError on transport failure or rejection.
     */
    virtual std::string upload(const std::string& localPath,
                               const std::string& collectionId,
                               const std::string& displayName,
                               const std::string& mimeType) = 0;
};

} // namespace docingest::domain
