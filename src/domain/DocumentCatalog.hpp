/**
 * @file DocumentCatalog.hpp
 * @brief Host-side lookup of document records and their files.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/DocumentRef.hpp"

namespace docingest::domain {

class DocumentCatalog {
public:
    virtual ~DocumentCatalog() = default;

    virtual std::optional<ResourceRecord> find(const std::string& documentId) = 0;

    /** @brief Local filesystem path holding the record's uploaded file. */
    virtual std::string localPath(const ResourceRecord& record) = 0;
};

} // namespace docingest::domain
