/**
 * @file DocumentFetcher.hpp
 * @brief Interface for downloading remote documents.
 */

#pragma once
#include <string>
#include "domain/FetchedFile.hpp"

namespace docingest::domain {

class DocumentFetcher {
public:
    virtual ~DocumentFetcher() = default;

    /**
     * @brief Downloads a URL into a uniquely named temp file owned by the caller.
     * @throws PipelineError with kind Timeout, NetworkError or HttpError.
     */
    virtual FetchedFile fetch(const std::string& url) = 0;
};

} // namespace docingest::domain
