/**
 * @file HttpDocumentFetcher.hpp
 * @brief DocumentFetcher over HTTP(S) using cpp-httplib.
 */

#pragma once
#include <chrono>
#include <string>
#include "domain/DocumentFetcher.hpp"

namespace docingest::infrastructure {

class HttpDocumentFetcher : public domain::DocumentFetcher {
public:
    /**
     * @param scratchDir Directory for downloads (system temp dir when empty).
     * @param timeout Applies to connecting and to each read.
     * @param defaultExtension Appended to names without a recognised extension
     *        when the Content-Type does not name one.
     * @param totalTimeout Cap on the whole transfer, 0 for none. A transfer that
     *        completes is always kept.
     */
    HttpDocumentFetcher(std::string scratchDir,
                        std::chrono::seconds timeout,
                        std::string defaultExtension = ".pdf",
                        std::chrono::seconds totalTimeout = std::chrono::seconds(0));

    domain::FetchedFile fetch(const std::string& url) override;

    /** @brief Value of the filename parameter of a Content-Disposition header, empty when absent. */
    static std::string FilenameFromDisposition(const std::string& contentDisposition);

    /**
     * @brief Name used for a downloaded document.
     *
     * Header filename, else the last URL path segment, else "document.pdf"; the
     * expected extension is appended unless the name already carries a known one.
     */
    static std::string SuggestedName(const std::string& url,
                                     const std::string& contentDisposition,
                                     const std::string& contentType,
                                     const std::string& defaultExtension);

private:
    std::string m_scratchDir;
    std::chrono::seconds m_timeout;
    std::string m_defaultExtension;
    std::chrono::seconds m_totalTimeout;
};

} // namespace docingest::infrastructure
