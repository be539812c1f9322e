/**
 * @file HttpDocumentFetcher.cpp
 * @brief Implementation of HttpDocumentFetcher.
 */

#include "infrastructure/HttpDocumentFetcher.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <httplib.h>
#include <iostream>
#include <regex>
#include "domain/PipelineError.hpp"
#include "infrastructure/HttpUrl.hpp"
#include "infrastructure/MimeTypes.hpp"
#include "infrastructure/TempFiles.hpp"

namespace docingest::infrastructure {

namespace fs = std::filesystem;
using domain::ErrorKind;
using domain::FetchedFile;
using domain::PipelineError;

namespace {

constexpr const char* kDefaultDocumentName = "document.pdf";

/// Extension of a name reduced to [.a-z0-9], usable as a temp file suffix.
std::string SafeSuffix(const std::string& name) {
    std::string ext = fs::path(name).extension().string();
    std::string out;
    for (char c : ext) {
        unsigned char u = static_cast<unsigned char>(c);
        if (c == '.' || std::isalnum(u)) out.push_back(static_cast<char>(std::tolower(u)));
    }
    return out.size() > 1 ? out : std::string();
}

} // namespace

HttpDocumentFetcher::HttpDocumentFetcher(std::string scratchDir,
                                         std::chrono::seconds timeout,
                                         std::string defaultExtension,
                                         std::chrono::seconds totalTimeout)
    : m_scratchDir(std::move(scratchDir)),
      m_timeout(timeout),
      m_defaultExtension(std::move(defaultExtension)),
      m_totalTimeout(totalTimeout) {}

std::string HttpDocumentFetcher::FilenameFromDisposition(const std::string& contentDisposition) {
    static const std::regex filenamePattern(R"re(filename="?([^";]+)"?)re");
    std::smatch match;
    if (std::regex_search(contentDisposition, match, filenamePattern)) {
        return match[1].str();
    }
    return "";
}

std::string HttpDocumentFetcher::SuggestedName(const std::string& url,
                                               const std::string& contentDisposition,
                                               const std::string& contentType,
                                               const std::string& defaultExtension) {
    std::string name = FilenameFromDisposition(contentDisposition);

    if (name.empty()) {
        std::string path = url.substr(0, url.find_first_of("?#"));
        auto slash = path.find_last_of('/');
        auto schemeEnd = path.find("://");
        bool pathHasSegment = slash != std::string::npos && (schemeEnd == std::string::npos || slash > schemeEnd + 2);
        if (pathHasSegment) {
            name = path.substr(slash + 1);
        }
    }
    if (name.empty()) {
        name = kDefaultDocumentName;
    }

    if (!MimeTypes::IsKnownName(name)) {
        std::string expected = MimeTypes::ExtensionForContentType(contentType);
        name += expected.empty() ? defaultExtension : expected;
    }
    return name;
}

FetchedFile HttpDocumentFetcher::fetch(const std::string& url) {
    auto target = HttpUrl::Parse(url);
    if (!target) {
        throw PipelineError(ErrorKind::NetworkError, "Invalid URL: " + url);
    }

    std::string downloadPath;
    try {
        downloadPath = TempFiles::Create(m_scratchDir, ".part");
    } catch (const std::exception& e) {
        throw PipelineError(ErrorKind::NetworkError, std::string("Cannot create download file: ") + e.what());
    }
    // Owns the partial download until it is renamed.
    FetchedFile partial(downloadPath, "");

    httplib::Client cli(target->origin);
    cli.set_follow_location(true);
    cli.set_connection_timeout(m_timeout);
    cli.set_read_timeout(m_timeout);
    cli.set_write_timeout(m_timeout);

    std::ofstream out(downloadPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw PipelineError(ErrorKind::NetworkError, "Cannot open download file " + downloadPath);
    }

    int status = 0;
    std::string contentDisposition;
    std::string contentType;
    bool deadlineHit = false;
    bool writeFailed = false;
    const auto started = std::chrono::steady_clock::now();

    auto res = cli.Get(
        target->target, httplib::Headers{},
        [&](const httplib::Response& response) {
            status = response.status;
            contentDisposition = response.get_header_value("Content-Disposition");
            contentType = response.get_header_value("Content-Type");
            return status >= 200 && status < 300;
        },
        [&](const char* data, size_t length) {
            if (m_totalTimeout.count() > 0 && std::chrono::steady_clock::now() - started >= m_totalTimeout) {
                deadlineHit = true;
                return false;
            }
            out.write(data, static_cast<std::streamsize>(length));
            if (!out) {
                writeFailed = true;
                return false;
            }
            return true;
        });
    out.close();

    if (status != 0 && (status < 200 || status >= 300)) {
        throw PipelineError(ErrorKind::HttpError, "HTTP " + std::to_string(status) + " fetching " + url);
    }
    if (deadlineHit) {
        throw PipelineError(ErrorKind::Timeout,
                            "Transfer exceeded " + std::to_string(m_totalTimeout.count()) + "s fetching " + url);
    }
    if (writeFailed || out.fail()) {
        throw PipelineError(ErrorKind::NetworkError, "Failed writing download of " + url);
    }
    if (!res) {
        if (res.error() == httplib::Error::ConnectionTimeout || res.error() == httplib::Error::Read) {
            throw PipelineError(ErrorKind::Timeout,
                                "Connection timed out after " + std::to_string(m_timeout.count()) + "s: " + url);
        }
        throw PipelineError(ErrorKind::NetworkError, "Fetching " + url + " failed: " + httplib::to_string(res.error()));
    }

    std::string suggestedName = SuggestedName(url, contentDisposition, contentType, m_defaultExtension);

    std::string finalPath;
    try {
        finalPath = TempFiles::Create(m_scratchDir, SafeSuffix(suggestedName));
    } catch (const std::exception& e) {
        throw PipelineError(ErrorKind::NetworkError, std::string("Cannot create download file: ") + e.what());
    }
    FetchedFile fetched(finalPath, suggestedName);

    std::error_code ec;
    fs::rename(downloadPath, finalPath, ec);
    if (ec) {
        throw PipelineError(ErrorKind::NetworkError, "Cannot move download into place: " + ec.message());
    }

    std::cout << "[HttpFetcher] Downloaded " << url << " as " << suggestedName
              << " (" << fs::file_size(finalPath, ec) << " bytes)" << std::endl;
    return fetched;
}

} // namespace docingest::infrastructure
