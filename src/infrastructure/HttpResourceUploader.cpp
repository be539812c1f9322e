/**
 * @file HttpResourceUploader.cpp
 * @brief Implementation of HttpResourceUploader.
 */

#include "infrastructure/HttpResourceUploader.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include "domain/PipelineError.hpp"
#include "infrastructure/HttpUrl.hpp"

namespace docingest::infrastructure {

using json = nlohmann::json;
using domain::ErrorKind;
using domain::PipelineError;

HttpResourceUploader::HttpResourceUploader(std::string endpoint, std::string apiToken, std::chrono::seconds timeout)
    : m_endpoint(std::move(endpoint)), m_apiToken(std::move(apiToken)), m_timeout(timeout) {}

std::string HttpResourceUploader::FormatField(const std::string& displayName) {
    std::string ext = std::filesystem::path(displayName).extension().string();
    if (ext.size() <= 1) return "bin";
    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

std::string HttpResourceUploader::ParseCreatedId(const std::string& responseBody) {
    json body;
    try {
        body = json::parse(responseBody);
    } catch (const json::parse_error& e) {
        throw PipelineError(ErrorKind::ParseError, std::string("Upload reply is not JSON: ") + e.what());
    }

    if (!body.is_object() || !body.value("success", false)) {
        std::string detail = body.is_object() && body.contains("error") ? body["error"].dump() : responseBody;
        throw PipelineError(ErrorKind::PersistFailure, "Upload rejected: " + detail);
    }

    const json* result = body.contains("result") ? &body["result"] : nullptr;
    if (!result || !result->is_object() || !result->contains("id") || !(*result)["id"].is_string()) {
        throw PipelineError(ErrorKind::PersistFailure, "Upload reply carries no result id");
    }
    return (*result)["id"].get<std::string>();
}

std::string HttpResourceUploader::upload(const std::string& localPath,
                                         const std::string& collectionId,
                                         const std::string& displayName,
                                         const std::string& mimeType) {
    auto target = HttpUrl::Parse(m_endpoint);
    if (!target) {
        throw PipelineError(ErrorKind::InvalidRequest, "Upload endpoint is not an http(s) URL");
    }

    std::ifstream in(localPath, std::ios::binary);
    if (!in.is_open()) {
        throw PipelineError(ErrorKind::FileNotFound, "Cannot read upload source " + localPath);
    }
    std::stringstream content;
    content << in.rdbuf();

    std::string resourceName = displayName.empty() ? std::filesystem::path(localPath).filename().string() : displayName;

    httplib::MultipartFormDataItems items = {
        {"package_id", collectionId, "", ""},
        {"name", resourceName, "", ""},
        {"format", FormatField(resourceName), "", ""},
        {"mimetype", mimeType, "", ""},
        {"upload", content.str(), resourceName, mimeType},
    };

    httplib::Client cli(target->origin);
    cli.set_connection_timeout(m_timeout);
    cli.set_read_timeout(m_timeout);
    cli.set_write_timeout(m_timeout);

    httplib::Headers headers = {{"Authorization", m_apiToken}};

    std::cout << "[Uploader] Uploading " << resourceName << " (" << mimeType << ") to collection " << collectionId << std::endl;
    auto res = cli.Post(target->target, headers, items);
    if (!res) {
        auto error = res.error();
        if (error == httplib::Error::ConnectionTimeout || error == httplib::Error::Read) {
            throw PipelineError(ErrorKind::Timeout, "Upload of " + resourceName + " timed out: " + httplib::to_string(error));
        }
        throw PipelineError(ErrorKind::NetworkError, "Upload of " + resourceName + " failed: " + httplib::to_string(error));
    }
    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[Uploader] HTTP Error " << res->status << ": " << res->body << std::endl;
        throw PipelineError(ErrorKind::HttpError, "Upload of " + resourceName + " returned HTTP " + std::to_string(res->status));
    }

    std::string id = ParseCreatedId(res->body);
    std::cout << "[Uploader] Created resource " << id << std::endl;
    return id;
}

} // namespace docingest::infrastructure
