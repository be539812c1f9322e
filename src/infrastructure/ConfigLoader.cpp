/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include "infrastructure/PathUtils.hpp"

namespace docingest::infrastructure {

using application::PersistMode;
using application::PipelineSettings;
using json = nlohmann::json;

namespace {

/// Integer in [minimum, max of T]; anything else is logged and skipped.
template <typename T>
void ReadInteger(const json& j, const char* key, long long minimum, T& target) {
    if (!j.contains(key)) return;
    const json& value = j[key];
    const unsigned long long limit = static_cast<unsigned long long>(std::numeric_limits<T>::max());
    bool valid = false;
    if (value.is_number_unsigned()) {
        valid = value.get<unsigned long long>() <= limit &&
                value.get<unsigned long long>() >= static_cast<unsigned long long>(minimum);
    } else if (value.is_number_integer()) {
        valid = value.get<long long>() >= minimum &&
                static_cast<unsigned long long>(value.get<long long>()) <= limit;
    }
    if (!valid) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected an integer from " << minimum
                  << " to " << limit << std::endl;
        return;
    }
    target = value.is_number_unsigned() ? static_cast<T>(value.get<unsigned long long>())
                                         : static_cast<T>(value.get<long long>());
}

template <typename T>
void ReadPositive(const json& j, const char* key, T& target) {
    ReadInteger(j, key, 1, target);
}

void ReadString(const json& j, const char* key, std::string& target) {
    if (!j.contains(key)) return;
    if (!j[key].is_string()) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a string" << std::endl;
        return;
    }
    target = j[key].get<std::string>();
}

} // namespace

PipelineSettings ConfigLoader::Defaults() {
    PipelineSettings settings;
    std::filesystem::path dataDir = PathUtils::GetAppDataDir();
    settings.catalogPath = (dataDir / "catalog.json").string();
    settings.storeDir = (dataDir / "store").string();
    settings.scratchDir = PathUtils::GetScratchDir().string();
    return settings;
}

void ConfigLoader::ApplyJson(const json& j, PipelineSettings& settings) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json must contain a JSON object; using defaults" << std::endl;
        return;
    }

    ReadString(j, "catalog_path", settings.catalogPath);
    ReadString(j, "store_dir", settings.storeDir);
    ReadString(j, "scratch_dir", settings.scratchDir);
    ReadString(j, "upload_endpoint", settings.uploadEndpoint);
    ReadString(j, "api_token", settings.apiToken);
    ReadString(j, "ocr_language", settings.ocrLanguage);
    ReadString(j, "tessdata_path", settings.tessdataPath);

    if (j.contains("persist_mode")) {
        std::string mode = j["persist_mode"].is_string() ? j["persist_mode"].get<std::string>() : "";
        if (mode == "embed") {
            settings.persistMode = PersistMode::Embed;
        } else if (mode == "upload") {
            settings.persistMode = PersistMode::Upload;
        } else {
            std::cerr << "[ConfigLoader] Ignoring 'persist_mode': expected \"embed\" or \"upload\"" << std::endl;
        }
    }

    ReadPositive(j, "fetch_timeout_seconds", settings.fetchTimeoutSeconds);
    ReadPositive(j, "upload_timeout_seconds", settings.uploadTimeoutSeconds);
    ReadPositive(j, "tool_timeout_seconds", settings.toolTimeoutSeconds);
    ReadPositive(j, "max_workers", settings.maxWorkers);
    ReadPositive(j, "ocr_dpi", settings.ocrDpi);

    ReadInteger(j, "fetch_total_timeout_seconds", 0, settings.fetchTotalTimeoutSeconds);
    ReadInteger(j, "pdf_min_text_length", 0, settings.pdfMinTextLength);

    std::string extension = settings.manifestDocumentExtension;
    ReadString(j, "manifest_document_extension", extension);
    if (!extension.empty() && extension.front() != '.') extension.insert(0, ".");
    if (extension.size() > 1) settings.manifestDocumentExtension = extension;
}

void ConfigLoader::ApplyEnvironment(PipelineSettings& settings) {
    if (const char* token = std::getenv("DOCINGEST_API_TOKEN"); token && *token) {
        settings.apiToken = token;
    }
    if (const char* endpoint = std::getenv("DOCINGEST_UPLOAD_ENDPOINT"); endpoint && *endpoint) {
        settings.uploadEndpoint = endpoint;
    }
    if (const char* catalog = std::getenv("DOCINGEST_CATALOG"); catalog && *catalog) {
        settings.catalogPath = catalog;
    }
}

PipelineSettings ConfigLoader::Load(const std::optional<std::string>& configPath) {
    PipelineSettings settings = Defaults();
    std::filesystem::path path = configPath ? std::filesystem::path(*configPath) : PathUtils::GetSettingsFile();

    if (std::filesystem::exists(path)) {
        try {
            std::ifstream f(path);
            json j;
            f >> j;
            ApplyJson(j, settings);
            std::cout << "[ConfigLoader] Loaded " << path.string() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << path.string() << ": " << e.what() << std::endl;
        }
    } else if (configPath) {
        std::cerr << "[ConfigLoader] Settings file not found: " << path.string() << "; using defaults" << std::endl;
    }

    ApplyEnvironment(settings);
    return settings;
}

std::optional<std::string> ConfigLoader::Validate(const PipelineSettings& settings) {
    if (settings.persistMode == PersistMode::Upload && !settings.hasUploadTarget()) {
        return std::string("persist_mode \"upload\" requires upload_endpoint and api_token "
                           "(or DOCINGEST_UPLOAD_ENDPOINT / DOCINGEST_API_TOKEN)");
    }
    if (settings.storeDir.empty()) {
        return std::string("store_dir must not be empty");
    }
    return std::nullopt;
}

} // namespace docingest::infrastructure
