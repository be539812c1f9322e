/**
 * @file PipelineSettings.hpp
 * @brief Runtime configuration of the ingestion pipeline.
 */

#pragma once
#include <string>

namespace docingest::application {

/**
 * @enum PersistMode
 * @brief Where extracted text ends up: embedded in metadata or uploaded as a .txt artifact.
 */
enum class PersistMode {
    Embed,
    Upload
};

struct PipelineSettings {
    std::string catalogPath;         ///< Registry JSON of host documents.
    std::string storeDir;            ///< Root of the file-backed metadata store.
    std::string scratchDir;          ///< Temp files for downloads and text artifacts.
    std::string uploadEndpoint;      ///< Resource-creation URL. No default.
    std::string apiToken;            ///< Credential for uploadEndpoint. No default, never logged.
    PersistMode persistMode = PersistMode::Embed;
    int fetchTimeoutSeconds = 30;      ///< Connect and per-read timeout of downloads.
    int fetchTotalTimeoutSeconds = 0;  ///< Cap on a whole download, 0 for none.
    int uploadTimeoutSeconds = 100;
    int toolTimeoutSeconds = 120;
    size_t maxWorkers = 4;
    std::string ocrLanguage = "eng";
    std::string tessdataPath;        ///< Empty selects the OCR library default.
    int ocrDpi = 300;
    size_t pdfMinTextLength = 5;
    std::string manifestDocumentExtension = ".pdf";

    bool hasUploadTarget() const { return !uploadEndpoint.empty() && !apiToken.empty(); }
};

inline std::string PersistModeToString(PersistMode mode) {
    return mode == PersistMode::Upload ? "upload" : "embed";
}

} // namespace docingest::application
