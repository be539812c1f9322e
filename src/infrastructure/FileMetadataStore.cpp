/**
 * @file FileMetadataStore.cpp
 * @brief Implementation of FileMetadataStore.
 */

#include "infrastructure/FileMetadataStore.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>
#include "domain/PipelineError.hpp"

namespace docingest::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;
using domain::ErrorKind;
using domain::MetadataMap;
using domain::PipelineError;

FileMetadataStore::FileMetadataStore(fs::path root)
    : m_dir(std::move(root) / "metadata") {}

std::string FileMetadataStore::EscapeId(const std::string& documentId) {
    std::string out;
    out.reserve(documentId.size());
    for (unsigned char c : documentId) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    // "." and ".." are not usable file names.
    if (out.find_first_not_of('.') == std::string::npos) {
        out = "%2E" + out.substr(1);
    }
    return out;
}

fs::path FileMetadataStore::pathFor(const std::string& documentId) const {
    return m_dir / (EscapeId(documentId) + ".json");
}

MetadataMap FileMetadataStore::getMetadata(const std::string& documentId) {
    MetadataMap metadata;
    fs::path path = pathFor(documentId);
    if (!fs::exists(path)) {
        return metadata;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        throw PipelineError(ErrorKind::PersistFailure, "Cannot read metadata file " + path.string());
    }

    json stored;
    try {
        in >> stored;
    } catch (const json::exception& e) {
        throw PipelineError(ErrorKind::PersistFailure, "Corrupt metadata file " + path.string() + ": " + e.what());
    }
    if (!stored.is_object()) {
        throw PipelineError(ErrorKind::PersistFailure, "Metadata file " + path.string() + " is not a JSON object");
    }

    for (auto it = stored.begin(); it != stored.end(); ++it) {
        metadata[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    }
    return metadata;
}

void FileMetadataStore::updateMetadata(const std::string& documentId, const MetadataMap& merged) {
    fs::path finalPath = pathFor(documentId);

    std::error_code ec;
    fs::create_directories(m_dir, ec);
    if (ec) {
        throw PipelineError(ErrorKind::PersistFailure, "Cannot create " + m_dir.string() + ": " + ec.message());
    }

    // Unique per write: <file>.<timestamp>.<thread>.tmp
    std::ostringstream suffix;
    suffix << "." << std::chrono::steady_clock::now().time_since_epoch().count()
           << "." << std::this_thread::get_id() << ".tmp";
    fs::path tempPath = finalPath;
    tempPath += suffix.str();

    json document = json::object();
    for (const auto& [key, value] : merged) {
        document[key] = value;
    }

    {
        std::ofstream ofs(tempPath, std::ios::trunc);
        if (!ofs.is_open()) {
            throw PipelineError(ErrorKind::PersistFailure, "Failed to open temp file " + tempPath.string());
        }
        ofs << document.dump(2);
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw PipelineError(ErrorKind::PersistFailure, "Write failed for " + tempPath.string());
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[MetadataStore] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw PipelineError(ErrorKind::PersistFailure, "Cannot replace " + finalPath.string() + ": " + ec.message());
    }
}

} // namespace docingest::infrastructure
