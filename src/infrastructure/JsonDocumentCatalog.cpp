/**
 * @file JsonDocumentCatalog.cpp
 * @brief Implementation of JsonDocumentCatalog.
 */

#include "infrastructure/JsonDocumentCatalog.hpp"
#include <fstream>
#include <iostream>
#include "domain/PipelineError.hpp"

namespace docingest::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;
using domain::ErrorKind;
using domain::PipelineError;
using domain::ResourceRecord;

namespace {

std::string StringField(const json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

JsonDocumentCatalog::JsonDocumentCatalog(fs::path registryPath)
    : m_registryPath(std::move(registryPath)) {}

std::map<std::string, ResourceRecord> JsonDocumentCatalog::ParseRegistry(const json& registry,
                                                                         std::map<std::string, std::string>& paths) {
    std::map<std::string, ResourceRecord> records;
    if (!registry.is_object() || !registry.contains("documents") || !registry["documents"].is_array()) {
        throw PipelineError(ErrorKind::ParseError, "Registry must be an object with a 'documents' array");
    }

    size_t index = 0;
    for (const auto& entry : registry["documents"]) {
        ++index;
        if (!entry.is_object()) {
            std::cerr << "[Catalog] Skipping entry " << index << ": not an object" << std::endl;
            continue;
        }

        ResourceRecord record;
        record.id = StringField(entry, "id");
        record.parentId = StringField(entry, "package_id");
        record.formatTag = StringField(entry, "format");
        record.url = StringField(entry, "url");
        record.name = StringField(entry, "name");
        if (entry.contains("extras") && entry["extras"].is_object()) {
            for (auto it = entry["extras"].begin(); it != entry["extras"].end(); ++it) {
                record.extras[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
            }
        }

        if (!record.isValid()) {
            std::cerr << "[Catalog] Skipping entry " << index << ": needs 'id' and one of 'url' or 'name'" << std::endl;
            continue;
        }

        std::string path = StringField(entry, "path");
        if (!path.empty()) {
            paths[record.id] = path;
        }
        records[record.id] = std::move(record);
    }
    return records;
}

void JsonDocumentCatalog::reloadIfChanged() {
    std::error_code ec;
    auto modified = fs::last_write_time(m_registryPath, ec);
    if (ec) {
        throw PipelineError(ErrorKind::FileNotFound, "Document registry not readable: " + m_registryPath.string());
    }
    if (m_loadedAt && *m_loadedAt == modified) return;

    std::ifstream in(m_registryPath);
    if (!in.is_open()) {
        throw PipelineError(ErrorKind::FileNotFound, "Document registry not readable: " + m_registryPath.string());
    }

    json registry;
    try {
        in >> registry;
    } catch (const json::exception& e) {
        throw PipelineError(ErrorKind::ParseError, "Document registry is not valid JSON: " + std::string(e.what()));
    }

    std::map<std::string, std::string> paths;
    auto records = ParseRegistry(registry, paths);

    fs::path base = m_registryPath.parent_path();
    for (auto& [id, path] : paths) {
        if (fs::path(path).is_relative()) {
            path = (base / path).lexically_normal().string();
        }
    }

    m_records = std::move(records);
    m_paths = std::move(paths);
    m_loadedAt = modified;
    std::cout << "[Catalog] Loaded " << m_records.size() << " document(s) from " << m_registryPath.string() << std::endl;
}

std::optional<ResourceRecord> JsonDocumentCatalog::find(const std::string& documentId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    reloadIfChanged();
    auto it = m_records.find(documentId);
    if (it == m_records.end()) return std::nullopt;
    return it->second;
}

std::string JsonDocumentCatalog::localPath(const ResourceRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_paths.find(record.id);
    if (it == m_paths.end()) {
        throw PipelineError(ErrorKind::FileNotFound, "No stored file for document " + record.id);
    }
    return it->second;
}

} // namespace docingest::infrastructure
