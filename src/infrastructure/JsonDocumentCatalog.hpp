/**
 * @file JsonDocumentCatalog.hpp
 * @brief DocumentCatalog backed by a registry JSON file.
 */

#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/DocumentCatalog.hpp"

namespace docingest::infrastructure {

/**
 * @class JsonDocumentCatalog
 * @brief Reads { "documents": [ {id, package_id, format, url, name, path, extras} ] }.
 *
 * The registry is re-read when its modification time changes. Relative paths are
 * resolved against the registry's directory.
 */
class JsonDocumentCatalog : public domain::DocumentCatalog {
public:
    explicit JsonDocumentCatalog(std::filesystem::path registryPath);

    std::optional<domain::ResourceRecord> find(const std::string& documentId) override;
    std::string localPath(const domain::ResourceRecord& record) override;

    /** @brief Parses registry content; invalid entries are skipped with a log line. */
    static std::map<std::string, domain::ResourceRecord> ParseRegistry(const nlohmann::json& registry,
                                                                       std::map<std::string, std::string>& paths);

private:
    void reloadIfChanged();

    std::filesystem::path m_registryPath;
    std::mutex m_mutex;
    std::optional<std::filesystem::file_time_type> m_loadedAt;
    std::map<std::string, domain::ResourceRecord> m_records;
    std::map<std::string, std::string> m_paths;
};

} // namespace docingest::infrastructure
