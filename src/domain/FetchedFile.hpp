/**
 * @file FetchedFile.hpp
 * @brief Scoped owner of a downloaded temporary file.
 */

#pragma once
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

namespace docingest::domain {

/**
 * @class FetchedFile
 * @brief Move-only owner of a temp file; the file is removed exactly once when the owner dies.
 */
class FetchedFile {
public:
    FetchedFile() = default;
    FetchedFile(std::string tempPath, std::string suggestedName)
        : m_tempPath(std::move(tempPath)), m_suggestedName(std::move(suggestedName)) {}

    ~FetchedFile() { release(); }

    FetchedFile(const FetchedFile&) = delete;
    FetchedFile& operator=(const FetchedFile&) = delete;

    FetchedFile(FetchedFile&& other) noexcept
        : m_tempPath(std::exchange(other.m_tempPath, std::string())),
          m_suggestedName(std::move(other.m_suggestedName)) {}

    FetchedFile& operator=(FetchedFile&& other) noexcept {
        if (this != &other) {
            release();
            m_tempPath = std::exchange(other.m_tempPath, std::string());
            m_suggestedName = std::move(other.m_suggestedName);
        }
        return *this;
    }

    const std::string& tempPath() const { return m_tempPath; }
    const std::string& suggestedName() const { return m_suggestedName; }

    /** @brief Deletes the temp file now. Later calls are no-ops. */
    void release() {
        if (m_tempPath.empty()) return;
        std::error_code ec;
        std::filesystem::remove(m_tempPath, ec);
        if (ec) {
            std::cerr << "[FetchedFile] Failed to remove " << m_tempPath << ": " << ec.message() << std::endl;
        }
        m_tempPath.clear();
    }

private:
    std::string m_tempPath;
    std::string m_suggestedName;
};

} // namespace docingest::domain
