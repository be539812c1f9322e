/**
 * @file OoxmlPackage.hpp
 * @brief Read-only access to the ZIP container of Office Open XML documents.
 */

#pragma once
#include <optional>
#include <string>

struct zip;

namespace docingest::infrastructure {

/**
 * @class OoxmlPackage
 * @brief Owns an open libzip archive; closed on destruction.
 */
class OoxmlPackage {
public:
    /** @throws std::runtime_error when the file is not a readable ZIP archive. */
    explicit OoxmlPackage(const std::string& path);
    ~OoxmlPackage();

    OoxmlPackage(const OoxmlPackage&) = delete;
    OoxmlPackage& operator=(const OoxmlPackage&) = delete;

    /** @brief Contents of a part, nullopt when the part does not exist. */
    std::optional<std::string> readPart(const std::string& partName) const;

private:
    struct zip* m_archive = nullptr;
};

} // namespace docingest::infrastructure
