/**
 * @file OoxmlPackage.cpp
 * @brief Implementation of OoxmlPackage.
 */

#include "infrastructure/OoxmlPackage.hpp"
#include <stdexcept>
#include <zip.h>

namespace docingest::infrastructure {

OoxmlPackage::OoxmlPackage(const std::string& path) {
    int errorCode = 0;
    m_archive = zip_open(path.c_str(), ZIP_RDONLY, &errorCode);
    if (!m_archive) {
        zip_error_t error;
        zip_error_init_with_code(&error, errorCode);
        std::string message = zip_error_strerror(&error);
        zip_error_fini(&error);
        throw std::runtime_error("not a valid OOXML package: " + message);
    }
}

OoxmlPackage::~OoxmlPackage() {
    if (m_archive) {
        zip_discard(m_archive);
    }
}

std::optional<std::string> OoxmlPackage::readPart(const std::string& partName) const {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(m_archive, partName.c_str(), 0, &st) != 0) {
        return std::nullopt;
    }

    zip_file_t* file = zip_fopen(m_archive, partName.c_str(), 0);
    if (!file) {
        throw std::runtime_error("cannot open part " + partName + ": " + zip_strerror(m_archive));
    }

    std::string contents(static_cast<size_t>(st.size), '\0');
    zip_int64_t bytesRead = contents.empty() ? 0 : zip_fread(file, &contents[0], st.size);
    zip_fclose(file);

    if (bytesRead < 0 || static_cast<zip_uint64_t>(bytesRead) != st.size) {
        throw std::runtime_error("truncated part " + partName);
    }
    return contents;
}

} // namespace docingest::infrastructure
