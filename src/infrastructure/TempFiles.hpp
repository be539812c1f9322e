/**
 * @file TempFiles.hpp
 * @brief Creation of uniquely named scratch files.
 */

#pragma once
#include <string>

namespace docingest::infrastructure {

class TempFiles {
public:
    /**
     * @brief Atomically creates an empty, uniquely named file.
     * @param dir Target directory (created if missing); empty selects the system temp dir.
     * @param suffix Kept at the end of the name, e.g. ".pdf".
     * @return Absolute path of the new file.
     * @throws std::runtime_error when the file cannot be created.
     */
    static std::string Create(const std::string& dir, const std::string& suffix);

    /** @brief Writes content to a new unique file and returns its path. */
    static std::string CreateWithContent(const std::string& dir, const std::string& suffix, const std::string& content);
};

} // namespace docingest::infrastructure
