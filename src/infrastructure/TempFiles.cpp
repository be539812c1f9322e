/**
 * @file TempFiles.cpp
 * @brief Implementation of TempFiles.
 */

#include "infrastructure/TempFiles.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>
#include <vector>

namespace docingest::infrastructure {

namespace fs = std::filesystem;

std::string TempFiles::Create(const std::string& dir, const std::string& suffix) {
    fs::path base = dir.empty() ? fs::temp_directory_path() : fs::path(dir);
    std::error_code ec;
    fs::create_directories(base, ec);

    std::string pattern = (base / ("docingest_XXXXXX" + suffix)).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw std::runtime_error("Cannot create temp file in " + base.string() + ": " + std::strerror(errno));
    }
    close(fd);
    return std::string(buffer.data());
}

std::string TempFiles::CreateWithContent(const std::string& dir, const std::string& suffix, const std::string& content) {
    std::string path = Create(dir, suffix);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    out.close();
    if (out.fail()) {
        std::error_code ec;
        fs::remove(path, ec);
        throw std::runtime_error("Failed to write temp file " + path);
    }
    return path;
}

} // namespace docingest::infrastructure
