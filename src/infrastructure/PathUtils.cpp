#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace docingest::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDirName = "docingest";

/// $<variable>, else $HOME/<homeRelative>, else the working directory.
fs::path XdgBase(const char* variable, const fs::path& homeRelative) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path();
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgBase("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgBase("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetCacheHome() {
    return XdgBase("XDG_CACHE_HOME", ".cache");
}

fs::path PathUtils::GetSettingsFile() {
    return GetConfigHome() / kAppDirName / "settings.json";
}

fs::path PathUtils::GetAppDataDir() {
    return GetDataHome() / kAppDirName;
}

fs::path PathUtils::GetScratchDir() {
    return GetCacheHome() / kAppDirName / "scratch";
}

} // namespace docingest::infrastructure
