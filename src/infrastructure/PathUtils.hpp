// PathUtils Header
#pragma once
#include <filesystem>

namespace docingest::infrastructure {

/// XDG base directories and the DocIngest locations below them.
class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();

    /// $XDG_CONFIG_HOME/docingest/settings.json
    static std::filesystem::path GetSettingsFile();
    /// $XDG_DATA_HOME/docingest
    static std::filesystem::path GetAppDataDir();
    /// $XDG_CACHE_HOME/docingest/scratch
    static std::filesystem::path GetScratchDir();
};

} // namespace docingest::infrastructure
