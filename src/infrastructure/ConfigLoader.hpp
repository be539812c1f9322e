/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading pipeline configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place; the rest of the code only sees
 * application::PipelineSettings.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "application/PipelineSettings.hpp"

namespace docingest::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Loads settings from an explicit file or the default XDG location,
     * then applies environment overrides.
     *
     * A missing or malformed file is logged and defaults are used.
     */
    static application::PipelineSettings Load(const std::optional<std::string>& configPath);

    /** @brief Defaults with XDG-derived directories. */
    static application::PipelineSettings Defaults();

    /** @brief Overlays the keys present in a settings object; invalid values are logged and skipped. */
    static void ApplyJson(const nlohmann::json& j, application::PipelineSettings& settings);

    /** @brief DOCINGEST_API_TOKEN, DOCINGEST_UPLOAD_ENDPOINT and DOCINGEST_CATALOG overrides. */
    static void ApplyEnvironment(application::PipelineSettings& settings);

    /** @brief Startup check. Returns a message when the settings cannot be used. */
    static std::optional<std::string> Validate(const application::PipelineSettings& settings);
};

} // namespace docingest::infrastructure
