/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the service configuration (settings.json + environment).
 *
 * The JSON file provides the base values; environment variables with the
 * same key names override them, so a container can be configured without
 * a file.
 */

#pragma once

#include "application/ServiceConfig.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace pixelorigin::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads @p settingsPath (if present) and applies environment overrides.
     * @param settingsPath Path to a JSON settings file. A missing file is not an error.
     * @return Fully resolved configuration.
     */
    static application::ServiceConfig Load(const std::string& settingsPath);

    /**
     * @brief Copies recognized keys from @p j into @p config.
     * Values of the wrong type are logged and skipped.
     */
    static void ApplyJson(const nlohmann::json& j, application::ServiceConfig& config);

    /** @brief Applies environment variable overrides to @p config. */
    static void ApplyEnvironment(application::ServiceConfig& config);
};

} // namespace pixelorigin::infrastructure
