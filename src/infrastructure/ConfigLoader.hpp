/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access configuration without scattering JSON
 * parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "infrastructure/AppConfig.hpp"

namespace logicchat::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json, falling back to defaults for missing keys.
     * @param configPath Path to the settings file. A missing file yields defaults.
     * @return The loaded configuration, with environment overrides applied.
     *
     * A malformed or invalid file is reported on stderr and defaults are used.
     */
    static AppConfig Load(const std::string& configPath);

    /**
     * @brief Applies recognised keys from a JSON object onto a base configuration.
     * @throws nlohmann::json::exception on type mismatches.
     * @throws std::invalid_argument if the result fails validation.
     */
    static AppConfig FromJson(const nlohmann::json& j, AppConfig base = {});

    /** @brief Applies the PORT environment variable, if set and numeric. */
    static void ApplyEnvironment(AppConfig& config);
};

} // namespace logicchat::infrastructure
