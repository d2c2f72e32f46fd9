/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the pipeline configuration (settings.json).
 *
 * Provides a unified way to build the PipelineConfig without scattering JSON
 * parsing and environment lookups throughout the codebase.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "infrastructure/PipelineConfig.hpp"

namespace docudigest::infrastructure {

class ConfigLoader {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Loads settings.json and resolves credentials from the environment.
     * @param explicitPath Path given on the command line; must exist when set.
     *        Otherwise <config home>/DocuDigest/settings.json is used if present.
     * @throws domain::ConfigError on unreadable or invalid configuration.
     */
    static PipelineConfig Load(const std::optional<std::string>& explicitPath = std::nullopt);

    /**
     * @brief Builds a configuration from parsed JSON. Missing keys take defaults.
     * @param env Environment lookup used for credential variables.
     * @throws domain::ConfigError on invalid values.
     */
    static PipelineConfig FromJson(const nlohmann::json& j, const EnvLookup& env);

    /** @brief Chooses the concrete backend: auto picks S3 when bucket and keys are present. */
    static StorageBackendKind ResolveBackend(const PipelineConfig& config);

    /** @brief Reads a variable from the process environment. */
    static std::optional<std::string> SystemEnv(const std::string& name);
};

} // namespace docudigest::infrastructure
