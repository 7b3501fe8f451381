/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the pipeline configuration (settings.json).
 *
 * Keeps JSON parsing of settings out of the pipeline itself. Missing keys
 * keep their defaults, so a settings file only needs the values it changes.
 */

#pragma once

#include <string>

#include "application/PipelineConfig.hpp"

namespace learnpath::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json and applies environment overrides.
     *
     * A missing file yields the defaults. A file that is not valid JSON is
     * reported and ignored.
     * @throws domain::ConfigError when a key holds a value of the wrong type or sign.
     */
    static application::PipelineConfig Load(const std::string& path);

    /** @brief Parses a settings document over the defaults. */
    static application::PipelineConfig FromJsonText(const std::string& text);

    /** @brief Writes every setting, creating parent directories. */
    static bool Save(const std::string& path, const application::PipelineConfig& config);

    /**
     * @brief LEARNPATH_OLLAMA_HOST, LEARNPATH_OLLAMA_PORT and LEARNPATH_MODEL
     * override the file values.
     */
    static void ApplyEnvironment(application::PipelineConfig& config);
};

} // namespace learnpath::infrastructure
