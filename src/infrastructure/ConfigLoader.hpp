/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the pipeline configuration and value-tree files.
 *
 * Files are read as JSON first and, if that fails, as the indentation-based
 * configuration subset understood by ConfigParser.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "infrastructure/PipelineConfig.hpp"

namespace variantwalker::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Loads the pipeline configuration.
     * If the file does not exist, a commented sample is written there and used.
     * @param path Path of the config file (JSON or YAML subset).
     * @throws domain::StructuralError if the file cannot be read or parsed.
     */
    static PipelineConfig Load(const std::string& path);

    /** @brief Parses text as JSON, falling back to ConfigParser. */
    static nlohmann::json ParseFlexible(const std::string& text);

    /** @brief Reads and parses a JSON or YAML-subset file. */
    static nlohmann::json ReadValueFile(const std::string& path);

    /** @brief Writes the default sample configuration to the given path. */
    static void WriteDefaultConfig(const std::string& path);

    /** @brief The sample configuration text. */
    static const char* DefaultConfigText();
};

} // namespace variantwalker::infrastructure
