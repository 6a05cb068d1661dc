/**
 * @file PipelineConfig.hpp
 * @brief Typed pipeline configuration with defaults for every section.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace variantwalker::infrastructure {

struct ProviderConfig {
    std::string name = "generic-json";
    std::string baseUrl;
    std::string model;
    std::string apiKeyEnv = "LLM_API_KEY";
    bool mock = false;
    int timeoutMs = 30000;
};

struct GenConfig {
    int numVariants = 8;
    double temperature = 0.7;
    double topP = 0.9;
    int maxBubblesPerLine = 3;
    int maxCharsPerBubble = 90;
    double dedupeThreshold = 0.82;
};

struct ContextConfig {
    int historyBubbles = 4;
    bool includeSiblingExemplars = true;
    int maxExemplars = 10;
    int turnExamples = 2; ///< Phrasings sampled per context turn that references a content key.
};

struct StyleConfig {
    std::vector<std::string> tone{"friendly", "concise"};
    bool forbidEmojis = true;
    bool allowPipes = true;
    bool preservePlaceholders = true;
};

struct IoConfig {
    std::string assetsDir = "assets";
    std::string archiveDir = "tool/ai_archive";
    bool dryRun = true;
    bool verbose = false;
    bool failFast = false;
};

struct RateLimitConfig {
    int rpm = 30;
    int retryCount = 2;
    int retryBackoffMs = 1000;
};

struct SafetyConfig {
    std::vector<std::string> blocklist;
    std::vector<std::string> piiRegexes;
};

/**
 * @struct PipelineConfig
 * @brief All sections of the generator configuration file.
 */
struct PipelineConfig {
    ProviderConfig provider;
    GenConfig gen;
    ContextConfig context;
    StyleConfig style;
    IoConfig io;
    RateLimitConfig rateLimit;
    SafetyConfig safety;

    /** @brief Builds a config from a parsed value tree; missing or mistyped keys keep defaults. */
    static PipelineConfig FromValue(const nlohmann::json& value);

    /** @brief Snapshot used in archive records. */
    nlohmann::json toJson() const;
};

} // namespace variantwalker::infrastructure
