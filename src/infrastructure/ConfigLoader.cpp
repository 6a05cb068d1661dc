/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ConfigParser.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace variantwalker::infrastructure {

namespace fs = std::filesystem;

const char* ConfigLoader::DefaultConfigText() {
    return
        "# VariantWalker configuration\n"
        "provider:\n"
        "  name: generic-json          # generic-json | openai-chat | ollama\n"
        "  base_url: https://api.example.com/generate\n"
        "  model: my-model\n"
        "  api_key_env: LLM_API_KEY\n"
        "  mock: true\n"
        "  timeout_ms: 30000\n"
        "\n"
        "gen:\n"
        "  num_variants: 8\n"
        "  temperature: 0.7\n"
        "  top_p: 0.9\n"
        "  max_bubbles_per_line: 3\n"
        "  max_chars_per_bubble: 90\n"
        "  dedupe_threshold: 0.82\n"
        "\n"
        "context:\n"
        "  history_bubbles: 4\n"
        "  include_sibling_exemplars: true\n"
        "  max_exemplars: 10\n"
        "  turn_examples: 2\n"
        "\n"
        "style:\n"
        "  tone:\n"
        "    - friendly\n"
        "    - concise\n"
        "    - supportive\n"
        "  forbid_emojis: true\n"
        "  allow_pipes: true\n"
        "  preserve_placeholders: true\n"
        "\n"
        "io:\n"
        "  assets_dir: assets\n"
        "  archive_dir: tool/ai_archive\n"
        "  dry_run: true\n"
        "  verbose: false\n"
        "  fail_fast: false\n"
        "\n"
        "rate_limit:\n"
        "  rpm: 30\n"
        "  retry_count: 2\n"
        "  retry_backoff_ms: 1000\n"
        "\n"
        "safety:\n"
        "  blocklist: []\n"
        "  pii_regexes: []\n";
}

void ConfigLoader::WriteDefaultConfig(const std::string& path) {
    fs::path configPath(path);
    if (configPath.has_parent_path()) {
        fs::create_directories(configPath.parent_path());
    }
    std::ofstream out(configPath);
    if (!out.is_open()) {
        throw domain::StructuralError("Cannot create config file: " + path);
    }
    out << DefaultConfigText();
}

nlohmann::json ConfigLoader::ParseFlexible(const std::string& text) {
    nlohmann::json asJson = nlohmann::json::parse(text, nullptr, false);
    if (!asJson.is_discarded() && asJson.is_object()) {
        return asJson;
    }
    return ConfigParser::Parse(text);
}

nlohmann::json ConfigLoader::ReadValueFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw domain::StructuralError("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        return ParseFlexible(buffer.str());
    } catch (const domain::ConfigParseError& e) {
        throw domain::StructuralError(path + ": " + e.what());
    }
}

PipelineConfig ConfigLoader::Load(const std::string& path) {
    if (!fs::exists(path)) {
        std::cout << "[ConfigLoader] Config not found at " << path
                  << ". Using defaults and creating a sample." << std::endl;
        try {
            WriteDefaultConfig(path);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Could not write sample config: " << e.what() << std::endl;
            return PipelineConfig::FromValue(ParseFlexible(DefaultConfigText()));
        }
    }
    return PipelineConfig::FromValue(ReadValueFile(path));
}

} // namespace variantwalker::infrastructure
