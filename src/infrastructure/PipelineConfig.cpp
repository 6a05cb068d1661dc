#include "infrastructure/PipelineConfig.hpp"

namespace variantwalker::infrastructure {

using json = nlohmann::json;

namespace {

const json& Section(const json& root, const char* name) {
    static const json kEmpty = json::object();
    if (!root.is_object()) return kEmpty;
    auto it = root.find(name);
    if (it == root.end() || !it->is_object()) return kEmpty;
    return *it;
}

void Read(const json& section, const char* key, std::string& out) {
    auto it = section.find(key);
    if (it != section.end() && it->is_string()) out = it->get<std::string>();
}

void Read(const json& section, const char* key, bool& out) {
    auto it = section.find(key);
    if (it != section.end() && it->is_boolean()) out = it->get<bool>();
}

void Read(const json& section, const char* key, int& out) {
    auto it = section.find(key);
    if (it != section.end() && it->is_number_integer()) out = it->get<int>();
}

void Read(const json& section, const char* key, double& out) {
    auto it = section.find(key);
    if (it != section.end() && it->is_number()) out = it->get<double>();
}

void Read(const json& section, const char* key, std::vector<std::string>& out) {
    auto it = section.find(key);
    if (it == section.end() || !it->is_array()) return;
    out.clear();
    for (const auto& item : *it) {
        if (item.is_string()) out.push_back(item.get<std::string>());
        else if (!item.is_null()) out.push_back(item.dump());
    }
}

} // namespace

PipelineConfig PipelineConfig::FromValue(const json& value) {
    PipelineConfig c;

    const json& provider = Section(value, "provider");
    Read(provider, "name", c.provider.name);
    Read(provider, "base_url", c.provider.baseUrl);
    Read(provider, "model", c.provider.model);
    Read(provider, "api_key_env", c.provider.apiKeyEnv);
    Read(provider, "mock", c.provider.mock);
    Read(provider, "timeout_ms", c.provider.timeoutMs);

    const json& gen = Section(value, "gen");
    Read(gen, "num_variants", c.gen.numVariants);
    Read(gen, "temperature", c.gen.temperature);
    Read(gen, "top_p", c.gen.topP);
    Read(gen, "max_bubbles_per_line", c.gen.maxBubblesPerLine);
    Read(gen, "max_chars_per_bubble", c.gen.maxCharsPerBubble);
    Read(gen, "dedupe_threshold", c.gen.dedupeThreshold);

    const json& context = Section(value, "context");
    Read(context, "history_bubbles", c.context.historyBubbles);
    Read(context, "include_sibling_exemplars", c.context.includeSiblingExemplars);
    Read(context, "max_exemplars", c.context.maxExemplars);
    Read(context, "turn_examples", c.context.turnExamples);

    const json& style = Section(value, "style");
    Read(style, "tone", c.style.tone);
    Read(style, "forbid_emojis", c.style.forbidEmojis);
    Read(style, "allow_pipes", c.style.allowPipes);
    Read(style, "preserve_placeholders", c.style.preservePlaceholders);

    const json& io = Section(value, "io");
    Read(io, "assets_dir", c.io.assetsDir);
    Read(io, "archive_dir", c.io.archiveDir);
    Read(io, "dry_run", c.io.dryRun);
    Read(io, "verbose", c.io.verbose);
    Read(io, "fail_fast", c.io.failFast);

    const json& rateLimit = Section(value, "rate_limit");
    Read(rateLimit, "rpm", c.rateLimit.rpm);
    Read(rateLimit, "retry_count", c.rateLimit.retryCount);
    Read(rateLimit, "retry_backoff_ms", c.rateLimit.retryBackoffMs);

    const json& safety = Section(value, "safety");
    Read(safety, "blocklist", c.safety.blocklist);
    Read(safety, "pii_regexes", c.safety.piiRegexes);

    return c;
}

json PipelineConfig::toJson() const {
    return {
        {"provider", {
            {"name", provider.name},
            {"base_url", provider.baseUrl},
            {"model", provider.model},
            {"api_key_env", provider.apiKeyEnv},
            {"mock", provider.mock},
            {"timeout_ms", provider.timeoutMs}
        }},
        {"gen", {
            {"num_variants", gen.numVariants},
            {"temperature", gen.temperature},
            {"top_p", gen.topP},
            {"max_bubbles_per_line", gen.maxBubblesPerLine},
            {"max_chars_per_bubble", gen.maxCharsPerBubble},
            {"dedupe_threshold", gen.dedupeThreshold}
        }},
        {"context", {
            {"history_bubbles", context.historyBubbles},
            {"include_sibling_exemplars", context.includeSiblingExemplars},
            {"max_exemplars", context.maxExemplars},
            {"turn_examples", context.turnExamples}
        }},
        {"style", {
            {"tone", style.tone},
            {"forbid_emojis", style.forbidEmojis},
            {"allow_pipes", style.allowPipes},
            {"preserve_placeholders", style.preservePlaceholders}
        }},
        {"io", {
            {"assets_dir", io.assetsDir},
            {"archive_dir", io.archiveDir},
            {"dry_run", io.dryRun},
            {"verbose", io.verbose},
            {"fail_fast", io.failFast}
        }},
        {"rate_limit", {
            {"rpm", rateLimit.rpm},
            {"retry_count", rateLimit.retryCount},
            {"retry_backoff_ms", rateLimit.retryBackoffMs}
        }},
        {"safety", {
            {"blocklist", safety.blocklist},
            {"pii_regexes", safety.piiRegexes}
        }}
    };
}

} // namespace variantwalker::infrastructure
