/**
 * @file GeneratorClient.cpp
 * @brief Implementation of GeneratorClient.
 */

#include "infrastructure/GeneratorClient.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <thread>

namespace variantwalker::infrastructure {

using json = nlohmann::json;

namespace {

const char* const kRemovableParameters[] = {"temperature", "top_p", "n", "seed"};

const char* const kRejectionPhrases[] = {
    "unsupported", "not supported", "does not support", "unknown parameter",
    "unrecognized", "invalid parameter", "not allowed", "not permitted"
};

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Whole-word search so that "n" does not match inside other words.
bool ContainsWord(const std::string& haystack, const std::string& word) {
    size_t pos = haystack.find(word);
    while (pos != std::string::npos) {
        bool leftOk = pos == 0 || !IsWordChar(haystack[pos - 1]);
        size_t end = pos + word.size();
        bool rightOk = end >= haystack.size() || !IsWordChar(haystack[end]);
        if (leftOk && rightOk) return true;
        pos = haystack.find(word, pos + 1);
    }
    return false;
}

bool HasParameter(const json& payload, const std::string& name) {
    if (payload.contains(name)) return true;
    auto options = payload.find("options");
    return options != payload.end() && options->is_object() && options->contains(name);
}

std::string StripCodeFence(const std::string& text) {
    std::string s = Trim(text);
    if (s.rfind("```", 0) != 0) return s;
    size_t firstNewline = s.find('\n');
    if (firstNewline == std::string::npos) return s;
    s = s.substr(firstNewline + 1);
    size_t closing = s.rfind("```");
    if (closing != std::string::npos) s = s.substr(0, closing);
    return Trim(s);
}

std::string AsText(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

// Message content is expected to be JSON with "variants"; otherwise every non-blank line counts.
void AppendFromContent(const std::string& content, std::vector<std::string>& out) {
    std::string stripped = StripCodeFence(content);
    json parsed = json::parse(stripped, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        auto variants = parsed.find("variants");
        if (variants != parsed.end() && variants->is_array()) {
            for (const auto& v : *variants) out.push_back(AsText(v));
            return;
        }
    }
    std::istringstream lines(stripped);
    std::string line;
    while (std::getline(lines, line)) {
        std::string trimmed = Trim(line);
        if (!trimmed.empty()) out.push_back(trimmed);
    }
}

} // namespace

GeneratorClient::GeneratorClient(const PipelineConfig& config, std::shared_ptr<HttpTransport> transport)
    : m_provider(config.provider),
      m_gen(config.gen),
      m_rateLimit(config.rateLimit),
      m_mock(config.provider.mock || config.io.dryRun),
      m_verbose(config.io.verbose),
      m_transport(std::move(transport)) {}

std::vector<std::string> GeneratorClient::mockVariants(const std::string& contentKey) const {
    std::vector<std::string> variants;
    for (int i = 1; i <= m_gen.numVariants; ++i) {
        variants.push_back("[" + contentKey + "] Variant " + std::to_string(i) +
                           " ||| Second bubble (optional)");
    }
    return variants;
}

json GeneratorClient::buildPayload(const domain::GenerationPrompt& prompt) const {
    json promptJson = prompt.toJson();

    if (m_provider.name == "openai-chat") {
        return {
            {"model", m_provider.model},
            {"temperature", m_gen.temperature},
            {"top_p", m_gen.topP},
            {"messages", json::array({
                {{"role", "system"}, {"content", prompt.system}},
                {{"role", "user"}, {"content", promptJson.dump()}}
            })},
            {"response_format", {{"type", "json_object"}}}
        };
    }
    if (m_provider.name == "ollama") {
        return {
            {"model", m_provider.model},
            {"prompt", prompt.system + "\n\nRequest:\n" + promptJson.dump()},
            {"stream", false},
            {"format", "json"},
            {"options", {
                {"temperature", m_gen.temperature},
                {"top_p", m_gen.topP}
            }}
        };
    }
    return {
        {"model", m_provider.model},
        {"temperature", m_gen.temperature},
        {"top_p", m_gen.topP},
        {"n", m_gen.numVariants},
        {"prompt", promptJson}
    };
}

std::optional<std::vector<std::string>> GeneratorClient::ExtractVariants(const json& response) {
    if (!response.is_object()) return std::nullopt;

    auto variants = response.find("variants");
    if (variants != response.end() && variants->is_array()) {
        std::vector<std::string> out;
        for (const auto& v : *variants) out.push_back(AsText(v));
        return out;
    }

    auto choices = response.find("choices");
    if (choices != response.end() && choices->is_array()) {
        std::vector<std::string> out;
        for (const auto& c : *choices) {
            if (!c.is_object()) continue;
            auto message = c.find("message");
            if (message != c.end() && message->is_object()) {
                auto content = message->find("content");
                if (content != message->end() && content->is_string()) {
                    AppendFromContent(content->get<std::string>(), out);
                    continue;
                }
            }
            auto text = c.find("text");
            if (text != c.end() && !text->is_null()) {
                out.push_back(AsText(*text));
            }
        }
        return out;
    }

    auto ollamaResponse = response.find("response");
    if (ollamaResponse != response.end() && ollamaResponse->is_string()) {
        std::vector<std::string> out;
        AppendFromContent(ollamaResponse->get<std::string>(), out);
        return out;
    }

    return std::nullopt;
}

std::optional<std::string> GeneratorClient::FindRejectedParameter(int status,
                                                                  const std::string& body,
                                                                  const json& payload) {
    if (status < 400 || status >= 500 || status == 401 || status == 403 || status == 429) {
        return std::nullopt;
    }
    std::string lowered = ToLower(body);
    bool rejected = false;
    for (const char* phrase : kRejectionPhrases) {
        if (lowered.find(phrase) != std::string::npos) {
            rejected = true;
            break;
        }
    }
    if (!rejected) return std::nullopt;

    for (const char* name : kRemovableParameters) {
        if (HasParameter(payload, name) && ContainsWord(lowered, name)) {
            return std::string(name);
        }
    }
    return std::nullopt;
}

bool GeneratorClient::RemoveParameter(json& payload, const std::string& name) {
    bool removed = payload.erase(name) > 0;
    auto options = payload.find("options");
    if (options != payload.end() && options->is_object()) {
        removed = options->erase(name) > 0 || removed;
    }
    return removed;
}

void GeneratorClient::throttle() {
    if (m_rateLimit.rpm <= 0) return;
    auto interval = std::chrono::milliseconds(60000 / m_rateLimit.rpm);
    auto now = std::chrono::steady_clock::now();
    if (m_lastRequest) {
        auto elapsed = now - *m_lastRequest;
        if (elapsed < interval) {
            std::this_thread::sleep_for(interval - elapsed);
        }
    }
    m_lastRequest = std::chrono::steady_clock::now();
}

domain::GenerationResult GeneratorClient::generate(const domain::GenerationPrompt& prompt) {
    domain::GenerationResult result;

    json payload = buildPayload(prompt);

    if (m_mock) {
        result.mock = true;
        result.requestSent = std::move(payload);
        result.variants = mockVariants(prompt.contentKey);
        result.rawResponse = {
            {"mock", true},
            {"model", m_provider.model},
            {"variants", result.variants}
        };
        return result;
    }

    if (!m_transport) {
        throw domain::GenerationError("No HTTP transport configured", payload);
    }
    if (m_provider.baseUrl.empty()) {
        throw domain::GenerationError("provider.base_url is not set", payload);
    }

    const char* envValue = std::getenv(m_provider.apiKeyEnv.c_str());
    std::string apiKey = envValue ? envValue : "";
    if (apiKey.empty() && m_provider.name != "ollama") {
        throw domain::GenerationError("Missing API key env: " + m_provider.apiKeyEnv, payload);
    }

    std::map<std::string, std::string> headers;
    if (!apiKey.empty()) {
        headers["Authorization"] = "Bearer " + apiKey;
    }

    bool downgraded = false;
    std::string lastError;

    for (int attempt = 0;;) {
        throttle();
        std::string body = payload.dump();
        if (m_verbose) {
            std::cout << "[GeneratorClient] POST " << m_provider.baseUrl << " (" << body.size()
                      << " bytes, attempt " << attempt + 1 << ")" << std::endl;
        }

        HttpResponse response = m_transport->post(m_provider.baseUrl, body, headers, m_provider.timeoutMs);

        if (response.status >= 200 && response.status < 300) {
            json parsed = json::parse(response.body, nullptr, false);
            if (parsed.is_discarded()) {
                lastError = "Unparsable response body";
            } else if (auto variants = ExtractVariants(parsed)) {
                result.variants = std::move(*variants);
                result.rawResponse = std::move(parsed);
                result.requestSent = std::move(payload);
                return result;
            } else {
                lastError = "Cannot extract variants from response";
            }
        } else if (response.status == 0) {
            lastError = response.error.empty() ? "No response" : response.error;
        } else {
            if (!downgraded) {
                if (auto parameter = FindRejectedParameter(response.status, response.body, payload)) {
                    std::cerr << "[GeneratorClient] Backend rejected '" << *parameter
                              << "', retrying without it." << std::endl;
                    RemoveParameter(payload, *parameter);
                    downgraded = true;
                    continue;
                }
            }
            lastError = "HTTP " + std::to_string(response.status) + ": " + response.body;
        }

        std::cerr << "[GeneratorClient] Attempt " << attempt + 1 << " failed: " << lastError << std::endl;
        if (attempt >= m_rateLimit.retryCount) {
            throw domain::GenerationError("Generation failed after " + std::to_string(attempt + 1) +
                                          " attempt(s): " + lastError, payload);
        }
        ++attempt;
        if (m_rateLimit.retryBackoffMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(m_rateLimit.retryBackoffMs));
        }
    }
}

} // namespace variantwalker::infrastructure
