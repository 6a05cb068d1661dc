/**
 * @file GeneratorClient.hpp
 * @brief Remote generation backend client with provider profiles, retry and parameter downgrade.
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/VariantGenerator.hpp"
#include "infrastructure/HttpTransport.hpp"
#include "infrastructure/PipelineConfig.hpp"

namespace variantwalker::infrastructure {

/**
 * @class GeneratorClient
 * @brief VariantGenerator backed by an HTTP endpoint.
 *
 * Profiles ("provider.name"):
 * - generic-json: { model, temperature, top_p, n, prompt: {...} }
 * - openai-chat:  { model, temperature, top_p, messages: [system, user], response_format }
 * - ollama:       { model, prompt, stream: false, format: "json", options: { temperature, top_p } }
 *
 * In mock mode (provider.mock or io.dry_run) no request is made and deterministic
 * variants are returned.
 */
class GeneratorClient : public domain::VariantGenerator {
public:
    GeneratorClient(const PipelineConfig& config, std::shared_ptr<HttpTransport> transport);

    /** @see domain::VariantGenerator::generate */
    domain::GenerationResult generate(const domain::GenerationPrompt& prompt) override;

    bool isMock() const { return m_mock; }

    /** @brief Provider-specific request body for a prompt. */
    nlohmann::json buildPayload(const domain::GenerationPrompt& prompt) const;

    /**
     * @brief Pulls candidate lines out of any recognized response shape.
     * @return nullopt if the response matches no known shape.
     */
    static std::optional<std::vector<std::string>> ExtractVariants(const nlohmann::json& response);

    /**
     * @brief Detects a client error naming an unsupported sampling parameter.
     * @return The parameter name if it is present in the payload and the body rejects it.
     */
    static std::optional<std::string> FindRejectedParameter(int status,
                                                            const std::string& body,
                                                            const nlohmann::json& payload);

    /** @brief Removes a parameter at top level or under "options". */
    static bool RemoveParameter(nlohmann::json& payload, const std::string& name);

private:
    std::vector<std::string> mockVariants(const std::string& contentKey) const;
    void throttle();

    ProviderConfig m_provider;
    GenConfig m_gen;
    RateLimitConfig m_rateLimit;
    bool m_mock;
    bool m_verbose;
    std::shared_ptr<HttpTransport> m_transport;

    std::optional<std::chrono::steady_clock::time_point> m_lastRequest;
};

} // namespace variantwalker::infrastructure
