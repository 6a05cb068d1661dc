/**
 * @file VariantGenerator.hpp
 * @brief Generation request/result value objects and the generator interface.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace variantwalker::domain {

/**
 * @struct GenerationPrompt
 * @brief Structured request for alternative phrasings of one content key.
 */
struct GenerationPrompt {
    std::string system;
    std::string contentKey;
    nlohmann::json task = nlohmann::json::object();
    nlohmann::json context = nlohmann::json::array();
    nlohmann::json exemplars = nlohmann::json::object();
    nlohmann::json outputFormat = nlohmann::json::object();

    nlohmann::json toJson() const {
        return {
            {"system", system},
            {"task", task},
            {"context", context},
            {"exemplars", exemplars},
            {"output_format", outputFormat}
        };
    }
};

struct GenerationResult {
    std::vector<std::string> variants;
    nlohmann::json rawResponse;
    nlohmann::json requestSent;
    bool mock = false;
};

/**
 * @class VariantGenerator
 * @brief Abstract generation backend. Implementations may block on the network.
 */
class VariantGenerator {
public:
    virtual ~VariantGenerator() = default;

    /**
     * @brief Produces candidate phrasings for the prompt.
     * @throws GenerationError when the backend cannot deliver after retries.
     */
    virtual GenerationResult generate(const GenerationPrompt& prompt) = 0;
};

} // namespace variantwalker::domain
