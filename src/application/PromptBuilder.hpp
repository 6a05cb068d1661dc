/**
 * @file PromptBuilder.hpp
 * @brief Assembles the structured generation request for one content key.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/ContextTurn.hpp"
#include "domain/VariantGenerator.hpp"
#include "infrastructure/PipelineConfig.hpp"

namespace variantwalker::application {

/**
 * @struct PromptInputs
 * @brief Everything gathered for a target before prompting.
 */
struct PromptInputs {
    std::string contentKey;
    std::string targetPath;  ///< Corpus file that accepted lines go to.
    std::string defaultText; ///< The node's literal text, if any.
    std::vector<domain::ContextTurn> context;
    std::vector<std::string> siblingExemplars;
    std::vector<std::string> existingVariants;
};

class PromptBuilder {
public:
    explicit PromptBuilder(const infrastructure::PipelineConfig& config);

    domain::GenerationPrompt build(const PromptInputs& inputs) const;

    /** @brief Writer instructions derived from the style and generation settings. */
    std::string systemText() const;

private:
    infrastructure::GenConfig m_gen;
    infrastructure::StyleConfig m_style;
    infrastructure::ContextConfig m_context;
};

} // namespace variantwalker::application
