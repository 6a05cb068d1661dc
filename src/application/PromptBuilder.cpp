/**
 * @file PromptBuilder.cpp
 * @brief Implementation of PromptBuilder.
 */

#include "application/PromptBuilder.hpp"
#include <sstream>

namespace variantwalker::application {

using json = nlohmann::json;

PromptBuilder::PromptBuilder(const infrastructure::PipelineConfig& config)
    : m_gen(config.gen), m_style(config.style), m_context(config.context) {}

std::string PromptBuilder::systemText() const {
    std::stringstream ss;
    ss << "You are a UX writer for a friendly accountability chat bot. "
       << "Write multiple alternative lines for the specified contentKey. ";
    if (m_style.preservePlaceholders) {
        ss << "Keep placeholders like {user.name} exactly unchanged. ";
    }
    if (m_style.allowPipes) {
        ss << "Use ||| to split long messages into multiple bubbles (max " << m_gen.maxBubblesPerLine << "). ";
    } else {
        ss << "Write each variant as a single bubble; do not use |||. ";
    }
    ss << "Keep each bubble under " << m_gen.maxCharsPerBubble << " characters. ";
    if (m_style.forbidEmojis) {
        ss << "Do not use emojis. ";
    }
    ss << "Tone: ";
    for (size_t i = 0; i < m_style.tone.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << m_style.tone[i];
    }
    ss << ". Concise, natural, no marketing fluff.";
    return ss.str();
}

domain::GenerationPrompt PromptBuilder::build(const PromptInputs& inputs) const {
    domain::GenerationPrompt prompt;
    prompt.system = systemText();
    prompt.contentKey = inputs.contentKey;

    prompt.task = {
        {"contentKey", inputs.contentKey},
        {"targetPath", inputs.targetPath},
        {"constraints", {
            {"numVariants", m_gen.numVariants},
            {"maxBubblesPerLine", m_style.allowPipes ? m_gen.maxBubblesPerLine : 1},
            {"maxCharsPerBubble", m_gen.maxCharsPerBubble},
            {"preservePlaceholders", m_style.preservePlaceholders}
        }}
    };
    if (!inputs.defaultText.empty()) {
        prompt.task["defaultText"] = inputs.defaultText;
    }

    prompt.context = json::array();
    for (const auto& turn : inputs.context) {
        prompt.context.push_back(turn.toJson());
    }

    std::vector<std::string> siblings;
    if (m_context.includeSiblingExemplars) {
        for (const auto& line : inputs.siblingExemplars) {
            if (static_cast<int>(siblings.size()) >= m_context.maxExemplars) break;
            siblings.push_back(line);
        }
    }
    prompt.exemplars = {
        {"existingVariants", inputs.existingVariants},
        {"siblingExemplars", siblings}
    };

    prompt.outputFormat = {
        {"type", "json"},
        {"schema", {{"variants", json::array({"string"})}}}
    };
    return prompt;
}

} // namespace variantwalker::application
