/**
 * @file ContextTurn.hpp
 * @brief One displayable turn of conversational context preceding the target.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace variantwalker::domain {

/** @brief Prefix marking a reference to another content key instead of literal text. */
inline constexpr const char* kContentKeyReferencePrefix = "contentKey:";

struct ContextTurn {
    int messageId = 0;
    std::string sender;    ///< "bot" or "user".
    std::string kind;      ///< Raw node type ("bot", "choice", "textInput", ...).
    std::string reference; ///< Literal text or "contentKey:<key>".
    std::vector<std::string> examples; ///< Existing phrasings of the referenced key.

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"id", messageId},
            {"sender", sender},
            {"type", kind},
            {"text", reference}
        };
        if (!examples.empty()) j["examples"] = examples;
        return j;
    }
};

} // namespace variantwalker::domain
