/**
 * @file StateSpec.hpp
 * @brief Hypothetical user state used to resolve a path through the dialogue graph.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "DialogueNode.hpp"

namespace variantwalker::domain {

enum class BranchMode {
    Resolve,      ///< Evaluate route conditions against the variables.
    AlwaysDefault ///< Ignore conditions, always take the default route.
};

enum class SelectionMethod { ByIndex, ByText, ByContentKey };

inline const char* SelectionMethodToString(SelectionMethod method) {
    switch (method) {
        case SelectionMethod::ByIndex: return "index";
        case SelectionMethod::ByText: return "text";
        case SelectionMethod::ByContentKey: return "content_key";
    }
    return "index";
}

/**
 * @struct ChoiceDirective
 * @brief Pins the option taken at one specific choice node.
 */
struct ChoiceDirective {
    NodeAddress node;
    SelectionMethod method = SelectionMethod::ByIndex;
    std::string selector; ///< Zero-based index, exact text or content key.
};

struct TraversalLimits {
    int maxDepth = 200;   ///< Maximum number of nodes in a candidate path.
    int maxPaths = 10000; ///< Maximum number of paths expanded by the search.
};

struct EntryPoint {
    std::string sequenceId;
    std::optional<int> messageId; ///< Defaults to the sequence's entry node.
};

/**
 * @struct StateSpec
 * @brief Read-only description of one invocation's hypothetical user state.
 */
struct StateSpec {
    EntryPoint entry;
    BranchMode branchMode = BranchMode::Resolve;
    nlohmann::json variables = nlohmann::json::object();
    std::vector<ChoiceDirective> directives;
    TraversalLimits limits;

    /** @brief First directive registered for the given choice node, if any. */
    const ChoiceDirective* directiveFor(const NodeAddress& address) const {
        for (const auto& directive : directives) {
            if (directive.node == address) return &directive;
        }
        return nullptr;
    }

    nlohmann::json toJson() const {
        nlohmann::json directivesJson = nlohmann::json::array();
        for (const auto& d : directives) {
            directivesJson.push_back({
                {"node", d.node.toString()},
                {"by", SelectionMethodToString(d.method)},
                {"value", d.selector}
            });
        }
        nlohmann::json entryJson = {{"sequence", entry.sequenceId}};
        if (entry.messageId) entryJson["message"] = *entry.messageId;
        return {
            {"entry", entryJson},
            {"branch_mode", branchMode == BranchMode::Resolve ? "resolve" : "default"},
            {"variables", variables},
            {"choices", directivesJson},
            {"limits", {{"max_depth", limits.maxDepth}, {"max_paths", limits.maxPaths}}}
        };
    }
};

} // namespace variantwalker::domain
