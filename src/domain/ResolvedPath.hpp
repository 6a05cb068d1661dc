/**
 * @file ResolvedPath.hpp
 * @brief Concrete traversal from a start node to a target node.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "DialogueNode.hpp"

namespace variantwalker::domain {

/**
 * @struct ChoiceSelection
 * @brief The option taken at a choice node, recorded on the node it led to.
 */
struct ChoiceSelection {
    int index = 0;
    std::string text;
    std::optional<std::string> contentKey;
};

struct ResolvedPathNode {
    std::string sequenceId;
    int messageId = 0;
    NodeKind kind = NodeKind::Message;
    std::optional<ChoiceSelection> selection;

    NodeAddress address() const { return NodeAddress{sequenceId, messageId}; }
};

/**
 * @struct ResolvedPath
 * @brief Ordered, non-empty node sequence. When reachedTarget is false the path is
 * the degenerate single-node fallback containing only the target.
 */
struct ResolvedPath {
    std::vector<ResolvedPathNode> nodes;
    bool reachedTarget = false;

    nlohmann::json toJson() const {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& node : nodes) {
            nlohmann::json j = {
                {"sequenceId", node.sequenceId},
                {"messageId", node.messageId},
                {"kind", NodeKindToString(node.kind)}
            };
            if (node.selection) {
                j["selection"] = {
                    {"index", node.selection->index},
                    {"text", node.selection->text},
                    {"contentKey", node.selection->contentKey ? nlohmann::json(*node.selection->contentKey)
                                                              : nlohmann::json(nullptr)}
                };
            }
            out.push_back(j);
        }
        return out;
    }
};

} // namespace variantwalker::domain
