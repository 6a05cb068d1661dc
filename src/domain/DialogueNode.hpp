/**
 * @file DialogueNode.hpp
 * @brief Immutable nodes of the dialogue graph, as loaded from sequence documents.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace variantwalker::domain {

/**
 * @enum NodeKind
 * @brief How a node hands control to its successors.
 */
enum class NodeKind {
    Message,           ///< Plain bot/user line, linear successor.
    Choice,            ///< User picks one of several options.
    ConditionalBranch, ///< "autoroute": first matching route wins.
    Action,            ///< "dataAction": side effects only, linear successor.
    CrossJump          ///< Declares another owning sequence; continues at its entry node.
};

inline const char* NodeKindToString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Message: return "message";
        case NodeKind::Choice: return "choice";
        case NodeKind::ConditionalBranch: return "conditional";
        case NodeKind::Action: return "action";
        case NodeKind::CrossJump: return "crossJump";
    }
    return "message";
}

/**
 * @struct NodeAddress
 * @brief (sequence-id, message-id) identity of a node across all documents.
 */
struct NodeAddress {
    std::string sequenceId;
    int messageId = 0;

    bool operator==(const NodeAddress& other) const {
        return messageId == other.messageId && sequenceId == other.sequenceId;
    }
    bool operator!=(const NodeAddress& other) const { return !(*this == other); }
    bool operator<(const NodeAddress& other) const {
        if (sequenceId != other.sequenceId) return sequenceId < other.sequenceId;
        return messageId < other.messageId;
    }

    std::string toString() const { return sequenceId + ":" + std::to_string(messageId); }
};

struct ChoiceOption {
    std::string text;
    std::optional<int> nextMessageId;
    std::optional<std::string> sequenceId; ///< Jump to another sequence's entry node.
    std::optional<std::string> contentKey;
};

struct RouteOption {
    std::optional<std::string> condition;
    std::optional<std::string> sequenceId;
    std::optional<int> nextMessageId;
    bool isDefault = false;
};

/**
 * @struct DialogueNode
 * @brief One message record of a sequence document.
 */
struct DialogueNode {
    std::string sequenceId; ///< Document the node belongs to.
    int id = 0;
    NodeKind kind = NodeKind::Message;
    std::string type = "bot"; ///< Raw document type ("bot", "user", "textInput", ...).
    std::string sender = "bot";
    std::optional<std::string> contentKey;
    std::string text; ///< Literal default text; may be empty.
    std::optional<int> nextMessageId;
    std::optional<std::string> targetSequenceId; ///< Owning-sequence override (cross-jump).
    std::vector<ChoiceOption> choices;
    std::vector<RouteOption> routes;

    NodeAddress address() const { return NodeAddress{sequenceId, id}; }

    bool hasContentKey() const { return contentKey && !contentKey->empty(); }
};

/**
 * @struct SequenceDocument
 * @brief Logical content of one sequence file: its nodes in document order.
 */
struct SequenceDocument {
    std::string sequenceId;
    std::string name;
    std::vector<DialogueNode> nodes;
};

} // namespace variantwalker::domain
