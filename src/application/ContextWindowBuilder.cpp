#include "application/ContextWindowBuilder.hpp"
#include <algorithm>

namespace variantwalker::application {

namespace {
constexpr const char* kUserChoicePlaceholder = "[user choice]";
constexpr const char* kTextInputPlaceholder = "[user text input]";
}

ContextWindowBuilder::ContextWindowBuilder(SequenceIndex& index, int historyBubbles,
                                           int turnExamples, ExampleSampler sampler)
    : m_index(index),
      m_historyBubbles(historyBubbles),
      m_turnExamples(turnExamples),
      m_sampler(std::move(sampler)) {}

void ContextWindowBuilder::attachExamples(domain::ContextTurn& turn, const std::string& contentKey) const {
    if (!m_sampler || m_turnExamples <= 0) return;
    std::vector<std::string> samples = m_sampler(contentKey);
    if (static_cast<int>(samples.size()) > m_turnExamples) {
        samples.resize(static_cast<size_t>(m_turnExamples));
    }
    turn.examples = std::move(samples);
}

std::optional<domain::ContextTurn> ContextWindowBuilder::turnAt(const domain::ResolvedPath& path,
                                                                size_t position) const {
    const domain::ResolvedPathNode& pathNode = path.nodes[position];
    if (!IsDisplayable(pathNode.kind)) return std::nullopt;

    const domain::DialogueNode* node = m_index.findNode(pathNode.address());
    if (!node) return std::nullopt;

    domain::ContextTurn turn;
    turn.messageId = node->id;
    turn.kind = node->type;

    if (node->kind == domain::NodeKind::Choice) {
        // The option taken is recorded on the node it led to.
        const std::optional<domain::ChoiceSelection>* selection = &pathNode.selection;
        if (position + 1 < path.nodes.size() && path.nodes[position + 1].selection) {
            selection = &path.nodes[position + 1].selection;
        }

        turn.sender = "user";
        if (*selection && (*selection)->contentKey && !(*selection)->contentKey->empty()) {
            turn.reference = domain::kContentKeyReferencePrefix + *(*selection)->contentKey;
            attachExamples(turn, *(*selection)->contentKey);
        } else if (*selection && !(*selection)->text.empty()) {
            turn.reference = (*selection)->text;
        } else {
            turn.reference = kUserChoicePlaceholder;
        }
        return turn;
    }

    turn.sender = node->sender;
    if (node->hasContentKey()) {
        turn.reference = domain::kContentKeyReferencePrefix + *node->contentKey;
        attachExamples(turn, *node->contentKey);
    } else if (!node->text.empty()) {
        turn.reference = node->text;
    } else if (node->type == "textInput") {
        turn.sender = "user";
        turn.reference = kTextInputPlaceholder;
    } else {
        return std::nullopt;
    }
    return turn;
}

std::vector<domain::ContextTurn> ContextWindowBuilder::build(const domain::ResolvedPath& path) const {
    std::vector<domain::ContextTurn> turns;
    if (m_historyBubbles <= 0 || path.nodes.size() < 2) return turns;

    for (size_t i = path.nodes.size() - 1; i-- > 0;) {
        if (static_cast<int>(turns.size()) >= m_historyBubbles) break;
        if (auto turn = turnAt(path, i)) {
            turns.push_back(std::move(*turn));
        }
    }
    std::reverse(turns.begin(), turns.end());
    return turns;
}

} // namespace variantwalker::application
