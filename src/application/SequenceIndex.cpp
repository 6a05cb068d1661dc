#include "application/SequenceIndex.hpp"

namespace variantwalker::application {

SequenceIndex::SequenceIndex(std::shared_ptr<domain::SequenceSource> source)
    : m_source(std::move(source)) {}

const SequenceTable* SequenceIndex::table(const std::string& sequenceId) {
    auto it = m_tables.find(sequenceId);
    if (it == m_tables.end()) {
        std::optional<SequenceTable> loaded;
        auto document = m_source->loadSequence(sequenceId);
        if (document && !document->nodes.empty()) {
            SequenceTable t;
            t.sequenceId = sequenceId;
            t.entryId = document->nodes.front().id;
            for (auto& node : document->nodes) {
                node.sequenceId = sequenceId;
                t.order.push_back(node.id);
                t.nodes.emplace(node.id, std::move(node));
            }
            loaded = std::move(t);
        }
        it = m_tables.emplace(sequenceId, std::move(loaded)).first;
    }
    return it->second ? &*it->second : nullptr;
}

const domain::DialogueNode* SequenceIndex::findNode(const domain::NodeAddress& address) {
    const SequenceTable* t = table(address.sequenceId);
    if (!t) return nullptr;
    auto it = t->nodes.find(address.messageId);
    return it == t->nodes.end() ? nullptr : &it->second;
}

std::optional<int> SequenceIndex::entryNode(const std::string& sequenceId) {
    const SequenceTable* t = table(sequenceId);
    if (!t) return std::nullopt;
    return t->entryId;
}

} // namespace variantwalker::application
