/**
 * @file SequenceIndex.hpp
 * @brief Lazy, populate-once cache of per-sequence node tables.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/DialogueNode.hpp"
#include "domain/SequenceSource.hpp"

namespace variantwalker::application {

/**
 * @struct SequenceTable
 * @brief All nodes of one sequence keyed by message id, plus its entry node.
 */
struct SequenceTable {
    std::string sequenceId;
    int entryId = 0;
    std::map<int, domain::DialogueNode> nodes;
    std::vector<int> order; ///< Message ids in document order.
};

/**
 * @class SequenceIndex
 * @brief Owns every loaded node; other components refer to nodes by NodeAddress.
 *
 * Each sequence is requested from the source at most once per index lifetime,
 * including sequences that turn out not to exist.
 */
class SequenceIndex {
public:
    explicit SequenceIndex(std::shared_ptr<domain::SequenceSource> source);

    /** @brief Table for a sequence, loading it on first use. Null if unknown or empty. */
    const SequenceTable* table(const std::string& sequenceId);

    /** @brief Node at an address, or null. */
    const domain::DialogueNode* findNode(const domain::NodeAddress& address);

    /** @brief Id of the sequence's first node. */
    std::optional<int> entryNode(const std::string& sequenceId);

    bool contains(const domain::NodeAddress& address) { return findNode(address) != nullptr; }

    /** @brief Number of sequences requested so far (loaded or known missing). */
    size_t loadedCount() const { return m_tables.size(); }

private:
    std::shared_ptr<domain::SequenceSource> m_source;
    std::map<std::string, std::optional<SequenceTable>> m_tables;
};

} // namespace variantwalker::application
