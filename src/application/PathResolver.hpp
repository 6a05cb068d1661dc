/**
 * @file PathResolver.hpp
 * @brief Breadth-first search for a concrete path to a target node under a StateSpec.
 */

#pragma once

#include <optional>
#include <vector>
#include "application/SequenceIndex.hpp"
#include "domain/ResolvedPath.hpp"
#include "domain/StateSpec.hpp"

namespace variantwalker::application {

/**
 * @class PathResolver
 * @brief Resolves how a user in the given state reaches a target node.
 *
 * The frontier holds whole paths. Nodes are marked visited only once expanded, so
 * the same node may sit in the frontier several times within one layer. When the
 * search cannot reach the target the result is the single-node path [target] with
 * reachedTarget = false.
 */
class PathResolver {
public:
    /** @brief One outgoing edge, tagged with the choice option that produced it. */
    struct Successor {
        domain::NodeAddress address;
        std::optional<domain::ChoiceSelection> selection;
    };

    explicit PathResolver(SequenceIndex& index);

    domain::ResolvedPath resolve(const domain::StateSpec& state, const domain::NodeAddress& target);

    /** @brief Outgoing edges of a node according to its kind and the state. */
    std::vector<Successor> successorsOf(const domain::DialogueNode& node, const domain::StateSpec& state);

    /** @brief Option index a directive selects, or nullopt if it matches no option. */
    static std::optional<size_t> MatchDirective(const domain::ChoiceDirective& directive,
                                                const domain::DialogueNode& node);

private:
    std::optional<domain::NodeAddress> linearSuccessor(const domain::DialogueNode& node);
    std::optional<domain::NodeAddress> sequenceEntry(const std::string& sequenceId);
    std::optional<domain::NodeAddress> destination(const domain::DialogueNode& from,
                                                   const std::optional<std::string>& sequenceId,
                                                   const std::optional<int>& nextMessageId);
    const domain::RouteOption* selectRoute(const domain::DialogueNode& node, const domain::StateSpec& state) const;
    domain::ResolvedPathNode makePathNode(const domain::NodeAddress& address,
                                          std::optional<domain::ChoiceSelection> selection);
    domain::ResolvedPath fallback(const domain::NodeAddress& target);

    SequenceIndex& m_index;
};

} // namespace variantwalker::application
