/**
 * @file PathResolver.cpp
 * @brief Implementation of PathResolver.
 */

#include "application/PathResolver.hpp"
#include "domain/ConditionEvaluator.hpp"
#include <algorithm>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <set>

namespace variantwalker::application {

using domain::NodeAddress;
using domain::NodeKind;

namespace {

std::optional<long> ParseIndex(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') return std::nullopt;
    return value;
}

} // namespace

PathResolver::PathResolver(SequenceIndex& index)
    : m_index(index) {}

std::optional<size_t> PathResolver::MatchDirective(const domain::ChoiceDirective& directive,
                                                   const domain::DialogueNode& node) {
    switch (directive.method) {
        case domain::SelectionMethod::ByIndex: {
            auto index = ParseIndex(directive.selector);
            if (index && *index >= 0 && static_cast<size_t>(*index) < node.choices.size()) {
                return static_cast<size_t>(*index);
            }
            return std::nullopt;
        }
        case domain::SelectionMethod::ByText:
            for (size_t i = 0; i < node.choices.size(); ++i) {
                if (node.choices[i].text == directive.selector) return i;
            }
            return std::nullopt;
        case domain::SelectionMethod::ByContentKey:
            for (size_t i = 0; i < node.choices.size(); ++i) {
                if (node.choices[i].contentKey && *node.choices[i].contentKey == directive.selector) return i;
            }
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<NodeAddress> PathResolver::sequenceEntry(const std::string& sequenceId) {
    auto entry = m_index.entryNode(sequenceId);
    if (!entry) return std::nullopt;
    return NodeAddress{sequenceId, *entry};
}

std::optional<NodeAddress> PathResolver::linearSuccessor(const domain::DialogueNode& node) {
    if (node.nextMessageId) {
        NodeAddress next{node.sequenceId, *node.nextMessageId};
        if (m_index.contains(next)) return next;
    }
    NodeAddress following{node.sequenceId, node.id + 1};
    if (m_index.contains(following)) return following;
    return std::nullopt;
}

std::optional<NodeAddress> PathResolver::destination(const domain::DialogueNode& from,
                                                     const std::optional<std::string>& sequenceId,
                                                     const std::optional<int>& nextMessageId) {
    if (sequenceId) return sequenceEntry(*sequenceId);
    if (nextMessageId) {
        NodeAddress next{from.sequenceId, *nextMessageId};
        if (m_index.contains(next)) return next;
        return std::nullopt;
    }
    return linearSuccessor(from);
}

const domain::RouteOption* PathResolver::selectRoute(const domain::DialogueNode& node,
                                                     const domain::StateSpec& state) const {
    if (state.branchMode == domain::BranchMode::Resolve) {
        for (const auto& route : node.routes) {
            if (route.isDefault || !route.condition) continue;
            if (domain::ConditionEvaluator::Evaluate(*route.condition, state.variables)) {
                return &route;
            }
        }
    }
    for (const auto& route : node.routes) {
        if (route.isDefault) return &route;
    }
    return node.routes.empty() ? nullptr : &node.routes.front();
}

std::vector<PathResolver::Successor> PathResolver::successorsOf(const domain::DialogueNode& node,
                                                                const domain::StateSpec& state) {
    std::vector<Successor> out;

    switch (node.kind) {
        case NodeKind::CrossJump: {
            if (node.targetSequenceId) {
                if (auto entry = sequenceEntry(*node.targetSequenceId)) out.push_back({*entry, std::nullopt});
            }
            break;
        }
        case NodeKind::ConditionalBranch: {
            const domain::RouteOption* route = selectRoute(node, state);
            auto next = route ? destination(node, route->sequenceId, route->nextMessageId) : linearSuccessor(node);
            if (next) out.push_back({*next, std::nullopt});
            break;
        }
        case NodeKind::Choice: {
            std::vector<size_t> options;
            if (const auto* directive = state.directiveFor(node.address())) {
                if (auto picked = MatchDirective(*directive, node)) {
                    options.push_back(*picked);
                } else {
                    std::cerr << "[PathResolver] Directive for " << node.address().toString()
                              << " matches no option; exploring all options." << std::endl;
                }
            }
            if (options.empty()) {
                for (size_t i = 0; i < node.choices.size(); ++i) options.push_back(i);
            }
            for (size_t i : options) {
                const auto& option = node.choices[i];
                auto next = destination(node, option.sequenceId, option.nextMessageId);
                if (!next) continue;
                domain::ChoiceSelection selection{static_cast<int>(i), option.text, option.contentKey};
                out.push_back({*next, selection});
            }
            break;
        }
        case NodeKind::Action:
        case NodeKind::Message: {
            if (auto next = linearSuccessor(node)) out.push_back({*next, std::nullopt});
            break;
        }
    }
    return out;
}

domain::ResolvedPathNode PathResolver::makePathNode(const NodeAddress& address,
                                                    std::optional<domain::ChoiceSelection> selection) {
    domain::ResolvedPathNode pathNode;
    pathNode.sequenceId = address.sequenceId;
    pathNode.messageId = address.messageId;
    const domain::DialogueNode* node = m_index.findNode(address);
    pathNode.kind = node ? node->kind : NodeKind::Message;
    pathNode.selection = std::move(selection);
    return pathNode;
}

domain::ResolvedPath PathResolver::fallback(const NodeAddress& target) {
    domain::ResolvedPath path;
    path.nodes.push_back(makePathNode(target, std::nullopt));
    path.reachedTarget = false;
    return path;
}

domain::ResolvedPath PathResolver::resolve(const domain::StateSpec& state, const NodeAddress& target) {
    std::optional<NodeAddress> start;
    if (state.entry.messageId) {
        start = NodeAddress{state.entry.sequenceId, *state.entry.messageId};
    } else {
        start = sequenceEntry(state.entry.sequenceId);
    }
    if (!start || !m_index.contains(*start)) {
        std::cerr << "[PathResolver] Entry point " << state.entry.sequenceId
                  << " does not exist; using target-only context for " << target.toString() << std::endl;
        return fallback(target);
    }

    std::deque<std::vector<domain::ResolvedPathNode>> frontier;
    frontier.push_back({makePathNode(*start, std::nullopt)});
    std::set<NodeAddress> visited;
    int expanded = 0;

    while (!frontier.empty()) {
        std::vector<domain::ResolvedPathNode> path = std::move(frontier.front());
        frontier.pop_front();

        NodeAddress last = path.back().address();
        if (last == target) {
            return domain::ResolvedPath{std::move(path), true};
        }
        if (static_cast<int>(path.size()) >= state.limits.maxDepth) continue;
        if (expanded >= state.limits.maxPaths) {
            std::cerr << "[PathResolver] Expansion limit (" << state.limits.maxPaths << ") reached." << std::endl;
            break;
        }

        // Duplicates may wait in the frontier; each address is expanded once.
        if (visited.count(last)) continue;

        const domain::DialogueNode* node = m_index.findNode(last);
        if (!node) continue;
        ++expanded;

        std::vector<Successor> successors = successorsOf(*node, state);
        visited.insert(last);

        std::stable_partition(successors.begin(), successors.end(),
                              [&](const Successor& s) { return s.address == target; });

        for (auto& successor : successors) {
            if (visited.count(successor.address)) continue;
            std::vector<domain::ResolvedPathNode> extended = path;
            extended.push_back(makePathNode(successor.address, std::move(successor.selection)));
            if (successor.address == target) {
                return domain::ResolvedPath{std::move(extended), true};
            }
            frontier.push_back(std::move(extended));
        }
    }

    std::cerr << "[PathResolver] Could not reach " << target.toString() << " from " << start->toString()
              << "; using target-only context." << std::endl;
    return fallback(target);
}

} // namespace variantwalker::application
