/**
 * @file ContextWindowBuilder.hpp
 * @brief Projects a resolved path into the last N displayable conversation turns.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "application/SequenceIndex.hpp"
#include "domain/ContextTurn.hpp"
#include "domain/ResolvedPath.hpp"

namespace variantwalker::application {

/**
 * @class ContextWindowBuilder
 * @brief Builds the context shown to the generator for the target node.
 *
 * The target (last path node) is excluded. Conditional and action nodes are not
 * displayable. Choice nodes become user turns describing the option taken.
 */
class ContextWindowBuilder {
public:
    /** @brief Returns existing phrasings of a content key. */
    using ExampleSampler = std::function<std::vector<std::string>(const std::string&)>;

    ContextWindowBuilder(SequenceIndex& index, int historyBubbles,
                         int turnExamples = 0, ExampleSampler sampler = {});

    std::vector<domain::ContextTurn> build(const domain::ResolvedPath& path) const;

    static bool IsDisplayable(domain::NodeKind kind) {
        return kind != domain::NodeKind::ConditionalBranch && kind != domain::NodeKind::Action;
    }

private:
    std::optional<domain::ContextTurn> turnAt(const domain::ResolvedPath& path, size_t position) const;
    void attachExamples(domain::ContextTurn& turn, const std::string& contentKey) const;

    SequenceIndex& m_index;
    int m_historyBubbles;
    int m_turnExamples;
    ExampleSampler m_sampler;
};

} // namespace variantwalker::application
