/**
 * @file SequenceSource.hpp
 * @brief Interface for read-only access to sequence documents.
 */

#pragma once

#include <optional>
#include <string>
#include "DialogueNode.hpp"

namespace variantwalker::domain {

/**
 * @class SequenceSource
 * @brief Abstract provider of sequence documents (filesystem, in-memory, ...).
 */
class SequenceSource {
public:
    virtual ~SequenceSource() = default;

    /**
     * @brief Loads one sequence document.
     * @param sequenceId Identifier of the sequence.
     * @return The document, or nullopt if no such sequence exists.
     * @throws StructuralError if the document exists but is malformed.
     */
    virtual std::optional<SequenceDocument> loadSequence(const std::string& sequenceId) = 0;
};

} // namespace variantwalker::domain
