/**
 * @file SequenceRepositoryFs.hpp
 * @brief Filesystem-based implementation of the SequenceSource.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/SequenceSource.hpp"

namespace variantwalker::infrastructure {

/**
 * @class SequenceRepositoryFs
 * @brief Reads sequence documents from <assetsDir>/sequences/<sequenceId>.json.
 */
class SequenceRepositoryFs : public domain::SequenceSource {
public:
    /**
     * @brief Constructor for SequenceRepositoryFs.
     * @param assetsDir Root of the asset tree (contains "sequences/" and "content/").
     */
    explicit SequenceRepositoryFs(const std::string& assetsDir);

    /** @brief Loads and parses one sequence file. @see domain::SequenceSource::loadSequence */
    std::optional<domain::SequenceDocument> loadSequence(const std::string& sequenceId) override;

    /**
     * @brief Converts a sequence JSON document into domain nodes.
     * @param document Parsed JSON ({ "sequenceId", "messages": [...] }).
     * @param fallbackId Sequence id used when the document does not declare one.
     * @throws domain::StructuralError on missing ids, duplicate ids or wrong field types.
     */
    static domain::SequenceDocument ParseDocument(const nlohmann::json& document, const std::string& fallbackId);

private:
    std::string m_sequencesPath; ///< Directory holding the sequence files.
};

} // namespace variantwalker::infrastructure
