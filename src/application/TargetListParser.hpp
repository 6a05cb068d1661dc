/**
 * @file TargetListParser.hpp
 * @brief Parses newline-delimited "sequence-id:message-id" target lists.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/DialogueNode.hpp"

namespace variantwalker::application {

class TargetListParser {
public:
    /**
     * @brief Blank lines and lines starting with '#' are skipped.
     * @throws domain::StructuralError naming the first malformed line.
     */
    static std::vector<domain::NodeAddress> Parse(const std::string& text);

    /** @brief Reads and parses a list file. */
    static std::vector<domain::NodeAddress> ParseFile(const std::string& path);
};

} // namespace variantwalker::application
