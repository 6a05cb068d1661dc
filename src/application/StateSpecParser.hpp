/**
 * @file StateSpecParser.hpp
 * @brief Builds a StateSpec from a parsed state specification file.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/StateSpec.hpp"

namespace variantwalker::application {

/**
 * @class StateSpecParser
 * @brief Reads the keys entry, branch_mode, variables, choices and limits.
 *
 * Example (config format):
 * @code
 * entry:
 *   sequence: onboarding
 * branch_mode: resolve
 * variables:
 *   user.streak: 4
 * choices:
 *   -
 *     node: onboarding:3
 *     by: text
 *     value: "Yes, let's go"
 * @endcode
 */
class StateSpecParser {
public:
    /**
     * @brief Converts a value tree. A missing entry leaves entry.sequenceId empty,
     * meaning "the target's own sequence".
     * @throws domain::StructuralError on unknown modes, bad addresses or wrong types.
     */
    static domain::StateSpec FromValue(const nlohmann::json& value);

    /** @brief Enter the sequence at its entry node, resolve mode, no variables. */
    static domain::StateSpec DefaultFor(const std::string& sequenceId);

    /** @brief Parses "sequence-id:message-id". @throws domain::StructuralError */
    static domain::NodeAddress ParseAddress(const std::string& text);
};

} // namespace variantwalker::application
