/**
 * @file ConfigParser.hpp
 * @brief Parser for the indentation-based configuration subset (maps, lists, scalars).
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace variantwalker::infrastructure {

/**
 * @class ConfigParser
 * @brief Turns YAML-like configuration text into a JSON value tree.
 *
 * Supported: "#" comments, nested maps and lists by indentation, "- item" list entries,
 * a lone "-" opening a map item, flow lists "[a, b]", quoted and bare scalars.
 * Not supported: anchors, aliases, multi-line strings, "- key: value" shorthand.
 */
class ConfigParser {
public:
    /**
     * @brief Parses configuration text.
     * @return A JSON object (empty for empty input).
     * @throws domain::ConfigParseError on indentation or list/map shape errors.
     */
    static nlohmann::json Parse(const std::string& text);

    /** @brief Coerces one scalar token (bool, null, int, float, quoted or bare string, flow list). */
    static nlohmann::json ParseScalar(const std::string& token);
};

} // namespace variantwalker::infrastructure
