/**
 * @file ContentKey.hpp
 * @brief Codec between dotted content keys and corpus file addresses.
 */

#pragma once

#include <string>
#include <vector>

namespace variantwalker::domain {

/**
 * @class ContentKey
 * @brief actor.action.subject[.modifier]* mapped to content/<actor>/<action>/<subject>[_<modifier>...].txt
 */
class ContentKey {
public:
    /** @brief Splits a dotted key. Fewer than 3 segments (or an empty one) yields an invalid key. */
    static ContentKey Decode(const std::string& key);

    bool isValid() const { return m_valid; }
    const std::string& actor() const { return m_actor; }
    const std::string& action() const { return m_action; }
    const std::string& subject() const { return m_subject; }
    const std::vector<std::string>& modifiers() const { return m_modifiers; }

    /** @brief Relative corpus file address of this key. */
    std::string encodePath() const;

    /** @brief Relative directory holding sibling phrasings ("content/<actor>/<action>/"). */
    std::string siblingsDir() const;

    /** @brief Dotted form, identical to the decoded input for valid keys. */
    std::string toKey() const;

private:
    std::string m_actor;
    std::string m_action;
    std::string m_subject;
    std::vector<std::string> m_modifiers;
    bool m_valid = false;
};

} // namespace variantwalker::domain
