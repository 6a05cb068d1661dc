/**
 * @file ContentCorpus.hpp
 * @brief Filesystem access to the phrasing corpus (one phrasing per line per content key).
 */

#pragma once

#include <string>
#include <vector>

namespace variantwalker::infrastructure {

/**
 * @class ContentCorpus
 * @brief Reads existing phrasings and sibling exemplars; appends accepted variants.
 *
 * Paths are resolved against the assets directory using the content key codec,
 * e.g. bot.greet.morning -> <assetsDir>/content/bot/greet/morning.txt.
 */
class ContentCorpus {
public:
    explicit ContentCorpus(const std::string& assetsDir);

    /** @brief Absolute-or-relative file path for a key. @throws domain::StructuralError on invalid keys. */
    std::string pathFor(const std::string& contentKey) const;

    /** @brief Trimmed, non-blank lines of the key's file. Empty if the file does not exist. */
    std::vector<std::string> readVariants(const std::string& contentKey) const;

    /**
     * @brief Lines from every .txt file next to the key's file, in filename order.
     * @param maxCount Upper bound on the number of lines returned.
     */
    std::vector<std::string> collectExemplars(const std::string& contentKey, int maxCount) const;

    /**
     * @brief Appends one line per variant, creating directories as needed.
     * @throws domain::StructuralError if the file cannot be opened.
     */
    void appendVariants(const std::string& contentKey, const std::vector<std::string>& lines) const;

private:
    static std::vector<std::string> ReadLines(const std::string& path);

    std::string m_assetsDir;
};

} // namespace variantwalker::infrastructure
