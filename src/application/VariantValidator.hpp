/**
 * @file VariantValidator.hpp
 * @brief Structural checks and near-duplicate filtering for generated candidates.
 */

#pragma once

#include <regex>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "infrastructure/PipelineConfig.hpp"

namespace variantwalker::application {

/** @brief Separator between chat bubbles inside one variant line. */
inline constexpr const char* kBubbleSeparator = "|||";

struct ValidationRules {
    int maxBubbles = 3;
    int maxCharsPerBubble = 90;
    double dedupeThreshold = 0.82;
    bool forbidEmojis = true;
    std::vector<std::string> blocklist;
    std::vector<std::string> piiPatterns;

    /** @brief Rules from gen/style/safety sections. Without pipes a line is one bubble. */
    static ValidationRules FromConfig(const infrastructure::PipelineConfig& config);
};

/**
 * @struct Verdict
 * @brief Outcome for one candidate, kept in the archive record.
 */
struct Verdict {
    std::string candidate; ///< Normalized text (trimmed, tabs replaced).
    bool accepted = false;
    std::string reason;    ///< Empty when accepted.

    nlohmann::json toJson() const {
        nlohmann::json j = {{"candidate", candidate}, {"accepted", accepted}};
        if (!accepted) j["reason"] = reason;
        return j;
    }
};

/**
 * @class VariantValidator
 * @brief Accepts candidates in order; each accepted line joins the dedupe pool.
 */
class VariantValidator {
public:
    /** @throws domain::StructuralError if a PII pattern is not a valid regex. */
    explicit VariantValidator(ValidationRules rules);

    /** @brief One verdict per candidate, in input order. */
    std::vector<Verdict> review(const std::vector<std::string>& candidates,
                                const std::vector<std::string>& existing) const;

    /** @brief Accepted candidates only, order preserved. */
    std::vector<std::string> validate(const std::vector<std::string>& candidates,
                                      const std::vector<std::string>& existing) const;

    /** @brief Jaccard similarity of the two token sets (0 when both are empty). */
    static double Similarity(const std::string& a, const std::string& b);

    /** @brief Lowercase, non [a-z0-9|] to space, split on whitespace. */
    static std::set<std::string> TokenSet(const std::string& text);

    /** @brief Braces never close before opening and all opened braces are closed. */
    static bool PlaceholdersBalanced(const std::string& text);

    /** @brief Number of UTF-8 code points. */
    static size_t Utf8Length(const std::string& text);

    static bool ContainsEmoji(const std::string& text);

private:
    std::string rejectionReason(const std::string& text,
                                const std::vector<std::string>& existing,
                                const std::vector<std::string>& accepted) const;

    ValidationRules m_rules;
    std::vector<std::regex> m_pii;
};

} // namespace variantwalker::application
