/**
 * @file VariantValidator.cpp
 * @brief Implementation of VariantValidator.
 */

#include "application/VariantValidator.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>

namespace variantwalker::application {

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::vector<std::string> SplitBubbles(const std::string& text) {
    std::vector<std::string> parts;
    const std::string separator = kBubbleSeparator;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(separator, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + separator.size();
    }
}

// Decodes the next UTF-8 code point; malformed bytes decode as themselves.
uint32_t NextCodePoint(const std::string& s, size_t& i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    int extra = 0;
    uint32_t cp = c;
    if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    ++i;
    for (int k = 0; k < extra && i < s.size(); ++k, ++i) {
        unsigned char cc = static_cast<unsigned char>(s[i]);
        if ((cc & 0xC0) != 0x80) return c;
        cp = (cp << 6) | (cc & 0x3F);
    }
    return cp;
}

} // namespace

ValidationRules ValidationRules::FromConfig(const infrastructure::PipelineConfig& config) {
    ValidationRules rules;
    rules.maxBubbles = config.style.allowPipes ? config.gen.maxBubblesPerLine : 1;
    rules.maxCharsPerBubble = config.gen.maxCharsPerBubble;
    rules.dedupeThreshold = config.gen.dedupeThreshold;
    rules.forbidEmojis = config.style.forbidEmojis;
    rules.blocklist = config.safety.blocklist;
    rules.piiPatterns = config.safety.piiRegexes;
    return rules;
}

VariantValidator::VariantValidator(ValidationRules rules)
    : m_rules(std::move(rules)) {
    for (const auto& pattern : m_rules.piiPatterns) {
        try {
            m_pii.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            throw domain::StructuralError("Invalid PII regex '" + pattern + "': " + e.what());
        }
    }
}

std::set<std::string> VariantValidator::TokenSet(const std::string& text) {
    std::string cleaned = ToLower(text);
    for (char& c : cleaned) {
        unsigned char u = static_cast<unsigned char>(c);
        bool keep = (u >= 'a' && u <= 'z') || (u >= '0' && u <= '9') || u == '|' || std::isspace(u);
        if (!keep) c = ' ';
    }
    std::set<std::string> tokens;
    std::istringstream in(cleaned);
    std::string token;
    while (in >> token) tokens.insert(token);
    return tokens;
}

double VariantValidator::Similarity(const std::string& a, const std::string& b) {
    std::set<std::string> ta = TokenSet(a);
    std::set<std::string> tb = TokenSet(b);
    size_t inter = 0;
    for (const auto& t : ta) {
        if (tb.count(t)) ++inter;
    }
    size_t unionSize = ta.size() + tb.size() - inter;
    if (unionSize == 0) return 0.0;
    return static_cast<double>(inter) / static_cast<double>(unionSize);
}

bool VariantValidator::PlaceholdersBalanced(const std::string& text) {
    int open = 0;
    for (char c : text) {
        if (c == '{') ++open;
        if (c == '}') --open;
        if (open < 0) return false;
    }
    return open == 0;
}

size_t VariantValidator::Utf8Length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

bool VariantValidator::ContainsEmoji(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = NextCodePoint(text, i);
        if ((cp >= 0x1F000 && cp <= 0x1FAFF) || (cp >= 0x2600 && cp <= 0x27BF) || cp == 0xFE0F) {
            return true;
        }
    }
    return false;
}

std::string VariantValidator::rejectionReason(const std::string& text,
                                              const std::vector<std::string>& existing,
                                              const std::vector<std::string>& accepted) const {
    if (text.empty()) return "empty";
    if (!PlaceholdersBalanced(text)) return "unbalanced placeholder braces";

    std::vector<std::string> bubbles = SplitBubbles(text);
    if (static_cast<int>(bubbles.size()) > m_rules.maxBubbles) {
        return "too many bubbles (" + std::to_string(bubbles.size()) + " > " +
               std::to_string(m_rules.maxBubbles) + ")";
    }
    for (const auto& bubble : bubbles) {
        size_t length = Utf8Length(Trim(bubble));
        if (static_cast<int>(length) > m_rules.maxCharsPerBubble) {
            return "bubble too long (" + std::to_string(length) + " > " +
                   std::to_string(m_rules.maxCharsPerBubble) + " chars)";
        }
    }

    std::string lowered = ToLower(text);
    for (const auto& word : m_rules.blocklist) {
        if (!word.empty() && lowered.find(ToLower(word)) != std::string::npos) {
            return "blocklisted: " + word;
        }
    }
    for (size_t i = 0; i < m_pii.size(); ++i) {
        if (std::regex_search(text, m_pii[i])) return "matches PII pattern: " + m_rules.piiPatterns[i];
    }
    if (m_rules.forbidEmojis && ContainsEmoji(text)) return "contains emoji";

    for (const auto& line : existing) {
        if (Similarity(text, line) >= m_rules.dedupeThreshold) return "near-duplicate of existing line";
    }
    for (const auto& line : accepted) {
        if (Similarity(text, line) >= m_rules.dedupeThreshold) return "near-duplicate of accepted line";
    }
    return "";
}

std::vector<Verdict> VariantValidator::review(const std::vector<std::string>& candidates,
                                              const std::vector<std::string>& existing) const {
    std::vector<Verdict> verdicts;
    std::vector<std::string> accepted;
    for (const auto& raw : candidates) {
        std::string text = Trim(raw);
        std::replace(text.begin(), text.end(), '\t', ' ');

        Verdict verdict;
        verdict.candidate = text;
        verdict.reason = rejectionReason(text, existing, accepted);
        verdict.accepted = verdict.reason.empty();
        if (verdict.accepted) accepted.push_back(text);
        verdicts.push_back(std::move(verdict));
    }
    return verdicts;
}

std::vector<std::string> VariantValidator::validate(const std::vector<std::string>& candidates,
                                                    const std::vector<std::string>& existing) const {
    std::vector<std::string> out;
    for (auto& verdict : review(candidates, existing)) {
        if (verdict.accepted) out.push_back(std::move(verdict.candidate));
    }
    return out;
}

} // namespace variantwalker::application
