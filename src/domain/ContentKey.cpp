#include "domain/ContentKey.hpp"

namespace variantwalker::domain {

namespace {
constexpr const char* kContentRoot = "content/";
}

ContentKey ContentKey::Decode(const std::string& key) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = key.find('.', start);
        parts.push_back(key.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }

    ContentKey out;
    if (parts.size() < 3) return out;
    for (const auto& part : parts) {
        if (part.empty() || part.find_first_of("/\\") != std::string::npos) return out;
    }

    out.m_actor = parts[0];
    out.m_action = parts[1];
    out.m_subject = parts[2];
    out.m_modifiers.assign(parts.begin() + 3, parts.end());
    out.m_valid = true;
    return out;
}

std::string ContentKey::encodePath() const {
    std::string name = m_subject;
    for (const auto& modifier : m_modifiers) {
        name += "_" + modifier;
    }
    return siblingsDir() + name + ".txt";
}

std::string ContentKey::siblingsDir() const {
    return std::string(kContentRoot) + m_actor + "/" + m_action + "/";
}

std::string ContentKey::toKey() const {
    if (!m_valid) return {};
    std::string key = m_actor + "." + m_action + "." + m_subject;
    for (const auto& modifier : m_modifiers) {
        key += "." + modifier;
    }
    return key;
}

} // namespace variantwalker::domain
