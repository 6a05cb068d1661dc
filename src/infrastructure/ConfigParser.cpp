/**
 * @file ConfigParser.cpp
 * @brief Implementation of the indentation-based configuration parser.
 */

#include "infrastructure/ConfigParser.hpp"
#include "domain/Errors.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace variantwalker::infrastructure {

using json = nlohmann::json;

namespace {

struct Frame {
    int indent;           ///< Indentation of the line that opened the block.
    json* container;      ///< Object or array receiving the block's children.
    int childIndent = -1; ///< Fixed by the first child line.
};

struct Line {
    int number;
    int indent;
    std::string content;
};

std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

bool IsQuoted(const std::string& token) {
    return token.size() >= 2 && (token.front() == '"' || token.front() == '\'') && token.back() == token.front();
}

// A '#' starts a comment at line start or after whitespace, outside quotes.
std::string StripComment(const std::string& line) {
    bool inSingle = false;
    bool inDouble = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\'' && !inDouble) inSingle = !inSingle;
        else if (c == '"' && !inSingle) inDouble = !inDouble;
        else if (c == '#' && !inSingle && !inDouble &&
                 (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

// First ':' outside quotes that is followed by a space or ends the line.
size_t FindKeyColon(const std::string& content) {
    bool inSingle = false;
    bool inDouble = false;
    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c == '\'' && !inDouble) inSingle = !inSingle;
        else if (c == '"' && !inSingle) inDouble = !inDouble;
        else if (c == ':' && !inSingle && !inDouble &&
                 (i + 1 == content.size() || content[i + 1] == ' ' || content[i + 1] == '\t')) {
            return i;
        }
    }
    return std::string::npos;
}

std::vector<std::string> SplitFlowItems(const std::string& inner) {
    std::vector<std::string> items;
    std::string current;
    bool inSingle = false;
    bool inDouble = false;
    for (char c : inner) {
        if (c == '\'' && !inDouble) inSingle = !inSingle;
        else if (c == '"' && !inSingle) inDouble = !inDouble;
        if (c == ',' && !inSingle && !inDouble) {
            items.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    items.push_back(current);
    return items;
}

bool IsListItem(const std::string& content) {
    return content == "-" || content.rfind("- ", 0) == 0;
}

json ParseAtom(const std::string& token) {
    if (IsQuoted(token)) return token.substr(1, token.size() - 2);
    if (token == "true") return true;
    if (token == "false") return false;
    if (token == "null" || token == "~") return nullptr;

    if (!token.empty()) {
        char first = token[0];
        if (std::isdigit(static_cast<unsigned char>(first)) || first == '-' || first == '+' || first == '.') {
            char* end = nullptr;
            long long asInt = std::strtoll(token.c_str(), &end, 10);
            if (end && *end == '\0') return asInt;
            double asDouble = std::strtod(token.c_str(), &end);
            if (end && *end == '\0' && std::isfinite(asDouble)) return asDouble;
        }
    }
    return token;
}

std::vector<Line> SignificantLines(const std::string& text) {
    std::vector<Line> lines;
    std::istringstream stream(text);
    std::string raw;
    int number = 0;
    while (std::getline(stream, raw)) {
        ++number;
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();
        std::string line = StripComment(raw);
        if (Trim(line).empty()) continue;

        size_t indent = line.find_first_not_of(' ');
        if (line[indent] == '\t') {
            throw domain::ConfigParseError("tabs are not allowed in indentation", number);
        }
        std::string content = line.substr(indent);
        content.erase(content.find_last_not_of(" \t") + 1);
        lines.push_back(Line{number, static_cast<int>(indent), content});
    }
    return lines;
}

} // namespace

json ConfigParser::ParseScalar(const std::string& token) {
    std::string t = Trim(token);
    if (t.size() >= 2 && t.front() == '[' && t.back() == ']') {
        json list = json::array();
        std::string inner = Trim(t.substr(1, t.size() - 2));
        if (inner.empty()) return list;
        for (const auto& item : SplitFlowItems(inner)) {
            std::string element = Trim(item);
            if (!element.empty()) list.push_back(ParseAtom(element));
        }
        return list;
    }
    return ParseAtom(t);
}

json ConfigParser::Parse(const std::string& text) {
    json root = json::object();
    std::vector<Line> lines = SignificantLines(text);
    std::vector<Frame> stack{Frame{-1, &root}};

    for (size_t i = 0; i < lines.size(); ++i) {
        const Line& line = lines[i];

        while (stack.size() > 1 && line.indent <= stack.back().indent) {
            stack.pop_back();
        }
        Frame& top = stack.back();
        if (top.childIndent < 0) {
            top.childIndent = line.indent;
        } else if (line.indent != top.childIndent) {
            throw domain::ConfigParseError("indentation does not match any open block", line.number);
        }

        if (IsListItem(line.content)) {
            if (!top.container->is_array()) {
                throw domain::ConfigParseError("list item where a mapping entry is expected", line.number);
            }
            std::string item = Trim(line.content.substr(1));
            if (item.empty()) {
                top.container->push_back(json::object());
                json* child = &top.container->back();
                stack.push_back(Frame{line.indent, child});
            } else {
                top.container->push_back(ParseScalar(item));
            }
            continue;
        }

        if (top.container->is_array()) {
            throw domain::ConfigParseError("mapping entry where a list item is expected", line.number);
        }

        size_t colon = FindKeyColon(line.content);
        if (colon == std::string::npos) {
            throw domain::ConfigParseError("expected 'key: value', got \"" + line.content + "\"", line.number);
        }
        std::string key = Trim(line.content.substr(0, colon));
        if (IsQuoted(key)) key = key.substr(1, key.size() - 2);
        if (key.empty()) {
            throw domain::ConfigParseError("empty mapping key", line.number);
        }
        std::string rest = Trim(line.content.substr(colon + 1));
        json& map = *top.container;

        if (!rest.empty()) {
            map[key] = ParseScalar(rest);
            continue;
        }

        // Empty value: the next significant line decides between a nested list and map.
        const Line* next = (i + 1 < lines.size()) ? &lines[i + 1] : nullptr;
        if (!next || next->indent <= line.indent) {
            map[key] = nullptr;
        } else if (IsListItem(next->content)) {
            map[key] = json::array();
            stack.push_back(Frame{line.indent, &map[key]});
        } else {
            map[key] = json::object();
            stack.push_back(Frame{line.indent, &map[key]});
        }
    }

    return root;
}

} // namespace variantwalker::infrastructure
