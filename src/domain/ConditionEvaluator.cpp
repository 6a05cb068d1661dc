/**
 * @file ConditionEvaluator.cpp
 * @brief Implementation of the route condition evaluator.
 */

#include "domain/ConditionEvaluator.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace variantwalker::domain {

using json = nlohmann::json;

namespace {

// Longer operators first so ">=" is not read as ">".
const char* const kComparisonOperators[] = {">=", "<=", "!=", "==", ">", "<"};

std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

size_t FindOutsideQuotes(const std::string& text, const std::string& op) {
    bool inSingle = false;
    bool inDouble = false;
    for (size_t i = 0; i + op.size() <= text.size(); ++i) {
        char c = text[i];
        if (c == '\'' && !inDouble) {
            inSingle = !inSingle;
        } else if (c == '"' && !inSingle) {
            inDouble = !inDouble;
        }
        if (!inSingle && !inDouble && text.compare(i, op.size(), op) == 0) {
            return i;
        }
    }
    return std::string::npos;
}

std::vector<std::string> SplitOutsideQuotes(const std::string& text, const std::string& op) {
    std::vector<std::string> parts;
    std::string rest = text;
    size_t pos = FindOutsideQuotes(rest, op);
    while (pos != std::string::npos) {
        parts.push_back(rest.substr(0, pos));
        rest = rest.substr(pos + op.size());
        pos = FindOutsideQuotes(rest, op);
    }
    parts.push_back(rest);
    return parts;
}

bool IsQuoted(const std::string& token) {
    return token.size() >= 2 && (token.front() == '\'' || token.front() == '"') && token.back() == token.front();
}

std::optional<json> ParseNumber(const std::string& token) {
    if (token.empty()) return std::nullopt;
    char first = token[0];
    if (!std::isdigit(static_cast<unsigned char>(first)) && first != '-' && first != '+' && first != '.') {
        return std::nullopt;
    }

    char* end = nullptr;
    long long asInt = std::strtoll(token.c_str(), &end, 10);
    if (end && *end == '\0') return json(asInt);

    double asDouble = std::strtod(token.c_str(), &end);
    if (end && *end == '\0' && std::isfinite(asDouble)) return json(asDouble);
    return std::nullopt;
}

// "user.name", "session.day_count": looks like a variable reference.
bool IsVariablePath(const std::string& token) {
    if (token.empty() || token.find('.') == std::string::npos) return false;
    if (!std::isalpha(static_cast<unsigned char>(token[0])) && token[0] != '_') return false;
    char previous = '\0';
    for (char c : token) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '.') {
            if (previous == '.') return false;
        } else if (!std::isalnum(uc) && c != '_') {
            return false;
        }
        previous = c;
    }
    return previous != '.';
}

std::optional<double> ToNumber(const json& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        auto parsed = ParseNumber(Trim(value.get<std::string>()));
        if (parsed) return parsed->get<double>();
    }
    return std::nullopt;
}

std::string StringForm(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

} // namespace

bool ConditionEvaluator::Evaluate(const std::string& expression, const json& values) {
    std::string expr = Trim(expression);
    if (expr.empty()) return false;

    auto orParts = SplitOutsideQuotes(expr, "||");
    if (orParts.size() > 1) {
        for (const auto& part : orParts) {
            if (Evaluate(part, values)) return true;
        }
        return false;
    }

    auto andParts = SplitOutsideQuotes(expr, "&&");
    if (andParts.size() > 1) {
        for (const auto& part : andParts) {
            if (!Evaluate(part, values)) return false;
        }
        return true;
    }

    return EvaluateComparison(expr, values);
}

bool ConditionEvaluator::EvaluateComparison(const std::string& expression, const json& values) {
    for (const char* op : kComparisonOperators) {
        std::string opText(op);
        size_t pos = FindOutsideQuotes(expression, opText);
        if (pos == std::string::npos) continue;

        json left = ResolveOperand(expression.substr(0, pos), values);
        json right = ResolveOperand(expression.substr(pos + opText.size()), values);

        if (opText == "==") return Equals(left, right);
        if (opText == "!=") return !Equals(left, right);

        auto l = ToNumber(left);
        auto r = ToNumber(right);
        if (!l || !r) return false;
        if (opText == ">=") return *l >= *r;
        if (opText == "<=") return *l <= *r;
        if (opText == ">") return *l > *r;
        return *l < *r;
    }

    return IsTruthy(ResolveOperand(expression, values));
}

json ConditionEvaluator::ResolveOperand(const std::string& token, const json& values) {
    std::string t = Trim(token);
    if (t.empty()) return nullptr;
    if (IsQuoted(t)) return t.substr(1, t.size() - 2);

    if (auto found = Lookup(t, values)) return *found;

    if (t == "null") return nullptr;
    if (t == "true") return true;
    if (t == "false") return false;
    if (auto number = ParseNumber(t)) return *number;

    // Unset variable.
    if (IsVariablePath(t)) return nullptr;
    return t;
}

bool ConditionEvaluator::Equals(const json& left, const json& right) {
    if (left.is_null() || right.is_null()) return left.is_null() && right.is_null();

    auto l = ToNumber(left);
    auto r = ToNumber(right);
    if (l && r) return *l == *r;

    if (left == right) return true;
    return StringForm(left) == StringForm(right);
}

bool ConditionEvaluator::IsTruthy(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return false;
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return value.get<double>() != 0.0;
        case json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        case json::value_t::array:
        case json::value_t::object:
        case json::value_t::binary:
            return !value.empty();
    }
    return true;
}

std::optional<json> ConditionEvaluator::Lookup(const std::string& key, const json& values) {
    if (!values.is_object() || key.empty()) return std::nullopt;

    auto flat = values.find(key);
    if (flat != values.end()) return *flat;

    const json* current = &values;
    size_t start = 0;
    while (start <= key.size()) {
        size_t dot = key.find('.', start);
        std::string segment = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!current->is_object()) return std::nullopt;
        auto it = current->find(segment);
        if (it == current->end()) return std::nullopt;
        current = &(*it);
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return *current;
}

} // namespace variantwalker::domain
