/**
 * @file ConditionEvaluator.hpp
 * @brief Evaluates routing conditions such as "user.streak >= 3 && user.name != 'Bob'".
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace variantwalker::domain {

/**
 * @class ConditionEvaluator
 * @brief Stateless evaluator for the boolean route condition language.
 *
 * Precedence, lowest first: "||", "&&", comparison (== != > < >= <=), bare truthiness.
 * Operators inside single or double quotes are ignored. Operands are looked up in the
 * supplied values (flat "a.b" key first, then nested objects) and otherwise parsed as
 * literals. Ordering comparisons on non-numeric operands are false. Never throws.
 */
class ConditionEvaluator {
public:
    /**
     * @brief Evaluates an expression against a variable mapping.
     * @param expression Condition text. An empty expression is false.
     * @param values JSON object of variables.
     */
    static bool Evaluate(const std::string& expression, const nlohmann::json& values);

    /** @brief null, false, 0, "", [] and {} are falsy; everything else is truthy. */
    static bool IsTruthy(const nlohmann::json& value);

    /** @brief Finds a variable by flat key or dotted path. */
    static std::optional<nlohmann::json> Lookup(const std::string& key, const nlohmann::json& values);

private:
    static bool EvaluateComparison(const std::string& expression, const nlohmann::json& values);
    static nlohmann::json ResolveOperand(const std::string& token, const nlohmann::json& values);
    static bool Equals(const nlohmann::json& left, const nlohmann::json& right);
};

} // namespace variantwalker::domain
