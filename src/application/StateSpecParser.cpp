/**
 * @file StateSpecParser.cpp
 * @brief Implementation of StateSpecParser.
 */

#include "application/StateSpecParser.hpp"
#include "domain/Errors.hpp"
#include <cstdlib>

namespace variantwalker::application {

using json = nlohmann::json;

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

int PositiveInt(const json& value, const char* name) {
    if (!value.is_number_integer() || value.get<long long>() <= 0) {
        throw domain::StructuralError(std::string("state: '") + name + "' must be a positive integer");
    }
    return value.get<int>();
}

std::string SelectorText(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    throw domain::StructuralError("state: choice 'value' must be a string or integer");
}

domain::SelectionMethod ParseMethod(const std::string& by) {
    if (by == "index") return domain::SelectionMethod::ByIndex;
    if (by == "text") return domain::SelectionMethod::ByText;
    if (by == "content_key" || by == "contentKey") return domain::SelectionMethod::ByContentKey;
    throw domain::StructuralError("state: unknown choice selection method '" + by + "'");
}

} // namespace

domain::NodeAddress StateSpecParser::ParseAddress(const std::string& text) {
    std::string trimmed = Trim(text);
    size_t colon = trimmed.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= trimmed.size()) {
        throw domain::StructuralError("Invalid node address (expected seq:msg): " + text);
    }
    std::string sequenceId = Trim(trimmed.substr(0, colon));
    std::string messagePart = Trim(trimmed.substr(colon + 1));

    char* end = nullptr;
    long messageId = std::strtol(messagePart.c_str(), &end, 10);
    if (sequenceId.empty() || messagePart.empty() || *end != '\0') {
        throw domain::StructuralError("Invalid node address (expected seq:msg): " + text);
    }
    return domain::NodeAddress{sequenceId, static_cast<int>(messageId)};
}

domain::StateSpec StateSpecParser::DefaultFor(const std::string& sequenceId) {
    domain::StateSpec state;
    state.entry.sequenceId = sequenceId;
    return state;
}

domain::StateSpec StateSpecParser::FromValue(const json& value) {
    if (!value.is_object()) {
        throw domain::StructuralError("state: top level must be a map");
    }
    domain::StateSpec state;

    if (auto entry = value.find("entry"); entry != value.end() && !entry->is_null()) {
        if (entry->is_string()) {
            state.entry.sequenceId = entry->get<std::string>();
        } else if (entry->is_object()) {
            auto sequence = entry->find("sequence");
            if (sequence == entry->end() || !sequence->is_string()) {
                throw domain::StructuralError("state: 'entry.sequence' must be a string");
            }
            state.entry.sequenceId = sequence->get<std::string>();
            auto message = entry->find("message");
            if (message != entry->end() && !message->is_null()) {
                if (!message->is_number_integer()) {
                    throw domain::StructuralError("state: 'entry.message' must be an integer");
                }
                state.entry.messageId = message->get<int>();
            }
        } else {
            throw domain::StructuralError("state: 'entry' must be a map");
        }
    }

    if (auto mode = value.find("branch_mode"); mode != value.end() && !mode->is_null()) {
        std::string text = mode->is_string() ? mode->get<std::string>() : "";
        if (text == "resolve") {
            state.branchMode = domain::BranchMode::Resolve;
        } else if (text == "default") {
            state.branchMode = domain::BranchMode::AlwaysDefault;
        } else {
            throw domain::StructuralError("state: 'branch_mode' must be 'resolve' or 'default'");
        }
    }

    if (auto variables = value.find("variables"); variables != value.end() && !variables->is_null()) {
        if (!variables->is_object()) {
            throw domain::StructuralError("state: 'variables' must be a map");
        }
        state.variables = *variables;
    }

    if (auto choices = value.find("choices"); choices != value.end() && !choices->is_null()) {
        if (!choices->is_array()) {
            throw domain::StructuralError("state: 'choices' must be a list");
        }
        for (const auto& item : *choices) {
            if (!item.is_object()) {
                throw domain::StructuralError("state: every choice directive must be a map");
            }
            auto node = item.find("node");
            if (node == item.end() || !node->is_string()) {
                throw domain::StructuralError("state: choice directive without 'node'");
            }
            auto selector = item.find("value");
            if (selector == item.end()) {
                throw domain::StructuralError("state: choice directive without 'value'");
            }

            domain::ChoiceDirective directive;
            directive.node = ParseAddress(node->get<std::string>());
            auto by = item.find("by");
            directive.method = (by != item.end() && by->is_string()) ? ParseMethod(by->get<std::string>())
                                                                     : domain::SelectionMethod::ByIndex;
            directive.selector = SelectorText(*selector);
            state.directives.push_back(directive);
        }
    }

    if (auto limits = value.find("limits"); limits != value.end() && !limits->is_null()) {
        if (!limits->is_object()) {
            throw domain::StructuralError("state: 'limits' must be a map");
        }
        if (auto depth = limits->find("max_depth"); depth != limits->end()) {
            state.limits.maxDepth = PositiveInt(*depth, "max_depth");
        }
        if (auto paths = limits->find("max_paths"); paths != limits->end()) {
            state.limits.maxPaths = PositiveInt(*paths, "max_paths");
        }
    }

    return state;
}

} // namespace variantwalker::application
