/**
 * @file SequenceRepositoryFs.cpp
 * @brief Implementation of SequenceRepositoryFs.
 */

#include "infrastructure/SequenceRepositoryFs.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <set>

namespace variantwalker::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::optional<std::string> OptionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw domain::StructuralError(std::string("field '") + key + "' must be a string");
    }
    std::string value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

std::optional<int> OptionalInt(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_integer()) {
        throw domain::StructuralError(std::string("field '") + key + "' must be an integer");
    }
    return it->get<int>();
}

domain::NodeKind KindFor(const std::string& type, bool crossJump) {
    if (type == "choice") return domain::NodeKind::Choice;
    if (type == "autoroute") return domain::NodeKind::ConditionalBranch;
    if (crossJump) return domain::NodeKind::CrossJump;
    if (type == "dataAction") return domain::NodeKind::Action;
    return domain::NodeKind::Message;
}

domain::DialogueNode ParseNode(const json& m, const std::string& sequenceId) {
    if (!m.is_object()) {
        throw domain::StructuralError("message entry is not an object");
    }
    auto id = OptionalInt(m, "id");
    if (!id) {
        throw domain::StructuralError("message without an integer 'id'");
    }

    domain::DialogueNode node;
    node.sequenceId = sequenceId;
    node.id = *id;
    node.type = OptionalString(m, "type").value_or("bot");
    node.sender = OptionalString(m, "sender").value_or(node.type == "user" ? "user" : "bot");
    node.text = OptionalString(m, "text").value_or("");
    node.contentKey = OptionalString(m, "contentKey");
    node.nextMessageId = OptionalInt(m, "nextMessageId");

    auto declaredSequence = OptionalString(m, "sequenceId");
    bool crossJump = declaredSequence && *declaredSequence != sequenceId;
    if (crossJump) node.targetSequenceId = declaredSequence;
    node.kind = KindFor(node.type, crossJump);

    auto choices = m.find("choices");
    if (choices != m.end() && choices->is_array()) {
        for (const auto& c : *choices) {
            if (!c.is_object()) continue;
            domain::ChoiceOption option;
            option.text = OptionalString(c, "text").value_or("");
            option.nextMessageId = OptionalInt(c, "nextMessageId");
            option.sequenceId = OptionalString(c, "sequenceId");
            option.contentKey = OptionalString(c, "contentKey");
            node.choices.push_back(option);
        }
    }

    auto routes = m.find("routes");
    if (routes != m.end() && routes->is_array()) {
        for (const auto& r : *routes) {
            if (!r.is_object()) continue;
            domain::RouteOption route;
            route.condition = OptionalString(r, "condition");
            route.sequenceId = OptionalString(r, "sequenceId");
            route.nextMessageId = OptionalInt(r, "nextMessageId");
            auto isDefault = r.find("default");
            route.isDefault = isDefault != r.end() && isDefault->is_boolean() && isDefault->get<bool>();
            node.routes.push_back(route);
        }
    }

    return node;
}

} // namespace

SequenceRepositoryFs::SequenceRepositoryFs(const std::string& assetsDir)
    : m_sequencesPath((fs::path(assetsDir) / "sequences").string()) {}

std::optional<domain::SequenceDocument> SequenceRepositoryFs::loadSequence(const std::string& sequenceId) {
    fs::path path = fs::path(m_sequencesPath) / (sequenceId + ".json");
    if (!fs::exists(path)) {
        return std::nullopt;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        throw domain::StructuralError("Cannot open sequence file: " + path.string());
    }
    json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        throw domain::StructuralError("Invalid JSON in " + path.string());
    }

    try {
        return ParseDocument(document, sequenceId);
    } catch (const domain::StructuralError& e) {
        throw domain::StructuralError(path.string() + ": " + e.what());
    }
}

domain::SequenceDocument SequenceRepositoryFs::ParseDocument(const json& document, const std::string& fallbackId) {
    if (!document.is_object()) {
        throw domain::StructuralError("sequence document is not an object");
    }

    domain::SequenceDocument out;
    out.sequenceId = OptionalString(document, "sequenceId").value_or(fallbackId);
    out.name = OptionalString(document, "name").value_or(out.sequenceId);

    auto messages = document.find("messages");
    if (messages == document.end() || !messages->is_array()) {
        return out;
    }

    std::set<int> seen;
    for (const auto& m : *messages) {
        domain::DialogueNode node = ParseNode(m, out.sequenceId);
        if (!seen.insert(node.id).second) {
            throw domain::StructuralError("duplicate message id " + std::to_string(node.id) +
                                          " in sequence " + out.sequenceId);
        }
        out.nodes.push_back(std::move(node));
    }
    return out;
}

} // namespace variantwalker::infrastructure
