#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include "application/StateSpecParser.hpp"
#include "application/TargetListParser.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigParser.hpp"

using namespace variantwalker;
using application::StateSpecParser;
using application::TargetListParser;
using json = nlohmann::json;

namespace {

template <typename Fn>
bool ThrowsStructural(Fn fn) {
    try {
        fn();
    } catch (const domain::StructuralError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Full state file in config format..." << std::endl;
    const std::string text =
        "# morning check-in with a streak\n"
        "entry:\n"
        "  sequence: onboarding\n"
        "  message: 2\n"
        "branch_mode: resolve\n"
        "variables:\n"
        "  user.streak: 4\n"
        "  user:\n"
        "    name: Sam\n"
        "choices:\n"
        "  -\n"
        "    node: onboarding:3\n"
        "    by: text\n"
        "    value: \"Yes, let's go\"\n"
        "  -\n"
        "    node: onboarding:7\n"
        "    value: 1\n"
        "  -\n"
        "    node: goals:4\n"
        "    by: contentKey\n"
        "    value: user.goals.pick.sleep\n"
        "limits:\n"
        "  max_depth: 50\n"
        "  max_paths: 500\n";

    auto state = StateSpecParser::FromValue(infrastructure::ConfigParser::Parse(text));
    assert(state.entry.sequenceId == "onboarding");
    assert(state.entry.messageId && *state.entry.messageId == 2);
    assert(state.branchMode == domain::BranchMode::Resolve);
    assert(state.variables["user.streak"] == 4);
    assert(state.variables["user"]["name"] == "Sam");
    assert(state.directives.size() == 3);
    assert(state.directives[0].node == (domain::NodeAddress{"onboarding", 3}));
    assert(state.directives[0].method == domain::SelectionMethod::ByText);
    assert(state.directives[0].selector == "Yes, let's go");
    assert(state.directives[1].method == domain::SelectionMethod::ByIndex);
    assert(state.directives[1].selector == "1");
    assert(state.directives[2].method == domain::SelectionMethod::ByContentKey);
    assert(state.limits.maxDepth == 50 && state.limits.maxPaths == 500);
    assert(state.directiveFor(domain::NodeAddress{"onboarding", 7}) == &state.directives[1]);
    assert(state.directiveFor(domain::NodeAddress{"onboarding", 8}) == nullptr);

    json snapshot = state.toJson();
    assert(snapshot["branch_mode"] == "resolve");
    assert(snapshot["choices"][2]["by"] == "content_key");
    assert(snapshot["entry"]["message"] == 2);

    std::cout << "[Test] Short forms and defaults..." << std::endl;
    auto shortForm = StateSpecParser::FromValue(json::parse(R"({"entry": "daily", "branch_mode": "default"})"));
    assert(shortForm.entry.sequenceId == "daily" && !shortForm.entry.messageId);
    assert(shortForm.branchMode == domain::BranchMode::AlwaysDefault);
    assert(shortForm.limits.maxDepth == 200 && shortForm.limits.maxPaths == 10000);

    auto noEntry = StateSpecParser::FromValue(json::object());
    assert(noEntry.entry.sequenceId.empty());
    assert(noEntry.directives.empty() && noEntry.variables.empty());

    auto defaults = StateSpecParser::DefaultFor("daily");
    assert(defaults.entry.sequenceId == "daily" && !defaults.entry.messageId);

    std::cout << "[Test] Malformed state values..." << std::endl;
    assert(ThrowsStructural([] { StateSpecParser::FromValue(json::array()); }));
    assert(ThrowsStructural([] { StateSpecParser::FromValue(json::parse(R"({"branch_mode": "random"})")); }));
    assert(ThrowsStructural([] { StateSpecParser::FromValue(json::parse(R"({"variables": [1, 2]})")); }));
    assert(ThrowsStructural([] { StateSpecParser::FromValue(json::parse(R"({"entry": {"message": 3}})")); }));
    assert(ThrowsStructural([] { StateSpecParser::FromValue(json::parse(R"({"limits": {"max_depth": 0}})")); }));
    assert(ThrowsStructural([] {
        StateSpecParser::FromValue(json::parse(R"({"choices": [{"node": "a:1", "by": "color", "value": "red"}]})"));
    }));
    assert(ThrowsStructural([] {
        StateSpecParser::FromValue(json::parse(R"({"choices": [{"node": "a:1"}]})"));
    }));

    std::cout << "[Test] Node addresses..." << std::endl;
    assert(StateSpecParser::ParseAddress(" daily:12 ") == (domain::NodeAddress{"daily", 12}));
    assert(StateSpecParser::ParseAddress("ns:daily:4") == (domain::NodeAddress{"ns:daily", 4}));
    assert(ThrowsStructural([] { StateSpecParser::ParseAddress("daily"); }));
    assert(ThrowsStructural([] { StateSpecParser::ParseAddress(":4"); }));
    assert(ThrowsStructural([] { StateSpecParser::ParseAddress("daily:"); }));
    assert(ThrowsStructural([] { StateSpecParser::ParseAddress("daily:4x"); }));

    std::cout << "[Test] Target lists..." << std::endl;
    auto targets = TargetListParser::Parse("# batch\n\ndaily:1\n  daily:3\r\n   \n# done\ngoals:10\n");
    assert(targets.size() == 3);
    assert(targets[1] == (domain::NodeAddress{"daily", 3}));
    assert(targets[2] == (domain::NodeAddress{"goals", 10}));
    assert(TargetListParser::Parse("").empty());

    bool threw = false;
    try {
        TargetListParser::Parse("daily:1\nbroken line\n");
    } catch (const domain::StructuralError& e) {
        threw = true;
        assert(std::string(e.what()).find("line 2") != std::string::npos);
    }
    assert(threw);

    std::filesystem::path listFile = "test_targets.txt";
    std::ofstream(listFile) << "daily:5\n";
    assert(TargetListParser::ParseFile(listFile.string()).size() == 1);
    std::filesystem::remove(listFile);
    assert(ThrowsStructural([] { TargetListParser::ParseFile("does_not_exist_targets.txt"); }));

    std::cout << "[PASS] StateSpecParser and TargetListParser behave as expected." << std::endl;
    return 0;
}
