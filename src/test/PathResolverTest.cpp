#include <iostream>
#include <cassert>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/PathResolver.hpp"
#include "application/SequenceIndex.hpp"
#include "application/StateSpecParser.hpp"
#include "domain/Errors.hpp"
#include "test/InMemorySequenceSource.hpp"

using namespace variantwalker;
using domain::NodeAddress;
using json = nlohmann::json;

namespace {

std::vector<int> MessageIds(const domain::ResolvedPath& path) {
    std::vector<int> ids;
    for (const auto& node : path.nodes) ids.push_back(node.messageId);
    return ids;
}

// Choice 10k+1 offers two branches (10k+2, 10k+3) that rejoin at choice 10k+11.
json DiamondChain(int diamonds) {
    json messages = json::array();
    for (int k = 0; k < diamonds; ++k) {
        int base = 10 * k;
        messages.push_back({{"id", base + 1}, {"type", "choice"}, {"choices", {
            {{"text", "A"}, {"nextMessageId", base + 2}},
            {{"text", "B"}, {"nextMessageId", base + 3}}
        }}});
        messages.push_back({{"id", base + 2}, {"type", "bot"}, {"text", "a"}, {"nextMessageId", base + 11}});
        messages.push_back({{"id", base + 3}, {"type", "bot"}, {"text", "b"}, {"nextMessageId", base + 11}});
    }
    messages.push_back({{"id", 10 * diamonds + 1}, {"type", "bot"}, {"contentKey", "bot.diamond.end"}});
    return {{"sequenceId", "diamond"}, {"messages", messages}};
}

std::shared_ptr<test::InMemorySequenceSource> BuildGraph() {
    auto source = std::make_shared<test::InMemorySequenceSource>();

    source->add(json::parse(R"({
        "sequenceId": "chain",
        "messages": [
            {"id": 1, "type": "bot", "text": "one"},
            {"id": 2, "type": "bot", "text": "two"},
            {"id": 3, "type": "bot", "text": "three"},
            {"id": 4, "type": "bot", "text": "four"},
            {"id": 5, "type": "bot", "text": "five", "contentKey": "bot.chain.end"}
        ]
    })"));

    source->add(json::parse(R"({
        "sequenceId": "pick",
        "messages": [
            {"id": 1, "type": "choice", "choices": [
                {"text": "Long way", "nextMessageId": 10, "contentKey": "user.pick.long"},
                {"text": "Short way", "nextMessageId": 20, "contentKey": "user.pick.short"},
                {"text": "Other way", "nextMessageId": 30}
            ]},
            {"id": 10, "type": "bot", "text": "a"},
            {"id": 11, "type": "bot", "text": "b"},
            {"id": 12, "type": "bot", "text": "c", "nextMessageId": 20},
            {"id": 20, "type": "bot", "contentKey": "bot.pick.target"},
            {"id": 30, "type": "bot", "text": "x"},
            {"id": 31, "type": "bot", "text": "y"},
            {"id": 32, "type": "bot", "text": "z", "nextMessageId": 20}
        ]
    })"));

    source->add(json::parse(R"({
        "sequenceId": "route",
        "messages": [
            {"id": 1, "type": "autoroute", "routes": [
                {"condition": "user.streak >= 3", "nextMessageId": 2},
                {"default": true, "nextMessageId": 3}
            ]},
            {"id": 2, "type": "bot", "text": "On a streak", "nextMessageId": 4},
            {"id": 3, "type": "bot", "text": "Welcome back", "nextMessageId": 4},
            {"id": 4, "type": "bot", "contentKey": "bot.route.target"}
        ]
    })"));

    source->add(json::parse(R"({
        "sequenceId": "main",
        "messages": [
            {"id": 1, "type": "bot", "text": "Hi"},
            {"id": 2, "type": "bot", "sequenceId": "side"}
        ]
    })"));

    source->add(json::parse(R"({
        "sequenceId": "side",
        "messages": [
            {"id": 5, "type": "bot", "text": "Side start"},
            {"id": 6, "type": "bot", "contentKey": "bot.side.target"}
        ]
    })"));

    source->add(json::parse(R"({
        "sequenceId": "loop",
        "messages": [
            {"id": 1, "type": "bot", "text": "ping"},
            {"id": 2, "type": "bot", "text": "pong", "nextMessageId": 1},
            {"id": 9, "type": "bot", "contentKey": "bot.loop.island"}
        ]
    })"));

    source->add(json::parse(R"({
        "sequenceId": "fork",
        "messages": [
            {"id": 1, "type": "choice", "choices": [
                {"text": "Left", "nextMessageId": 2},
                {"text": "Right", "nextMessageId": 3}
            ]},
            {"id": 2, "type": "bot", "text": "left side", "nextMessageId": 4},
            {"id": 3, "type": "bot", "text": "right side", "nextMessageId": 4},
            {"id": 4, "type": "choice", "choices": [
                {"text": "Sure", "nextMessageId": 9},
                {"text": "Okay", "nextMessageId": 9}
            ]},
            {"id": 9, "type": "bot", "contentKey": "bot.fork.target"}
        ]
    })"));

    source->add(DiamondChain(13));
    return source;
}

} // namespace

int main() {
    auto source = BuildGraph();
    application::SequenceIndex index(source);
    application::PathResolver resolver(index);

    std::cout << "[Test] Linear chain of five nodes..." << std::endl;
    auto state = application::StateSpecParser::DefaultFor("chain");
    auto chain = resolver.resolve(state, NodeAddress{"chain", 5});
    assert(chain.reachedTarget);
    assert((MessageIds(chain) == std::vector<int>{1, 2, 3, 4, 5}));

    std::cout << "[Test] Explicit entry message..." << std::endl;
    state.entry.messageId = 3;
    auto partial = resolver.resolve(state, NodeAddress{"chain", 5});
    assert((MessageIds(partial) == std::vector<int>{3, 4, 5}));

    std::cout << "[Test] Depth limit leads to fallback..." << std::endl;
    state = application::StateSpecParser::DefaultFor("chain");
    state.limits.maxDepth = 3;
    auto limited = resolver.resolve(state, NodeAddress{"chain", 5});
    assert(!limited.reachedTarget);
    assert((MessageIds(limited) == std::vector<int>{5}));

    std::cout << "[Test] Choice: shortest option wins..." << std::endl;
    state = application::StateSpecParser::DefaultFor("pick");
    auto picked = resolver.resolve(state, NodeAddress{"pick", 20});
    assert(picked.reachedTarget);
    assert((MessageIds(picked) == std::vector<int>{1, 20}));
    assert(picked.nodes[0].kind == domain::NodeKind::Choice);
    assert(picked.nodes[1].selection);
    assert(picked.nodes[1].selection->index == 1);
    assert(picked.nodes[1].selection->text == "Short way");
    assert(*picked.nodes[1].selection->contentKey == "user.pick.short");

    std::cout << "[Test] Choice directive pins the option..." << std::endl;
    state.directives.push_back({NodeAddress{"pick", 1}, domain::SelectionMethod::ByIndex, "0"});
    auto pinned = resolver.resolve(state, NodeAddress{"pick", 20});
    assert((MessageIds(pinned) == std::vector<int>{1, 10, 11, 12, 20}));
    assert(pinned.nodes[1].selection && pinned.nodes[1].selection->index == 0);

    state.directives = {{NodeAddress{"pick", 1}, domain::SelectionMethod::ByText, "Other way"}};
    assert((MessageIds(resolver.resolve(state, NodeAddress{"pick", 20})) == std::vector<int>{1, 30, 31, 32, 20}));

    state.directives = {{NodeAddress{"pick", 1}, domain::SelectionMethod::ByContentKey, "user.pick.long"}};
    assert((MessageIds(resolver.resolve(state, NodeAddress{"pick", 20})) == std::vector<int>{1, 10, 11, 12, 20}));

    std::cout << "[Test] Out-of-range directive explores all options..." << std::endl;
    state.directives = {{NodeAddress{"pick", 1}, domain::SelectionMethod::ByIndex, "7"}};
    auto unmatched = resolver.resolve(state, NodeAddress{"pick", 20});
    assert(unmatched.reachedTarget);
    assert((MessageIds(unmatched) == std::vector<int>{1, 20}));

    std::cout << "[Test] Conditional routes follow the variables..." << std::endl;
    state = application::StateSpecParser::DefaultFor("route");
    state.variables = {{"user", {{"streak", 5}}}};
    assert((MessageIds(resolver.resolve(state, NodeAddress{"route", 4})) == std::vector<int>{1, 2, 4}));
    state.variables = {{"user.streak", 1}};
    assert((MessageIds(resolver.resolve(state, NodeAddress{"route", 4})) == std::vector<int>{1, 3, 4}));
    state.variables = json::object();
    assert((MessageIds(resolver.resolve(state, NodeAddress{"route", 4})) == std::vector<int>{1, 3, 4}));
    state.variables = {{"user.streak", 5}};
    state.branchMode = domain::BranchMode::AlwaysDefault;
    assert((MessageIds(resolver.resolve(state, NodeAddress{"route", 4})) == std::vector<int>{1, 3, 4}));

    std::cout << "[Test] Cross-sequence jump..." << std::endl;
    state = application::StateSpecParser::DefaultFor("main");
    auto jumped = resolver.resolve(state, NodeAddress{"side", 6});
    assert(jumped.reachedTarget);
    assert(jumped.nodes.size() == 4);
    assert(jumped.nodes[1].kind == domain::NodeKind::CrossJump);
    assert(jumped.nodes[2].sequenceId == "side" && jumped.nodes[2].messageId == 5);
    assert(jumped.nodes[3].address() == (NodeAddress{"side", 6}));

    std::cout << "[Test] Cycles terminate with a fallback..." << std::endl;
    state = application::StateSpecParser::DefaultFor("loop");
    auto island = resolver.resolve(state, NodeAddress{"loop", 9});
    assert(!island.reachedTarget);
    assert(island.nodes.size() == 1 && island.nodes[0].messageId == 9);

    std::cout << "[Test] Reconverging branches stay within the expansion budget..." << std::endl;
    state = application::StateSpecParser::DefaultFor("diamond");
    auto diamond = resolver.resolve(state, NodeAddress{"diamond", 131});
    assert(diamond.reachedTarget);
    assert(diamond.nodes.size() == 27);
    assert(diamond.nodes[1].messageId == 2 && diamond.nodes[2].messageId == 11);
    assert(diamond.nodes[25].messageId == 122);
    state.limits.maxPaths = 60;
    auto budgeted = resolver.resolve(state, NodeAddress{"diamond", 131});
    assert(budgeted.reachedTarget && budgeted.nodes.size() == 27);

    std::cout << "[Test] Equal-length alternatives keep the first listed option..." << std::endl;
    state = application::StateSpecParser::DefaultFor("fork");
    auto fork = resolver.resolve(state, NodeAddress{"fork", 9});
    assert(fork.reachedTarget);
    assert((MessageIds(fork) == std::vector<int>{1, 2, 4, 9}));
    assert(fork.nodes[1].selection && fork.nodes[1].selection->text == "Left");
    assert(fork.nodes[3].selection && fork.nodes[3].selection->index == 0);

    std::cout << "[Test] Direct hits end the search at the choice..." << std::endl;
    state.entry.messageId = 4;
    auto direct = resolver.resolve(state, NodeAddress{"fork", 9});
    assert((MessageIds(direct) == std::vector<int>{4, 9}));
    assert(direct.nodes[1].selection->text == "Sure");
    state.directives = {{NodeAddress{"fork", 1}, domain::SelectionMethod::ByText, "Right"}};
    state.entry.messageId.reset();
    assert((MessageIds(resolver.resolve(state, NodeAddress{"fork", 9})) == std::vector<int>{1, 3, 4, 9}));
    auto blocked = resolver.resolve(state, NodeAddress{"fork", 2});
    assert(!blocked.reachedTarget && blocked.nodes.size() == 1);

    std::cout << "[Test] Unknown entry sequence falls back..." << std::endl;
    state = application::StateSpecParser::DefaultFor("nowhere");
    auto missing = resolver.resolve(state, NodeAddress{"chain", 5});
    assert(!missing.reachedTarget);
    assert(missing.nodes[0].sequenceId == "chain" && missing.nodes[0].messageId == 5);

    std::cout << "[Test] Sequences are loaded once..." << std::endl;
    assert(source->loadCalls["chain"] == 1);
    assert(source->loadCalls["pick"] == 1);
    assert(source->loadCalls["nowhere"] == 1);
    index.table("nowhere");
    assert(source->loadCalls["nowhere"] == 1);
    assert(index.entryNode("side") == 5);

    std::cout << "[Test] Malformed sequence documents..." << std::endl;
    bool threw = false;
    try {
        infrastructure::SequenceRepositoryFs::ParseDocument(
            json::parse(R"({"sequenceId": "dup", "messages": [{"id": 1}, {"id": 1}]})"), "dup");
    } catch (const domain::StructuralError&) {
        threw = true;
    }
    assert(threw);

    auto kinds = infrastructure::SequenceRepositoryFs::ParseDocument(json::parse(R"({
        "messages": [
            {"id": 1, "type": "dataAction"},
            {"id": 2, "type": "user", "text": "ok"},
            {"id": 3, "type": "textInput", "sequenceId": "kinds"}
        ]
    })"), "kinds");
    assert(kinds.sequenceId == "kinds");
    assert(kinds.nodes[0].kind == domain::NodeKind::Action);
    assert(kinds.nodes[1].kind == domain::NodeKind::Message && kinds.nodes[1].sender == "user");
    assert(kinds.nodes[2].kind == domain::NodeKind::Message);

    std::cout << "[PASS] PathResolver behaves as expected." << std::endl;
    return 0;
}
