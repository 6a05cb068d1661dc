#include <iostream>
#include <cassert>
#include <cstdlib>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"
#include "infrastructure/GeneratorClient.hpp"
#include "infrastructure/HttplibTransport.hpp"

using namespace variantwalker;
using infrastructure::GeneratorClient;
using infrastructure::HttpResponse;
using json = nlohmann::json;

// Replays scripted responses and records every request.
class ScriptedTransport : public infrastructure::HttpTransport {
public:
    struct Request {
        std::string url;
        json body;
        std::map<std::string, std::string> headers;
        int timeoutMs;
    };

    void push(int status, const std::string& body, const std::string& error = "") {
        m_responses.push_back(HttpResponse{status, body, error});
    }

    HttpResponse post(const std::string& url, const std::string& body,
                      const std::map<std::string, std::string>& headers, int timeoutMs) override {
        requests.push_back({url, json::parse(body), headers, timeoutMs});
        if (m_responses.empty()) return HttpResponse{0, "", "script exhausted"};
        HttpResponse next = m_responses.front();
        m_responses.pop_front();
        return next;
    }

    std::vector<Request> requests;

private:
    std::deque<HttpResponse> m_responses;
};

namespace {

infrastructure::PipelineConfig LiveConfig() {
    infrastructure::PipelineConfig config;
    config.provider.baseUrl = "https://llm.example.test/v1/generate";
    config.provider.model = "writer-1";
    config.provider.apiKeyEnv = "VARIANTWALKER_TEST_KEY";
    config.provider.mock = false;
    config.provider.timeoutMs = 1234;
    config.io.dryRun = false;
    config.rateLimit.rpm = 0;
    config.rateLimit.retryCount = 2;
    config.rateLimit.retryBackoffMs = 0;
    config.gen.numVariants = 3;
    return config;
}

domain::GenerationPrompt SamplePrompt() {
    domain::GenerationPrompt prompt;
    prompt.system = "Write variants.";
    prompt.contentKey = "bot.greet.morning";
    prompt.task = {{"contentKey", "bot.greet.morning"}};
    return prompt;
}

template <typename Fn>
bool ThrowsGenerationError(Fn fn) {
    try {
        fn();
    } catch (const domain::GenerationError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    setenv("VARIANTWALKER_TEST_KEY", "secret-token", 1);

    std::cout << "[Test] Mock mode needs no transport..." << std::endl;
    {
        auto config = LiveConfig();
        config.io.dryRun = true;
        auto transport = std::make_shared<ScriptedTransport>();
        GeneratorClient client(config, transport);
        assert(client.isMock());
        auto result = client.generate(SamplePrompt());
        assert(result.mock);
        assert(result.variants.size() == 3);
        assert(result.variants[0] == "[bot.greet.morning] Variant 1 ||| Second bubble (optional)");
        assert(transport->requests.empty());
        assert(result.requestSent["model"] == "writer-1");
        assert(result.requestSent["prompt"]["task"]["contentKey"] == "bot.greet.morning");
    }

    std::cout << "[Test] Generic payload, bearer credential and direct variants..." << std::endl;
    {
        auto transport = std::make_shared<ScriptedTransport>();
        transport->push(200, R"({"variants": ["Morning!", "Hey there"]})");
        GeneratorClient client(LiveConfig(), transport);
        auto result = client.generate(SamplePrompt());
        assert(!result.mock);
        assert((result.variants == std::vector<std::string>{"Morning!", "Hey there"}));
        assert(transport->requests.size() == 1);
        const auto& request = transport->requests[0];
        assert(request.url == "https://llm.example.test/v1/generate");
        assert(request.timeoutMs == 1234);
        assert(request.headers.at("Authorization") == "Bearer secret-token");
        assert(request.body["model"] == "writer-1");
        assert(request.body["n"] == 3);
        assert(request.body.contains("temperature") && request.body.contains("top_p"));
        assert(request.body["prompt"]["task"]["contentKey"] == "bot.greet.morning");
        assert(result.requestSent.dump().find("secret-token") == std::string::npos);
    }

    std::cout << "[Test] Rejected parameter is dropped once without using a retry..." << std::endl;
    {
        auto config = LiveConfig();
        config.rateLimit.retryCount = 0;
        auto transport = std::make_shared<ScriptedTransport>();
        transport->push(400, R"({"error": {"message": "Unsupported parameter: 'temperature' is not supported with this model."}})");
        transport->push(200, R"({"variants": ["ok"]})");
        GeneratorClient client(config, transport);
        auto result = client.generate(SamplePrompt());
        assert(result.variants.size() == 1);
        assert(transport->requests.size() == 2);
        assert(transport->requests[0].body.contains("temperature"));
        assert(!transport->requests[1].body.contains("temperature"));
        assert(transport->requests[1].body.contains("top_p"));
    }

    std::cout << "[Test] Only one parameter is dropped, later rejections use the retries..." << std::endl;
    {
        auto transport = std::make_shared<ScriptedTransport>();
        transport->push(400, "temperature is not supported");
        for (int i = 0; i < 3; ++i) transport->push(400, "top_p is not supported");
        GeneratorClient client(LiveConfig(), transport);
        json lastRequest;
        try {
            client.generate(SamplePrompt());
            assert(false);
        } catch (const domain::GenerationError& e) {
            assert(std::string(e.what()).find("after 3 attempt(s)") != std::string::npos);
            lastRequest = e.request();
        }
        assert(transport->requests.size() == 4);
        assert(transport->requests[3].body.contains("top_p"));
        assert(lastRequest["model"] == "writer-1");
        assert(!lastRequest.contains("temperature"));
        assert(lastRequest.dump().find("secret-token") == std::string::npos);
    }

    std::cout << "[Test] Transient failures are retried..." << std::endl;
    {
        auto transport = std::make_shared<ScriptedTransport>();
        transport->push(503, "overloaded");
        transport->push(0, "", "Connection failed: 2");
        transport->push(200, R"({"choices": [{"text": "first"}, {"text": "second"}]})");
        GeneratorClient client(LiveConfig(), transport);
        auto result = client.generate(SamplePrompt());
        assert((result.variants == std::vector<std::string>{"first", "second"}));
        assert(transport->requests.size() == 3);
    }
    {
        auto config = LiveConfig();
        config.rateLimit.retryCount = 1;
        auto transport = std::make_shared<ScriptedTransport>();
        transport->push(500, "boom");
        transport->push(200, "not json at all");
        transport->push(200, R"({"variants": ["never reached"]})");
        GeneratorClient client(config, transport);
        assert(ThrowsGenerationError([&] { client.generate(SamplePrompt()); }));
        assert(transport->requests.size() == 2);
    }

    std::cout << "[Test] Client errors are retried like other failures..." << std::endl;
    {
        auto transport = std::make_shared<ScriptedTransport>();
        transport->push(401, "temperature not supported");
        transport->push(404, "no such route");
        transport->push(200, R"({"variants": ["after client errors"]})");
        GeneratorClient client(LiveConfig(), transport);
        auto result = client.generate(SamplePrompt());
        assert(result.variants.size() == 1);
        assert(transport->requests.size() == 3);
        assert(transport->requests[1].body.contains("temperature"));
    }
    {
        auto transport = std::make_shared<ScriptedTransport>();
        for (int i = 0; i < 3; ++i) transport->push(400, "bad request");
        GeneratorClient client(LiveConfig(), transport);
        assert(ThrowsGenerationError([&] { client.generate(SamplePrompt()); }));
        assert(transport->requests.size() == 3);
    }

    std::cout << "[Test] Missing credential..." << std::endl;
    {
        auto config = LiveConfig();
        config.provider.apiKeyEnv = "VARIANTWALKER_TEST_MISSING_KEY";
        unsetenv("VARIANTWALKER_TEST_MISSING_KEY");
        auto transport = std::make_shared<ScriptedTransport>();
        GeneratorClient client(config, transport);
        bool threw = false;
        try {
            client.generate(SamplePrompt());
        } catch (const domain::GenerationError& e) {
            threw = true;
            assert(e.request()["model"] == "writer-1");
        }
        assert(threw);
        assert(transport->requests.empty());

        config.provider.name = "ollama";
        transport->push(200, R"({"response": "{\"variants\": [\"local\"]}"})");
        GeneratorClient local(config, transport);
        auto result = local.generate(SamplePrompt());
        assert(result.variants.size() == 1 && result.variants[0] == "local");
        const auto& body = transport->requests[0].body;
        assert(body["stream"] == false);
        assert(body["options"].contains("temperature"));
        assert(transport->requests[0].headers.empty());
    }

    std::cout << "[Test] Chat profile payload and nested content..." << std::endl;
    {
        auto config = LiveConfig();
        config.provider.name = "openai-chat";
        auto transport = std::make_shared<ScriptedTransport>();
        transport->push(200, R"({"choices": [{"message": {"content": "```json\n{\"variants\": [\"A\", \"B\"]}\n```"}}]})");
        GeneratorClient client(config, transport);
        auto result = client.generate(SamplePrompt());
        assert((result.variants == std::vector<std::string>{"A", "B"}));
        const auto& body = transport->requests[0].body;
        assert(body["messages"].size() == 2);
        assert(body["messages"][0]["role"] == "system");
        assert(body["response_format"]["type"] == "json_object");
        assert(!body.contains("n"));
    }

    std::cout << "[Test] Response shape extraction..." << std::endl;
    auto lines = GeneratorClient::ExtractVariants(json::parse(
        R"({"choices": [{"message": {"content": "First line\n\n  Second line  "}}]})"));
    assert(lines && (*lines == std::vector<std::string>{"First line", "Second line"}));
    assert(!GeneratorClient::ExtractVariants(json::parse(R"({"data": []})")));
    assert(!GeneratorClient::ExtractVariants(json::array()));

    std::cout << "[Test] Rejection detection..." << std::endl;
    json payload = {{"model", "m"}, {"n", 4}, {"options", {{"seed", 1}}}};
    assert(GeneratorClient::FindRejectedParameter(400, "parameter 'n' is not supported", payload) == std::string("n"));
    assert(GeneratorClient::FindRejectedParameter(422, "Unknown parameter: seed", payload) == std::string("seed"));
    assert(!GeneratorClient::FindRejectedParameter(400, "invalid model name", payload));
    assert(!GeneratorClient::FindRejectedParameter(400, "temperature not supported", payload));
    assert(!GeneratorClient::FindRejectedParameter(429, "n not supported", payload));
    assert(GeneratorClient::RemoveParameter(payload, "seed"));
    assert(!payload["options"].contains("seed"));
    assert(!GeneratorClient::RemoveParameter(payload, "top_p"));

    std::cout << "[Test] URL splitting for the HTTP transport..." << std::endl;
    std::string base;
    std::string path;
    assert(infrastructure::HttplibTransport::SplitUrl("http://localhost:11434/api/generate", base, path));
    assert(base == "http://localhost:11434" && path == "/api/generate");
    assert(infrastructure::HttplibTransport::SplitUrl("https://api.example.com", base, path));
    assert(base == "https://api.example.com" && path == "/");
    assert(!infrastructure::HttplibTransport::SplitUrl("api.example.com/generate", base, path));

    std::cout << "[PASS] GeneratorClient behaves as expected." << std::endl;
    return 0;
}
