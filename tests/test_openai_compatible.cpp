#include <catch2/catch_test_macros.hpp>
#include "providers/openai_compatible.hpp"
#include "errors.hpp"
#include "mock_http_client.hpp"
#include <nlohmann/json.hpp>

using namespace junkrat;
using json = nlohmann::json;

namespace {

ProviderConfig config_for(const std::string& id, std::optional<std::string> key = "sk-test") {
    ProviderConfig cfg = default_provider_config(id);
    cfg.api_key = std::move(key);
    cfg.max_retries = 0;
    cfg.backoff.initial_delay = std::chrono::milliseconds(1);
    cfg.backoff.jitter = false;
    return cfg;
}

ChatRequest user_request(const std::string& text) {
    ChatRequest req;
    req.messages = {{Role::User, text}};
    return req;
}

std::string header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

const char* kCompletion = R"({"id":"chatcmpl-123","model":"gemini-2.0-flash-exp",
    "choices":[{"index":0,"message":{"role":"assistant","content":"Hello!"},"finish_reason":"stop"}],
    "usage":{"prompt_tokens":9,"completion_tokens":3,"total_tokens":12}})";

} // namespace

// ── chat ────────────────────────────────────────────────────────

TEST_CASE("OpenAI-compatible: chat request shape", "[openai_compatible]") {
    MockHttpClient http;
    http.next_response = {200, kCompletion, ""};
    OpenAICompatibleProvider provider(config_for("gemini"), http, true);

    ChatRequest req = user_request("hello");
    req.temperature = 0.5;
    req.max_tokens = 256;
    provider.chat(req);

    REQUIRE(http.last_url ==
            "https://generativelanguage.googleapis.com/v1beta/openai/chat/completions");
    REQUIRE(header(http.last_headers, "Authorization") == "Bearer sk-test");
    REQUIRE(header(http.last_headers, "Content-Type") == "application/json");
    REQUIRE(header(http.last_headers, "X-Title").empty());

    auto body = json::parse(http.last_body);
    REQUIRE(body["model"] == "gemini-2.0-flash-exp");
    REQUIRE(body["stream"] == false);
    REQUIRE(body["messages"][0]["role"] == "user");
    REQUIRE(body["temperature"] == 0.5);
    REQUIRE(body["max_tokens"] == 256);
}

TEST_CASE("OpenAI-compatible: optional fields omitted", "[openai_compatible]") {
    MockHttpClient http;
    http.next_response = {200, kCompletion, ""};
    OpenAICompatibleProvider provider(config_for("gemini"), http, true);

    provider.chat(user_request("hello"));
    auto body = json::parse(http.last_body);
    REQUIRE_FALSE(body.contains("temperature"));
    REQUIRE_FALSE(body.contains("max_tokens"));
}

TEST_CASE("OpenAI-compatible: OpenRouter attribution headers", "[openai_compatible]") {
    MockHttpClient http;
    http.next_response = {200, kCompletion, ""};
    OpenAICompatibleProvider provider(config_for("openrouter"), http, true);

    provider.chat(user_request("hello"));
    REQUIRE(http.last_url == "https://openrouter.ai/api/v1/chat/completions");
    REQUIRE_FALSE(header(http.last_headers, "HTTP-Referer").empty());
    REQUIRE(header(http.last_headers, "X-Title") == "Junkrat");
}

TEST_CASE("OpenAI-compatible: response parsing", "[openai_compatible]") {
    MockHttpClient http;
    http.next_response = {200, kCompletion, ""};
    OpenAICompatibleProvider provider(config_for("gemini"), http, true);

    auto resp = provider.chat(user_request("hello"));
    REQUIRE(resp.id == "chatcmpl-123");
    REQUIRE(resp.content == "Hello!");
    REQUIRE(resp.model == "gemini-2.0-flash-exp");
    REQUIRE(resp.finish_reason == FinishReason::Stop);
    REQUIRE(resp.usage.prompt_tokens == 9u);
    REQUIRE(resp.usage.completion_tokens == 3u);
    REQUIRE(resp.usage.total_tokens == 12u);
}

TEST_CASE("OpenAI-compatible: missing id and usage", "[openai_compatible]") {
    MockHttpClient http;
    http.next_response = {200,
        R"({"choices":[{"message":{"content":"x"},"finish_reason":"length"}]})", ""};
    OpenAICompatibleProvider provider(config_for("custom", std::nullopt), http, false);

    auto resp = provider.chat(user_request("hello"));
    REQUIRE(resp.id.rfind("custom-", 0) == 0);
    REQUIRE(resp.model == "gpt-3.5-turbo");
    REQUIRE(resp.finish_reason == FinishReason::Length);
    REQUIRE_FALSE(resp.usage.total_tokens.has_value());
}

TEST_CASE("OpenAI-compatible: missing API key fails before any call", "[openai_compatible]") {
    MockHttpClient http;
    OpenAICompatibleProvider provider(config_for("gemini", std::nullopt), http, true);

    try {
        provider.chat(user_request("hello"));
        FAIL("expected an error");
    } catch (const ProviderError& e) {
        REQUIRE(e.kind() == ErrorKind::InvalidRequest);
        REQUIRE(std::string(e.what()) == "Google Gemini API key is required");
    }
    REQUIRE_THROWS_AS(provider.stream_chat(user_request("hello")), ProviderError);
    REQUIRE_FALSE(provider.is_available());
    REQUIRE(provider.list_models().empty());
    REQUIRE(http.call_count == 0);
}

TEST_CASE("OpenAI-compatible: empty API key counts as missing", "[openai_compatible]") {
    MockHttpClient http;
    OpenAICompatibleProvider provider(config_for("openrouter", std::string()), http, true);
    REQUIRE_THROWS_AS(provider.chat(user_request("hello")), ProviderError);
    REQUIRE(http.call_count == 0);
}

TEST_CASE("OpenAI-compatible: custom endpoint works without a key", "[openai_compatible]") {
    MockHttpClient http;
    http.next_response = {200, kCompletion, ""};
    OpenAICompatibleProvider provider(config_for("custom", std::nullopt), http, false);

    provider.chat(user_request("hello"));
    REQUIRE(header(http.last_headers, "Authorization").empty());
    REQUIRE(http.last_url == "http://localhost:8080/v1/chat/completions");
}

TEST_CASE("OpenAI-compatible: 429 is retried as a rate limit", "[openai_compatible]") {
    MockHttpClient http;
    http.next_response = {429, R"({"error":{"message":"Quota exceeded"}})", ""};
    auto cfg = config_for("gemini");
    cfg.max_retries = 2;
    OpenAICompatibleProvider provider(cfg, http, true);

    try {
        provider.chat(user_request("hello"));
        FAIL("expected an error");
    } catch (const ProviderError& e) {
        REQUIRE(e.kind() == ErrorKind::RateLimit);
        REQUIRE(std::string(e.what()) == "HTTP 429 - Quota exceeded");
    }
    REQUIRE(http.post_count == 3);
}

TEST_CASE("OpenAI-compatible: 401 is not retried", "[openai_compatible]") {
    MockHttpClient http;
    http.next_response = {401, R"({"error":{"message":"Invalid API key"}})", ""};
    auto cfg = config_for("openrouter");
    cfg.max_retries = 3;
    OpenAICompatibleProvider provider(cfg, http, true);

    REQUIRE_THROWS_AS(provider.chat(user_request("hello")), ProviderError);
    REQUIRE(http.post_count == 1);
}

// ── stream_chat ─────────────────────────────────────────────────

TEST_CASE("OpenAI-compatible: SSE stream", "[openai_compatible]") {
    MockHttpClient http;
    StreamScript script;
    script.reads = {
        ": keep-alive\n\n",
        "data: {\"model\":\"openai/gpt-4o\",\"choices\":[{\"delta\":{\"role\":\"assistant\",\"content\":\"Hel\"}}]}\n\n",
        "data:{\"choices\":[{\"delta\":{\"content\":\"lo\"}}]}\n\n"
        "data: {\"choices\":[{\"delta\":{},\"finish_reason\":\"length\"}]}\n\n"
        "data: [DONE]\n\n"
    };
    http.stream_queue = {script};
    OpenAICompatibleProvider provider(config_for("openrouter"), http, true);

    auto stream = provider.stream_chat(user_request("hello"));
    REQUIRE(http.stream_count == 0);

    std::vector<StreamChunk> chunks;
    while (auto chunk = stream->next()) chunks.push_back(*chunk);

    REQUIRE(chunks.size() == 3);
    REQUIRE(chunks[0].delta == "Hel");
    REQUIRE(chunks[0].model == std::string("openai/gpt-4o"));
    REQUIRE(chunks[1].delta == "lo");
    REQUIRE(chunks[2].done);
    REQUIRE(chunks[2].finish_reason == FinishReason::Length);
    REQUIRE(json::parse(http.requests.back().body)["stream"] == true);
    REQUIRE(*http.last_stream_closed);
}

TEST_CASE("OpenAI-compatible: streamed deltas concatenate to the non-streaming content",
          "[openai_compatible]") {
    const std::vector<std::string> pieces = {"Step one", ": draft ", "the \"plan\"\n", "and review"};
    std::string full;
    for (const auto& p : pieces) full += p;

    MockHttpClient http;
    json completion = {{"id", "chatcmpl-9"},
                       {"model", "gemini-2.0-flash-exp"},
                       {"choices", json::array({{{"index", 0},
                                                 {"message", {{"role", "assistant"}, {"content", full}}},
                                                 {"finish_reason", "stop"}}})}};
    http.next_response = HttpResponse{200, completion.dump(), ""};

    StreamScript script;
    for (const auto& piece : pieces) {
        json event = {{"choices", json::array({{{"delta", {{"content", piece}}}}})}};
        script.reads.push_back("data: " + event.dump() + "\n\n");
    }
    script.reads.push_back("data: [DONE]\n\n");
    http.stream_queue = {script};
    OpenAICompatibleProvider provider(config_for("gemini"), http, true);

    auto request = user_request("plan it");
    auto response = provider.chat(request);

    std::string streamed;
    auto stream = provider.stream_chat(request);
    while (auto chunk = stream->next()) streamed += chunk->delta;

    REQUIRE(response.content == full);
    REQUIRE(streamed == response.content);
}

TEST_CASE("OpenAI-compatible: [DONE] alone ends the stream", "[openai_compatible]") {
    MockHttpClient http;
    StreamScript script;
    script.reads = {"data: {\"choices\":[{\"delta\":{\"content\":\"a\"}}]}\n\ndata: [DONE]\n\n"};
    http.stream_queue = {script};
    OpenAICompatibleProvider provider(config_for("gemini"), http, true);

    auto stream = provider.stream_chat(user_request("hello"));
    REQUIRE(stream->next()->delta == "a");
    auto last = stream->next();
    REQUIRE(last->done);
    REQUIRE(last->finish_reason == FinishReason::Stop);
    REQUIRE_FALSE(stream->next().has_value());
}

TEST_CASE("OpenAI-compatible: stream HTTP error", "[openai_compatible]") {
    MockHttpClient http;
    StreamScript script;
    script.status = 400;
    script.reads = {R"({"error":{"message":"Invalid model"}})"};
    http.stream_queue = {script};
    OpenAICompatibleProvider provider(config_for("gemini"), http, true);

    auto stream = provider.stream_chat(user_request("hello"));
    try {
        stream->next();
        FAIL("expected an error");
    } catch (const ProviderError& e) {
        REQUIRE(e.kind() == ErrorKind::ModelNotFound);
        REQUIRE(e.status_code() == 400L);
    }
}

TEST_CASE("decode_sse_line: field handling", "[openai_compatible]") {
    StreamRecord r1;
    REQUIRE(decode_sse_line("event: message", r1, "p") == LineStatus::Ignore);
    REQUIRE(decode_sse_line(": comment", r1, "p") == LineStatus::Ignore);
    REQUIRE(decode_sse_line("data: ", r1, "p") == LineStatus::Ignore);
    REQUIRE(decode_sse_line("data: {oops", r1, "p") == LineStatus::Malformed);

    StreamRecord done;
    REQUIRE(decode_sse_line("data: [DONE]", done, "p") == LineStatus::Record);
    REQUIRE(done.done);

    StreamRecord err;
    REQUIRE_THROWS_AS(decode_sse_line(R"(data: {"error":{"message":"overloaded"}})", err, "p"),
                      ProviderError);
}

TEST_CASE("map_openai_finish_reason", "[openai_compatible]") {
    REQUIRE(map_openai_finish_reason("stop") == FinishReason::Stop);
    REQUIRE(map_openai_finish_reason("length") == FinishReason::Length);
    REQUIRE(map_openai_finish_reason("content_filter") == FinishReason::Error);
    REQUIRE(map_openai_finish_reason("tool_calls") == FinishReason::Stop);
}

// ── probes & listings ───────────────────────────────────────────

TEST_CASE("OpenAI-compatible: is_available and list_models use /models", "[openai_compatible]") {
    MockHttpClient http;
    OpenAICompatibleProvider provider(config_for("openrouter"), http, true);

    REQUIRE_FALSE(provider.is_available());
    http.next_get_response = {200, R"({"data":[{"id":"openai/gpt-4o"},{"id":"anthropic/claude-3"}]})", ""};
    REQUIRE(provider.is_available());
    REQUIRE(provider.list_models() ==
            std::vector<std::string>{"openai/gpt-4o", "anthropic/claude-3"});
    REQUIRE(http.count_url("/models") == 3);
    REQUIRE(header(http.last_headers, "Authorization") == "Bearer sk-test");
    REQUIRE(provider.list_models_with_details().empty());
}

TEST_CASE("OpenAI-compatible: list_models degrades to empty", "[openai_compatible]") {
    MockHttpClient http;
    OpenAICompatibleProvider provider(config_for("gemini"), http, true);

    REQUIRE(provider.list_models().empty());
    http.next_get_response = {200, R"({"object":"list"})", ""};
    REQUIRE(provider.list_models().empty());
}
