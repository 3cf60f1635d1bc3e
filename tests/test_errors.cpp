#include <catch2/catch_test_macros.hpp>
#include "errors.hpp"
#include "provider_registry.hpp"
#include "fake_provider.hpp"

using namespace junkrat;

// ── HTTP classification ─────────────────────────────────────────

TEST_CASE("classify_http_error: 429 is a retryable rate limit", "[errors]") {
    auto e = classify_http_error("openrouter", 429, R"({"error":{"message":"Too many requests"}})");
    REQUIRE(e.kind() == ErrorKind::RateLimit);
    REQUIRE(e.retryable());
    REQUIRE(e.status_code() == 429L);
    REQUIRE(e.provider_id() == "openrouter");
    REQUIRE(std::string(e.what()) == "HTTP 429 - Too many requests");
}

TEST_CASE("classify_http_error: 408 is a timeout", "[errors]") {
    auto e = classify_http_error("ollama", 408, "");
    REQUIRE(e.kind() == ErrorKind::Timeout);
    REQUIRE(e.retryable());
    REQUIRE(std::string(e.what()) == "HTTP 408");
}

TEST_CASE("classify_http_error: 404 naming a model is ModelNotFound", "[errors]") {
    auto e = classify_http_error("ollama", 404, R"({"error":"model 'llama9' not found"})");
    REQUIRE(e.kind() == ErrorKind::ModelNotFound);
    REQUIRE_FALSE(e.retryable());
    REQUIRE(std::string(e.what()).find("llama9") != std::string::npos);
}

TEST_CASE("classify_http_error: other 4xx are invalid requests", "[errors]") {
    auto e = classify_http_error("gemini", 400, R"({"error":{"message":"bad temperature"}})");
    REQUIRE(e.kind() == ErrorKind::InvalidRequest);
    REQUIRE_FALSE(e.retryable());

    auto auth = classify_http_error("gemini", 401, "Unauthorized");
    REQUIRE(auth.kind() == ErrorKind::InvalidRequest);
    REQUIRE(std::string(auth.what()) == "HTTP 401 - Unauthorized");
}

TEST_CASE("classify_http_error: 5xx is a retryable API error", "[errors]") {
    auto e = classify_http_error("ollama", 503, "upstream down");
    REQUIRE(e.kind() == ErrorKind::ApiError);
    REQUIRE(e.retryable());
}

TEST_CASE("classify_http_error: long plain bodies are truncated", "[errors]") {
    auto e = classify_http_error("custom", 500, std::string(500, 'x'));
    REQUIRE(std::string(e.what()).size() < 300);
}

// ── Transport classification ────────────────────────────────────

TEST_CASE("classify_transport_error: no token means network error", "[errors]") {
    auto e = classify_transport_error("ollama", "connection refused", CancellationToken());
    REQUIRE(e.kind() == ErrorKind::NetworkError);
    REQUIRE(e.retryable());
    REQUIRE(std::string(e.what()) == "Network error: connection refused");
}

TEST_CASE("classify_transport_error: cancelled token wins", "[errors]") {
    CancellationSource source;
    source.cancel();
    auto e = classify_transport_error("ollama", "aborted", source.token());
    REQUIRE(e.kind() == ErrorKind::Cancelled);
    REQUIRE_FALSE(e.retryable());
    REQUIRE(e.cause() == std::string("aborted"));
}

TEST_CASE("classify_transport_error: expired deadline is a timeout", "[errors]") {
    auto source = CancellationSource::linked(CancellationToken(), std::chrono::milliseconds(0));
    auto e = classify_transport_error("gemini", "aborted", source.token());
    REQUIRE(e.kind() == ErrorKind::Timeout);
    REQUIRE(e.retryable());
}

// ── Generic classification ──────────────────────────────────────

TEST_CASE("classify_error: ProviderError passes through", "[errors]") {
    ProviderError original(ErrorKind::RateLimit, "HTTP 429", "gemini", 429);
    auto e = classify_error(original, "ollama", "ignored");
    REQUIRE(e.kind() == ErrorKind::RateLimit);
    REQUIRE(e.provider_id() == "gemini");
    REQUIRE(std::string(e.what()) == "HTTP 429");
}

TEST_CASE("classify_error: ProviderError without provider gains one", "[errors]") {
    ProviderError original(ErrorKind::ApiError, "bad", "");
    auto e = classify_error(original, "ollama");
    REQUIRE(e.provider_id() == "ollama");
    REQUIRE(e.kind() == ErrorKind::ApiError);
}

TEST_CASE("classify_error: plain exceptions are sorted by text", "[errors]") {
    auto timeout = classify_error(std::runtime_error("operation timed out"), "ollama", "Ollama chat request failed");
    REQUIRE(timeout.kind() == ErrorKind::Timeout);
    REQUIRE(std::string(timeout.what()) == "Ollama chat request failed: operation timed out");
    REQUIRE(timeout.cause() == std::string("operation timed out"));

    auto network = classify_error(std::runtime_error("Failed to connect"), "ollama");
    REQUIRE(network.kind() == ErrorKind::NetworkError);

    auto other = classify_error(std::runtime_error("something odd"), "ollama");
    REQUIRE(other.kind() == ErrorKind::ApiError);
    REQUIRE(std::string(other.what()) == "something odd");
}

TEST_CASE("is_retryable: only retryable ProviderErrors", "[errors]") {
    REQUIRE(is_retryable(ProviderError(ErrorKind::NetworkError, "x", "p")));
    REQUIRE_FALSE(is_retryable(ProviderError(ErrorKind::InvalidRequest, "x", "p")));
    REQUIRE_FALSE(is_retryable(std::runtime_error("x")));
}

TEST_CASE("error_kind_to_string: wire names", "[errors]") {
    REQUIRE(std::string(error_kind_to_string(ErrorKind::NetworkError)) == "NETWORK_ERROR");
    REQUIRE(std::string(error_kind_to_string(ErrorKind::ModelNotFound)) == "MODEL_NOT_FOUND");
    REQUIRE(std::string(error_kind_to_string(ErrorKind::Cancelled)) == "CANCELLED");
}

// ── Suggested actions ───────────────────────────────────────────

static void fill_registry(ProviderRegistry& registry) {
    registry.register_provider(std::make_unique<FakeProvider>("ollama", "Ollama"));
    registry.register_provider(std::make_unique<FakeProvider>("gemini", "Google Gemini"));
}

TEST_CASE("suggest_actions: retry then switch for a retryable error", "[errors]") {
    ProviderRegistry registry;
    fill_registry(registry);

    ProviderError error(ErrorKind::NetworkError, "down", "ollama");
    auto actions = suggest_actions(&error, registry);

    REQUIRE(actions.size() == 2);
    REQUIRE(actions[0].kind == ActionKind::Retry);
    REQUIRE(actions[1].kind == ActionKind::SwitchProvider);
    REQUIRE(actions[1].provider_id == "gemini");
    REQUIRE(actions[1].label == "Switch to Google Gemini");
}

TEST_CASE("suggest_actions: missing model suggests a refresh", "[errors]") {
    ProviderRegistry registry;
    fill_registry(registry);

    ProviderError error(ErrorKind::ModelNotFound, "HTTP 404 - model not found", "ollama", 404);
    auto actions = suggest_actions(&error, registry);

    REQUIRE(actions.size() == 2);
    REQUIRE(actions[0].kind == ActionKind::RefreshModels);
    REQUIRE(actions[0].provider_id == "ollama");
    REQUIRE(actions[1].kind == ActionKind::SwitchProvider);
}

TEST_CASE("suggest_actions: model wording on a server error suggests a refresh", "[errors]") {
    ProviderRegistry registry;
    fill_registry(registry);

    auto error = classify_http_error("ollama", 500,
                                     R"({"error":"model 'llama9' not found, try pulling it first"})");
    REQUIRE(error.kind() == ErrorKind::ApiError);

    auto actions = suggest_actions(&error, registry);
    REQUIRE(actions.size() == 3);
    REQUIRE(actions[0].kind == ActionKind::Retry);
    REQUIRE(actions[1].kind == ActionKind::RefreshModels);
    REQUIRE(actions[2].kind == ActionKind::SwitchProvider);
}

TEST_CASE("suggest_actions: no fallback with a single provider", "[errors]") {
    ProviderRegistry registry;
    registry.register_provider(std::make_unique<FakeProvider>("ollama"));

    ProviderError error(ErrorKind::InvalidRequest, "bad", "ollama");
    REQUIRE(suggest_actions(&error, registry).empty());
}

TEST_CASE("suggest_actions: cancellation suggests nothing", "[errors]") {
    ProviderRegistry registry;
    fill_registry(registry);

    ProviderError error(ErrorKind::Cancelled, "Operation cancelled", "ollama");
    REQUIRE(suggest_actions(&error, registry).empty());
}

TEST_CASE("suggest_actions: unclassified failure suggests settings", "[errors]") {
    ProviderRegistry registry;
    auto actions = suggest_actions(nullptr, registry);
    REQUIRE(actions.size() == 1);
    REQUIRE(actions[0].kind == ActionKind::OpenSettings);
}

// ── report_error ────────────────────────────────────────────────

TEST_CASE("report_error: model-not-found triggers a refresh", "[errors]") {
    ProviderRegistry registry;
    fill_registry(registry);

    std::string refreshed;
    auto report = report_error(
        ProviderError(ErrorKind::ModelNotFound, "HTTP 404 - model missing", "ollama", 404),
        "ollama", registry,
        [&](const std::string& id) { refreshed = id; });

    REQUIRE(refreshed == "ollama");
    REQUIRE(report.kind == ErrorKind::ModelNotFound);
    REQUIRE_FALSE(report.retryable);
    REQUIRE(report.provider_id == "ollama");
    REQUIRE(report.actions.front().kind == ActionKind::RefreshModels);
}

TEST_CASE("report_error: other kinds do not refresh", "[errors]") {
    ProviderRegistry registry;
    fill_registry(registry);

    bool refreshed = false;
    report_error(ProviderError(ErrorKind::RateLimit, "HTTP 429", "ollama", 429),
                 "ollama", registry, [&](const std::string&) { refreshed = true; });
    REQUIRE_FALSE(refreshed);
}

TEST_CASE("report_error: plain exception naming a model triggers a refresh", "[errors]") {
    ProviderRegistry registry;
    fill_registry(registry);

    std::string refreshed;
    auto report = report_error(std::runtime_error("model 'llama9' not found"), "ollama", registry,
                               [&](const std::string& id) { refreshed = id; });

    REQUIRE(refreshed == "ollama");
    bool has_refresh = false;
    for (const auto& a : report.actions) {
        if (a.kind == ActionKind::RefreshModels) has_refresh = true;
    }
    REQUIRE(has_refresh);
    REQUIRE(report.actions.back().kind == ActionKind::OpenSettings);
}

TEST_CASE("report_error: unclassified exceptions add the settings fallback", "[errors]") {
    ProviderRegistry registry;
    fill_registry(registry);

    auto report = report_error(std::runtime_error("weird failure"), "gemini", registry);
    REQUIRE(report.kind == ErrorKind::ApiError);
    REQUIRE(report.provider_id == "gemini");
    REQUIRE(report.actions.back().kind == ActionKind::OpenSettings);

    bool has_switch = false;
    for (const auto& a : report.actions) {
        if (a.kind == ActionKind::SwitchProvider) {
            has_switch = true;
            REQUIRE(a.provider_id == "ollama");
        }
    }
    REQUIRE(has_switch);
}
