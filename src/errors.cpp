#include "errors.hpp"
#include "cancellation.hpp"
#include "provider_registry.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace junkrat {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NetworkError:   return "NETWORK_ERROR";
        case ErrorKind::Timeout:        return "TIMEOUT";
        case ErrorKind::RateLimit:      return "RATE_LIMIT";
        case ErrorKind::InvalidRequest: return "INVALID_REQUEST";
        case ErrorKind::ApiError:       return "API_ERROR";
        case ErrorKind::ModelNotFound:  return "MODEL_NOT_FOUND";
        case ErrorKind::Cancelled:      return "CANCELLED";
    }
    return "API_ERROR";
}

bool default_retryable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NetworkError:
        case ErrorKind::Timeout:
        case ErrorKind::RateLimit:
        case ErrorKind::ApiError:
            return true;
        case ErrorKind::InvalidRequest:
        case ErrorKind::ModelNotFound:
        case ErrorKind::Cancelled:
            return false;
    }
    return false;
}

ProviderError::ProviderError(ErrorKind kind,
                             const std::string& message,
                             std::string provider_id,
                             std::optional<long> status_code,
                             std::optional<std::string> cause)
    : std::runtime_error(message),
      kind_(kind),
      retryable_(default_retryable(kind)),
      provider_id_(std::move(provider_id)),
      status_code_(status_code),
      cause_(std::move(cause)) {}

bool is_retryable(const std::exception& e) {
    if (const auto* pe = dynamic_cast<const ProviderError*>(&e))
        return pe->retryable();
    return false;
}

bool mentions_missing_model(const std::string& text) {
    return contains_ci(text, "model") || contains_ci(text, "not found");
}

// Pull a human-readable message out of a backend error body.
// Handles {"error": "..."} (Ollama) and {"error": {"message": "..."}} (OpenAI-style).
static std::string extract_backend_message(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("error")) {
        const auto& err = j["error"];
        if (err.is_string()) return err.get<std::string>();
        if (err.is_object() && err.contains("message") && err["message"].is_string())
            return err["message"].get<std::string>();
    }
    std::string text = trim(body);
    if (text.size() > 200) text = text.substr(0, 200) + "...";
    return text;
}

ProviderError classify_http_error(const std::string& provider_id,
                                  long status_code,
                                  const std::string& body) {
    std::string backend_msg = extract_backend_message(body);
    std::string message = "HTTP " + std::to_string(status_code);
    if (!backend_msg.empty()) message += " - " + backend_msg;

    if (status_code == 429)
        return ProviderError(ErrorKind::RateLimit, message, provider_id, status_code);
    if (status_code == 408)
        return ProviderError(ErrorKind::Timeout, message, provider_id, status_code);
    if (status_code >= 400 && status_code < 500) {
        if (mentions_missing_model(backend_msg))
            return ProviderError(ErrorKind::ModelNotFound, message, provider_id, status_code);
        return ProviderError(ErrorKind::InvalidRequest, message, provider_id, status_code);
    }
    return ProviderError(ErrorKind::ApiError, message, provider_id, status_code);
}

ProviderError classify_transport_error(const std::string& provider_id,
                                       const std::string& detail,
                                       const CancellationToken& token) {
    switch (token.reason()) {
        case CancelReason::Cancelled:
            return ProviderError(ErrorKind::Cancelled, "Request cancelled", provider_id,
                                 std::nullopt, detail);
        case CancelReason::TimedOut:
            return ProviderError(ErrorKind::Timeout, "Request timed out", provider_id,
                                 std::nullopt, detail);
        case CancelReason::None:
            break;
    }
    std::string message = detail.empty() ? "Network error" : "Network error: " + detail;
    return ProviderError(ErrorKind::NetworkError, message, provider_id);
}

ProviderError classify_error(const std::exception& e,
                             const std::string& provider_id,
                             const std::string& context) {
    if (const auto* pe = dynamic_cast<const ProviderError*>(&e)) {
        if (!pe->provider_id().empty()) return *pe;
        return ProviderError(pe->kind(), pe->what(), provider_id,
                             pe->status_code(), pe->cause());
    }

    std::string text = e.what();
    std::string message = context.empty() ? text : context + ": " + text;

    if (contains_ci(text, "timed out") || contains_ci(text, "timeout"))
        return ProviderError(ErrorKind::Timeout, message, provider_id, std::nullopt, text);
    if (contains_ci(text, "connect") || contains_ci(text, "network") ||
        contains_ci(text, "resolve") || contains_ci(text, "socket"))
        return ProviderError(ErrorKind::NetworkError, message, provider_id, std::nullopt, text);
    return ProviderError(ErrorKind::ApiError, message, provider_id, std::nullopt, text);
}

// ── Suggested actions ───────────────────────────────────────────

const char* action_kind_to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::Retry:          return "retry";
        case ActionKind::SwitchProvider: return "switchProvider";
        case ActionKind::RefreshModels:  return "refreshModels";
        case ActionKind::OpenSettings:   return "openSettings";
    }
    return "openSettings";
}

std::vector<SuggestedAction> suggest_actions(const ProviderError* error,
                                             const ProviderRegistry& registry) {
    std::vector<SuggestedAction> actions;
    if (!error) {
        actions.push_back({ActionKind::OpenSettings, "Open Settings", ""});
        return actions;
    }
    if (error->kind() == ErrorKind::Cancelled) return actions;

    if (error->retryable()) {
        actions.push_back({ActionKind::Retry, "Retry", error->provider_id()});
    }
    if (error->kind() == ErrorKind::ModelNotFound || mentions_missing_model(error->what())) {
        actions.push_back({ActionKind::RefreshModels, "Refresh Models", error->provider_id()});
    }
    if (auto fallback = registry.get_next_available_provider({error->provider_id()})) {
        actions.push_back({ActionKind::SwitchProvider,
                           "Switch to " + fallback->name(), fallback->id()});
    }
    return actions;
}

ErrorReport report_error(const std::exception& e,
                         const std::string& provider_id,
                         const ProviderRegistry& registry,
                         const ModelRefreshFn& refresh_models) {
    bool classified_upstream = dynamic_cast<const ProviderError*>(&e) != nullptr;
    ProviderError error = classify_error(e, provider_id);

    ErrorReport report;
    report.kind = error.kind();
    report.message = error.what();
    report.retryable = error.retryable();
    report.provider_id = error.provider_id();
    report.cause = error.cause();
    report.actions = suggest_actions(&error, registry);

    if (!classified_upstream) {
        auto generic = suggest_actions(nullptr, registry);
        report.actions.insert(report.actions.end(), generic.begin(), generic.end());
    }

    bool refresh_suggested = std::any_of(
        report.actions.begin(), report.actions.end(),
        [](const SuggestedAction& a) { return a.kind == ActionKind::RefreshModels; });
    if (refresh_models && refresh_suggested) {
        refresh_models(error.provider_id());
    }
    return report;
}

} // namespace junkrat
