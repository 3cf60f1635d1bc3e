#pragma once
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace junkrat {

class ProviderRegistry;
class CancellationToken;

enum class ErrorKind {
    NetworkError,
    Timeout,
    RateLimit,
    InvalidRequest,
    ApiError,
    ModelNotFound,
    Cancelled
};

// Wire name, e.g. "NETWORK_ERROR"
const char* error_kind_to_string(ErrorKind kind);

// Whether a kind is worth retrying when nothing more specific is known.
bool default_retryable(ErrorKind kind);

// Classified provider failure.
class ProviderError : public std::runtime_error {
public:
    ProviderError(ErrorKind kind,
                  const std::string& message,
                  std::string provider_id,
                  std::optional<long> status_code = std::nullopt,
                  std::optional<std::string> cause = std::nullopt);

    ErrorKind kind() const { return kind_; }
    bool retryable() const { return retryable_; }
    const std::string& provider_id() const { return provider_id_; }
    std::optional<long> status_code() const { return status_code_; }
    const std::optional<std::string>& cause() const { return cause_; }

private:
    ErrorKind kind_;
    bool retryable_;
    std::string provider_id_;
    std::optional<long> status_code_;
    std::optional<std::string> cause_;
};

// True for ProviderErrors flagged retryable; false for anything else.
bool is_retryable(const std::exception& e);

// Map a non-2xx HTTP response to a ProviderError. The message carries the
// status and the backend's own error text when the body provides one.
ProviderError classify_http_error(const std::string& provider_id,
                                  long status_code,
                                  const std::string& body);

// Map a transport failure (status 0) to NetworkError, Timeout or Cancelled
// depending on what the call's token says.
ProviderError classify_transport_error(const std::string& provider_id,
                                       const std::string& detail,
                                       const CancellationToken& token);

// Map any exception to a ProviderError. ProviderErrors pass through
// unchanged (gaining a provider id if they had none); other exceptions are
// sorted by their text. `context` prefixes the message.
ProviderError classify_error(const std::exception& e,
                             const std::string& provider_id,
                             const std::string& context = "");

// Best-effort: backends do not report a missing model as a structured code.
bool mentions_missing_model(const std::string& text);

// ── Suggested actions ───────────────────────────────────────────

enum class ActionKind { Retry, SwitchProvider, RefreshModels, OpenSettings };

const char* action_kind_to_string(ActionKind kind);

struct SuggestedAction {
    ActionKind kind;
    std::string label;
    std::string provider_id; // target for SwitchProvider / RefreshModels
};

// Ranked remedies for a failure. Pass nullptr when no classified error
// exists; the generic OpenSettings fallback is then the only suggestion.
std::vector<SuggestedAction> suggest_actions(const ProviderError* error,
                                             const ProviderRegistry& registry);

// Structured error as presented to the UI layer.
struct ErrorReport {
    ErrorKind kind = ErrorKind::ApiError;
    std::string message;
    bool retryable = false;
    std::string provider_id;
    std::optional<std::string> cause;
    std::vector<SuggestedAction> actions;
};

using ModelRefreshFn = std::function<void(const std::string& provider_id)>;

// Classify `e`, derive actions, and when a model refresh is suggested invoke
// `refresh_models` for the failing provider.
ErrorReport report_error(const std::exception& e,
                         const std::string& provider_id,
                         const ProviderRegistry& registry,
                         const ModelRefreshFn& refresh_models = nullptr);

} // namespace junkrat
