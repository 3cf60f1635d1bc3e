#pragma once
#include "cancellation.hpp"
#include "retry.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace junkrat {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

std::optional<Role> role_from_string(const std::string& s);

struct ChatMessage {
    Role role;
    std::string content;
};

// Messages are sent in insertion order.
struct ChatRequest {
    std::vector<ChatMessage> messages;
    std::optional<std::string> model;      // overrides the configured model
    std::optional<double> temperature;
    std::optional<uint32_t> max_tokens;
    bool stream = false;
    CancellationToken token;
};

enum class FinishReason { Stop, Length, Error, Cancelled };

const char* finish_reason_to_string(FinishReason reason);

// Counters are absent when the backend does not report them.
struct TokenUsage {
    std::optional<uint32_t> prompt_tokens;
    std::optional<uint32_t> completion_tokens;
    std::optional<uint32_t> total_tokens;
};

// Build usage from backend counters, deriving the total by summation when
// the backend omitted it but reported at least one part.
TokenUsage make_usage(std::optional<uint32_t> prompt,
                      std::optional<uint32_t> completion,
                      std::optional<uint32_t> total = std::nullopt);

struct ChatResponse {
    std::string id;
    std::string content;
    std::string model;
    FinishReason finish_reason = FinishReason::Stop;
    TokenUsage usage;
};

struct StreamChunk {
    std::string delta;
    bool done = false;
    std::optional<FinishReason> finish_reason;
    std::optional<std::string> model;
};

// Pull-based, finite, non-restartable sequence of chunks. A session yields
// zero or more chunks with done=false followed by exactly one with
// done=true. Destroying the stream releases its connection, whether or not
// it was read to the end.
class ChatStream {
public:
    virtual ~ChatStream() = default;

    // Next chunk in arrival order; nullopt after the terminal chunk.
    // Throws ProviderError on connection or mid-stream failure.
    virtual std::optional<StreamChunk> next() = 0;
};

struct ModelInfo {
    std::string name;
    uint64_t size = 0;
    std::string digest;
    std::string modified_at;
    std::optional<std::string> family;
    std::optional<std::string> parameter_size;
    std::optional<std::string> quantization_level;
    bool is_running = false;
};

// Immutable per adapter; a settings change builds a new adapter.
struct ProviderConfig {
    std::string id;
    std::string name;
    std::string base_url;
    std::optional<std::string> api_key;
    std::string model;
    std::chrono::milliseconds timeout{30000};
    uint32_t max_retries = 3;
    BackoffPolicy backoff;
    std::string command; // CLI-driven providers only
};

// Common capability contract, implemented once per backend.
class Provider {
public:
    explicit Provider(ProviderConfig config) : config_(std::move(config)) {}
    virtual ~Provider() = default;

    const ProviderConfig& config() const { return config_; }
    const std::string& id() const { return config_.id; }
    const std::string& name() const { return config_.name; }

    virtual ChatResponse chat(const ChatRequest& request) = 0;

    // Lazy: nothing touches the network until the first next().
    virtual std::unique_ptr<ChatStream> stream_chat(const ChatRequest& request) = 0;

    // Short, independently bounded reachability probe. Never throws.
    virtual bool is_available() = 0;

    // Enumerations degrade to an empty list on any failure. Never throw.
    virtual std::vector<std::string> list_models() = 0;
    virtual std::vector<ModelInfo> list_models_with_details();
    virtual std::vector<ModelInfo> list_running_models() { return {}; }

    // Whether list_models() reflects a live backend catalogue worth refreshing.
    virtual bool supports_model_listing() const { return true; }

protected:
    // Request model (else configured model), replaced by the first
    // enumerated model when the backend does not know it. Enumeration
    // failure leaves the model unchanged.
    std::string resolve_model(const ChatRequest& request);

    RetryOptions retry_options(const ChatRequest& request) const;

private:
    ProviderConfig config_;
};

class HttpClient; // forward declaration

// Known provider ids, in fallback priority order.
const std::vector<std::string>& known_provider_ids();

// Built-in defaults for a known provider id. Throws std::invalid_argument
// for an unknown id.
ProviderConfig default_provider_config(const std::string& id);

// Factory: create the adapter matching config.id.
// Throws std::invalid_argument for an unknown id.
std::unique_ptr<Provider> create_provider(const ProviderConfig& config, HttpClient& http);

} // namespace junkrat
