#pragma once
#include "errors.hpp"
#include "provider.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace junkrat {

// Newline-delimited JSON exchanged with the editor sidebar. Every message is
// an object {"type": "...", "payload": {...}}.

// ── Inbound (sidebar → core) ────────────────────────────────────

struct ReadyMessage {};
struct SendChatMessage {
    std::string text;
    bool stream = true;
};
struct CancelRequestMessage {};
struct SelectProviderMessage {
    std::string provider_id;
};
struct RequestProviderListMessage {};
struct RequestModelListMessage {};
struct SelectModelMessage {
    std::string model;
};
struct RecheckProviderMessage {};
struct DeferSetupMessage {};
struct OpenSettingsMessage {
    std::optional<std::string> setting_id;
};

using InboundMessage = std::variant<
    ReadyMessage,
    SendChatMessage,
    CancelRequestMessage,
    SelectProviderMessage,
    RequestProviderListMessage,
    RequestModelListMessage,
    SelectModelMessage,
    RecheckProviderMessage,
    DeferSetupMessage,
    OpenSettingsMessage>;

// Unknown type, bad JSON or a payload missing a required field.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws ProtocolError.
InboundMessage decode_inbound(const std::string& line);

// ── Outbound (core → sidebar) ───────────────────────────────────

struct ProviderEntry {
    std::string id;
    std::string name;
    std::string model;
    bool active = false;
};

struct ProviderListMessage {
    std::vector<ProviderEntry> providers;
    std::string active_id;
};
struct ModelListMessage {
    std::string provider_id;
    std::vector<ModelInfo> models;
    std::string current_model;
};
struct ProviderStatusMessage {
    std::string provider_id;
    bool available = false;
    uint32_t attempt_count = 0;
};
struct SetupAdvisoryMessage {
    std::string provider_id;
    uint32_t attempt_count = 0;
    std::string message;
};
struct PollIntervalChangedMessage {
    std::string provider_id;
    long long interval_ms = 0;
    uint32_t attempt_count = 0;
};
struct ProvidersExhaustedMessage {
    std::string provider_id;
    uint32_t attempt_count = 0;
    std::string message;
};
struct StreamChunkMessage {
    StreamChunk chunk;
};
struct AssistantReplyMessage {
    ChatResponse response;
};
struct ErrorMessage {
    ErrorReport report;
};

using OutboundMessage = std::variant<
    ProviderListMessage,
    ModelListMessage,
    ProviderStatusMessage,
    SetupAdvisoryMessage,
    PollIntervalChangedMessage,
    ProvidersExhaustedMessage,
    StreamChunkMessage,
    AssistantReplyMessage,
    ErrorMessage>;

// One line of JSON, without the trailing newline.
std::string encode_outbound(const OutboundMessage& message);

// Wire type name, e.g. "providerList"
const char* outbound_type(const OutboundMessage& message);

// Error payload for failures that never reached a provider.
ErrorMessage make_protocol_error(const std::string& message);

// Combine lambdas into one visitor.
template <typename... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

} // namespace junkrat
