#include "sidebar_protocol.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace junkrat {

// ── Decoding ────────────────────────────────────────────────────

static std::string require_string(const json& payload, const char* key, const std::string& type) {
    if (!payload.is_object() || !payload.contains(key) || !payload[key].is_string()) {
        throw ProtocolError("Message '" + type + "' requires string field '" + key + "'");
    }
    return payload[key].get<std::string>();
}

InboundMessage decode_inbound(const std::string& line) {
    auto j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ProtocolError("Malformed message: not a JSON object");
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        throw ProtocolError("Malformed message: missing 'type'");
    }

    const std::string type = j["type"].get<std::string>();
    const json payload = j.contains("payload") ? j["payload"] : json::object();

    if (type == "ready") return ReadyMessage{};
    if (type == "sendMessage") {
        SendChatMessage msg;
        msg.text = require_string(payload, "text", type);
        if (payload.contains("stream") && payload["stream"].is_boolean())
            msg.stream = payload["stream"].get<bool>();
        return msg;
    }
    if (type == "cancelRequest") return CancelRequestMessage{};
    if (type == "selectProvider") return SelectProviderMessage{require_string(payload, "providerId", type)};
    if (type == "requestProviderList") return RequestProviderListMessage{};
    if (type == "requestModelList") return RequestModelListMessage{};
    if (type == "selectModel") return SelectModelMessage{require_string(payload, "model", type)};
    if (type == "recheckProvider") return RecheckProviderMessage{};
    if (type == "deferSetup") return DeferSetupMessage{};
    if (type == "openSettings") {
        OpenSettingsMessage msg;
        if (payload.is_object() && payload.contains("settingId") && payload["settingId"].is_string())
            msg.setting_id = payload["settingId"].get<std::string>();
        return msg;
    }
    throw ProtocolError("Unknown message type: " + type);
}

// ── Encoding ────────────────────────────────────────────────────

static json usage_to_json(const TokenUsage& usage) {
    json j = json::object();
    if (usage.prompt_tokens) j["promptTokens"] = *usage.prompt_tokens;
    if (usage.completion_tokens) j["completionTokens"] = *usage.completion_tokens;
    if (usage.total_tokens) j["totalTokens"] = *usage.total_tokens;
    return j;
}

static json model_to_json(const ModelInfo& info) {
    json j = {
        {"name", info.name},
        {"size", info.size},
        {"digest", info.digest},
        {"modifiedAt", info.modified_at},
        {"isRunning", info.is_running}
    };
    if (info.family) j["family"] = *info.family;
    if (info.parameter_size) j["parameterSize"] = *info.parameter_size;
    if (info.quantization_level) j["quantizationLevel"] = *info.quantization_level;
    return j;
}

static json payload_of(const OutboundMessage& message) {
    return std::visit(Overloaded{
        [](const ProviderListMessage& m) {
            json providers = json::array();
            for (const auto& p : m.providers) {
                providers.push_back({{"id", p.id}, {"name", p.name},
                                     {"model", p.model}, {"active", p.active}});
            }
            return json{{"providers", providers}, {"activeId", m.active_id}};
        },
        [](const ModelListMessage& m) {
            json models = json::array();
            for (const auto& info : m.models) models.push_back(model_to_json(info));
            return json{{"providerId", m.provider_id}, {"models", models},
                        {"currentModel", m.current_model}};
        },
        [](const ProviderStatusMessage& m) {
            return json{{"providerId", m.provider_id}, {"available", m.available},
                        {"attemptCount", m.attempt_count}};
        },
        [](const SetupAdvisoryMessage& m) {
            return json{{"providerId", m.provider_id}, {"attemptCount", m.attempt_count},
                        {"message", m.message}};
        },
        [](const PollIntervalChangedMessage& m) {
            return json{{"providerId", m.provider_id}, {"intervalMs", m.interval_ms},
                        {"attemptCount", m.attempt_count}};
        },
        [](const ProvidersExhaustedMessage& m) {
            return json{{"providerId", m.provider_id}, {"attemptCount", m.attempt_count},
                        {"message", m.message}};
        },
        [](const StreamChunkMessage& m) {
            json j = {{"delta", m.chunk.delta}, {"done", m.chunk.done}};
            if (m.chunk.finish_reason) j["finishReason"] = finish_reason_to_string(*m.chunk.finish_reason);
            if (m.chunk.model) j["model"] = *m.chunk.model;
            return j;
        },
        [](const AssistantReplyMessage& m) {
            return json{{"id", m.response.id},
                        {"content", m.response.content},
                        {"model", m.response.model},
                        {"finishReason", finish_reason_to_string(m.response.finish_reason)},
                        {"usage", usage_to_json(m.response.usage)}};
        },
        [](const ErrorMessage& m) {
            const ErrorReport& r = m.report;
            json actions = json::array();
            std::optional<std::string> fallback;
            for (const auto& a : r.actions) {
                json action = {{"kind", action_kind_to_string(a.kind)}, {"label", a.label}};
                if (!a.provider_id.empty()) action["providerId"] = a.provider_id;
                if (a.kind == ActionKind::SwitchProvider && !fallback) fallback = a.provider_id;
                actions.push_back(action);
            }
            json j = {{"kind", error_kind_to_string(r.kind)},
                      {"message", r.message},
                      {"retryable", r.retryable},
                      {"providerId", r.provider_id},
                      {"actions", actions}};
            if (fallback) j["fallbackProviderId"] = *fallback;
            if (r.cause) j["cause"] = *r.cause;
            return j;
        },
    }, message);
}

const char* outbound_type(const OutboundMessage& message) {
    return std::visit(Overloaded{
        [](const ProviderListMessage&) { return "providerList"; },
        [](const ModelListMessage&) { return "modelList"; },
        [](const ProviderStatusMessage&) { return "providerStatus"; },
        [](const SetupAdvisoryMessage&) { return "setupAdvisory"; },
        [](const PollIntervalChangedMessage&) { return "pollIntervalChanged"; },
        [](const ProvidersExhaustedMessage&) { return "providersExhausted"; },
        [](const StreamChunkMessage&) { return "streamChunk"; },
        [](const AssistantReplyMessage&) { return "assistantMessage"; },
        [](const ErrorMessage&) { return "error"; },
    }, message);
}

std::string encode_outbound(const OutboundMessage& message) {
    json j;
    j["type"] = outbound_type(message);
    j["payload"] = payload_of(message);
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

ErrorMessage make_protocol_error(const std::string& message) {
    ErrorMessage msg;
    msg.report.kind = ErrorKind::InvalidRequest;
    msg.report.message = message;
    msg.report.retryable = false;
    return msg;
}

} // namespace junkrat
