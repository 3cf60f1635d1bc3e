#include "openai_compatible.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace junkrat {

static constexpr std::chrono::milliseconds kProbeTimeout{5000};
static constexpr std::chrono::milliseconds kModelsTimeout{10000};
static constexpr uint32_t kMaxMalformedRun = 32;

FinishReason map_openai_finish_reason(const std::string& reason) {
    if (reason == "length") return FinishReason::Length;
    if (reason == "content_filter") return FinishReason::Error;
    return FinishReason::Stop;
}

static std::optional<uint32_t> optional_count(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number_unsigned()) return j[key].get<uint32_t>();
    return std::nullopt;
}

static const json* first_choice(const json& j) {
    if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty() &&
        j["choices"][0].is_object()) {
        return &j["choices"][0];
    }
    return nullptr;
}

OpenAICompatibleProvider::OpenAICompatibleProvider(ProviderConfig config, HttpClient& http,
                                                   bool requires_api_key)
    : Provider(std::move(config)), http_(http), requires_api_key_(requires_api_key) {}

void OpenAICompatibleProvider::require_key() const {
    if (requires_api_key_ && (!config().api_key || config().api_key->empty())) {
        throw ProviderError(ErrorKind::InvalidRequest, name() + " API key is required", id());
    }
}

std::vector<Header> OpenAICompatibleProvider::build_headers() const {
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (config().api_key && !config().api_key->empty()) {
        headers.emplace_back("Authorization", "Bearer " + *config().api_key);
    }
    if (id() == "openrouter") {
        headers.emplace_back("HTTP-Referer", "https://github.com/junkrat/junkrat");
        headers.emplace_back("X-Title", "Junkrat");
    }
    return headers;
}

std::string OpenAICompatibleProvider::build_body(const ChatRequest& request, bool stream) const {
    json body;
    body["model"] = request.model.value_or(config().model);
    body["stream"] = stream;

    json msgs = json::array();
    for (const auto& msg : request.messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    body["messages"] = msgs;

    if (request.temperature) body["temperature"] = *request.temperature;
    if (request.max_tokens) body["max_tokens"] = *request.max_tokens;
    return body.dump();
}

// ── chat ────────────────────────────────────────────────────────

ChatResponse OpenAICompatibleProvider::chat(const ChatRequest& request) {
    require_key();
    try {
        return retry([&] { return chat_once(request); }, retry_options(request));
    } catch (const std::exception& e) {
        throw classify_error(e, id(), name() + " chat request failed");
    }
}

ChatResponse OpenAICompatibleProvider::chat_once(const ChatRequest& request) {
    auto call = CancellationSource::linked(request.token, config().timeout);

    auto response = http_.post(config().base_url + "/chat/completions",
                               build_body(request, false), build_headers(), call.token());
    if (response.status_code == 0) {
        throw classify_transport_error(id(), response.error, call.token());
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw classify_http_error(id(), response.status_code, response.body);
    }

    auto resp = json::parse(response.body, nullptr, false);
    if (resp.is_discarded() || !resp.is_object()) {
        throw ProviderError(ErrorKind::ApiError, "Invalid JSON in " + name() + " response", id());
    }

    ChatResponse result;
    std::string requested = request.model.value_or(config().model);
    result.id = resp.value("id", "");
    if (result.id.empty()) result.id = id() + "-" + std::to_string(epoch_millis());
    result.model = resp.value("model", "");
    if (result.model.empty()) result.model = requested;

    if (const json* choice = first_choice(resp)) {
        if (choice->contains("message") && (*choice)["message"].is_object()) {
            const auto& message = (*choice)["message"];
            if (message.contains("content") && message["content"].is_string())
                result.content = message["content"].get<std::string>();
        }
        if (choice->contains("finish_reason") && (*choice)["finish_reason"].is_string())
            result.finish_reason =
                map_openai_finish_reason((*choice)["finish_reason"].get<std::string>());
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        const auto& usage = resp["usage"];
        result.usage.prompt_tokens = optional_count(usage, "prompt_tokens");
        result.usage.completion_tokens = optional_count(usage, "completion_tokens");
        result.usage.total_tokens = optional_count(usage, "total_tokens");
    }
    return result;
}

// ── stream_chat ─────────────────────────────────────────────────

LineStatus decode_sse_line(const std::string& line, StreamRecord& record,
                           const std::string& provider_id) {
    if (line.rfind("data:", 0) != 0) return LineStatus::Ignore;

    // Both "data: payload" and "data:payload"
    std::string payload = trim(line.substr(5));
    if (payload.empty()) return LineStatus::Ignore;
    if (payload == "[DONE]") {
        record.done = true;
        return LineStatus::Record;
    }

    auto j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return LineStatus::Malformed;

    if (j.contains("error")) {
        std::string message = "stream error";
        const auto& err = j["error"];
        if (err.is_string()) message = err.get<std::string>();
        else if (err.is_object() && err.contains("message") && err["message"].is_string())
            message = err["message"].get<std::string>();
        throw ProviderError(ErrorKind::ApiError, message, provider_id);
    }

    if (j.contains("model") && j["model"].is_string() && !j["model"].get<std::string>().empty())
        record.model = j["model"].get<std::string>();

    if (const json* choice = first_choice(j)) {
        if (choice->contains("delta") && (*choice)["delta"].is_object()) {
            const auto& delta = (*choice)["delta"];
            if (delta.contains("content") && delta["content"].is_string())
                record.delta = delta["content"].get<std::string>();
        }
        if (choice->contains("finish_reason") && (*choice)["finish_reason"].is_string()) {
            record.finish_reason =
                map_openai_finish_reason((*choice)["finish_reason"].get<std::string>());
            record.done = true;
        }
    }
    return LineStatus::Record;
}

std::unique_ptr<ChatStream> OpenAICompatibleProvider::stream_chat(const ChatRequest& request) {
    require_key();

    // The stream must not outlive this provider.
    StreamOpener opener = [this, request]() {
        try {
            return retry([&] { return open_stream_once(request); }, retry_options(request));
        } catch (const std::exception& e) {
            throw classify_error(e, id(), name() + " streaming request failed");
        }
    };
    std::string provider_id = id();
    LineDecoder decoder = [provider_id](const std::string& line, StreamRecord& record) {
        return decode_sse_line(line, record, provider_id);
    };
    return std::make_unique<LineChatStream>(std::move(opener), std::move(decoder),
                                            id(), kMaxMalformedRun);
}

OpenedStream OpenAICompatibleProvider::open_stream_once(const ChatRequest& request) {
    auto call = CancellationSource::linked(request.token, config().timeout);

    std::string error;
    auto body = http_.open_stream(config().base_url + "/chat/completions",
                                  build_body(request, true), build_headers(),
                                  call.token(), error);
    if (!body) {
        throw classify_transport_error(id(), error, call.token());
    }
    long status = body->status_code();
    if (status < 200 || status >= 300) {
        throw classify_http_error(id(), status, body->read_all());
    }

    call.clear_deadline();
    return OpenedStream{std::move(body), call.token(), request.model.value_or(config().model)};
}

// ── probes & listings ───────────────────────────────────────────

bool OpenAICompatibleProvider::is_available() {
    if (requires_api_key_ && (!config().api_key || config().api_key->empty())) return false;

    auto probe = CancellationSource::linked(CancellationToken(), kProbeTimeout);
    auto response = http_.get(config().base_url + "/models", build_headers(), probe.token());
    return response.status_code >= 200 && response.status_code < 300;
}

std::vector<std::string> OpenAICompatibleProvider::list_models() {
    if (requires_api_key_ && (!config().api_key || config().api_key->empty())) return {};

    auto call = CancellationSource::linked(CancellationToken(), kModelsTimeout);
    auto response = http_.get(config().base_url + "/models", build_headers(), call.token());
    if (response.status_code < 200 || response.status_code >= 300) return {};

    auto j = json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("data") || !j["data"].is_array())
        return {};

    std::vector<std::string> ids;
    for (const auto& model : j["data"]) {
        if (model.is_object() && model.contains("id") && model["id"].is_string())
            ids.push_back(model["id"].get<std::string>());
    }
    return ids;
}

} // namespace junkrat
