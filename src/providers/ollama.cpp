#include "ollama.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <unordered_set>

using json = nlohmann::json;

namespace junkrat {

static constexpr std::chrono::milliseconds kProbeTimeout{5000};
static constexpr std::chrono::milliseconds kTagsTimeout{10000};
static constexpr std::chrono::milliseconds kPsTimeout{5000};
static constexpr uint32_t kMaxMalformedRun = 32;

static const std::vector<Header> kJsonHeaders = {
    {"Content-Type", "application/json"}
};

static FinishReason map_done_reason(const json& j) {
    if (j.contains("done_reason") && j["done_reason"].is_string() &&
        j["done_reason"].get<std::string>() == "length") {
        return FinishReason::Length;
    }
    return FinishReason::Stop;
}

static std::optional<uint32_t> optional_count(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number_unsigned()) return j[key].get<uint32_t>();
    return std::nullopt;
}

static std::optional<std::string> optional_string(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

OllamaProvider::OllamaProvider(ProviderConfig config, HttpClient& http)
    : Provider(std::move(config)), http_(http) {}

std::string OllamaProvider::build_body(const ChatRequest& request,
                                       const std::string& model,
                                       bool stream) const {
    json body;
    body["model"] = model;
    body["stream"] = stream;

    json msgs = json::array();
    for (const auto& msg : request.messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    body["messages"] = msgs;

    if (request.temperature) {
        body["options"] = {{"temperature", *request.temperature}};
    }
    return body.dump();
}

// ── chat ────────────────────────────────────────────────────────

ChatResponse OllamaProvider::chat(const ChatRequest& request) {
    try {
        return retry([&] { return chat_once(request); }, retry_options(request));
    } catch (const std::exception& e) {
        throw classify_error(e, id(), "Ollama chat request failed");
    }
}

ChatResponse OllamaProvider::chat_once(const ChatRequest& request) {
    std::string model = resolve_model(request);
    auto call = CancellationSource::linked(request.token, config().timeout);

    auto response = http_.post(config().base_url + "/api/chat",
                               build_body(request, model, false),
                               kJsonHeaders, call.token());
    if (response.status_code == 0) {
        throw classify_transport_error(id(), response.error, call.token());
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw classify_http_error(id(), response.status_code, response.body);
    }

    auto resp = json::parse(response.body, nullptr, false);
    if (resp.is_discarded() || !resp.is_object()) {
        throw ProviderError(ErrorKind::ApiError, "Invalid JSON in Ollama response", id());
    }

    ChatResponse result;
    result.id = "ollama-" + std::to_string(epoch_millis());
    result.model = resp.value("model", model);
    if (resp.contains("message") && resp["message"].is_object()) {
        result.content = resp["message"].value("content", "");
    }
    result.finish_reason = map_done_reason(resp);
    result.usage = make_usage(optional_count(resp, "prompt_eval_count"),
                              optional_count(resp, "eval_count"));
    return result;
}

// ── stream_chat ─────────────────────────────────────────────────

LineStatus decode_ollama_line(const std::string& line, StreamRecord& record) {
    if (trim(line).empty()) return LineStatus::Ignore;

    auto j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return LineStatus::Malformed;

    if (auto err = optional_string(j, "error")) {
        throw ProviderError(ErrorKind::ApiError, "Ollama stream error: " + *err, "ollama");
    }

    if (j.contains("message")) {
        const auto& msg = j["message"];
        if (!msg.is_object()) return LineStatus::Malformed;
        if (msg.contains("content")) {
            if (!msg["content"].is_string()) return LineStatus::Malformed;
            record.delta = msg["content"].get<std::string>();
        }
    }
    if (j.contains("done")) {
        if (!j["done"].is_boolean()) return LineStatus::Malformed;
        record.done = j["done"].get<bool>();
    }
    record.model = optional_string(j, "model");
    if (record.done) record.finish_reason = map_done_reason(j);
    return LineStatus::Record;
}

std::unique_ptr<ChatStream> OllamaProvider::stream_chat(const ChatRequest& request) {
    // The stream must not outlive this provider.
    StreamOpener opener = [this, request]() {
        try {
            return retry([&] { return open_stream_once(request); }, retry_options(request));
        } catch (const std::exception& e) {
            throw classify_error(e, id(), "Ollama streaming request failed");
        }
    };
    return std::make_unique<LineChatStream>(std::move(opener), decode_ollama_line,
                                            id(), kMaxMalformedRun);
}

OpenedStream OllamaProvider::open_stream_once(const ChatRequest& request) {
    std::string model = resolve_model(request);
    auto call = CancellationSource::linked(request.token, config().timeout);

    std::string error;
    auto body = http_.open_stream(config().base_url + "/api/chat",
                                  build_body(request, model, true),
                                  kJsonHeaders, call.token(), error);
    if (!body) {
        throw classify_transport_error(id(), error, call.token());
    }
    long status = body->status_code();
    if (status < 200 || status >= 300) {
        throw classify_http_error(id(), status, body->read_all());
    }

    // The timeout bounds connection setup only; reading continues until done
    // or cancelled.
    call.clear_deadline();
    return OpenedStream{std::move(body), call.token(), model};
}

// ── probes & listings ───────────────────────────────────────────

bool OllamaProvider::is_available() {
    auto probe = CancellationSource::linked(CancellationToken(), kProbeTimeout);
    auto response = http_.get(config().base_url + "/api/tags", {}, probe.token());
    return response.status_code >= 200 && response.status_code < 300;
}

std::vector<ModelInfo> OllamaProvider::fetch_models(const std::string& path,
                                                    std::chrono::milliseconds bound) {
    auto call = CancellationSource::linked(CancellationToken(), bound);
    auto response = http_.get(config().base_url + path, {}, call.token());
    if (response.status_code < 200 || response.status_code >= 300) {
        std::cerr << "[ollama] GET " << path << " failed: "
                  << (response.status_code == 0 ? response.error
                                                : "HTTP " + std::to_string(response.status_code))
                  << '\n';
        return {};
    }

    auto j = json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("models") || !j["models"].is_array()) {
        std::cerr << "[ollama] Unexpected " << path << " payload\n";
        return {};
    }

    std::vector<ModelInfo> models;
    for (const auto& m : j["models"]) {
        if (!m.is_object()) continue;
        auto name = optional_string(m, "name");
        if (!name) continue;

        ModelInfo info;
        info.name = *name;
        if (m.contains("size") && m["size"].is_number_unsigned())
            info.size = m["size"].get<uint64_t>();
        info.digest = m.value("digest", "");
        info.modified_at = m.value("modified_at", "");
        if (m.contains("details") && m["details"].is_object()) {
            const auto& d = m["details"];
            info.family = optional_string(d, "family");
            info.parameter_size = optional_string(d, "parameter_size");
            info.quantization_level = optional_string(d, "quantization_level");
        }
        models.push_back(std::move(info));
    }
    return models;
}

std::vector<std::string> OllamaProvider::list_models() {
    std::vector<std::string> names;
    for (auto& info : fetch_models("/api/tags", kTagsTimeout)) {
        names.push_back(std::move(info.name));
    }
    return names;
}

std::vector<ModelInfo> OllamaProvider::list_running_models() {
    auto running = fetch_models("/api/ps", kPsTimeout);
    for (auto& info : running) info.is_running = true;
    return running;
}

std::vector<ModelInfo> OllamaProvider::list_models_with_details() {
    auto models = fetch_models("/api/tags", kTagsTimeout);
    if (models.empty()) return models;

    std::unordered_set<std::string> running;
    for (const auto& info : list_running_models()) running.insert(info.name);
    for (auto& info : models) info.is_running = running.count(info.name) > 0;
    return models;
}

} // namespace junkrat
