#include "provider.hpp"
#include "providers/cli.hpp"
#include "providers/ollama.hpp"
#include "providers/openai_compatible.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace junkrat {

std::optional<Role> role_from_string(const std::string& s) {
    if (s == "system") return Role::System;
    if (s == "user") return Role::User;
    if (s == "assistant") return Role::Assistant;
    return std::nullopt;
}

const char* finish_reason_to_string(FinishReason reason) {
    switch (reason) {
        case FinishReason::Stop: return "stop";
        case FinishReason::Length: return "length";
        case FinishReason::Error: return "error";
        case FinishReason::Cancelled: return "cancelled";
    }
    return "stop";
}

TokenUsage make_usage(std::optional<uint32_t> prompt,
                      std::optional<uint32_t> completion,
                      std::optional<uint32_t> total) {
    TokenUsage usage;
    usage.prompt_tokens = prompt;
    usage.completion_tokens = completion;
    usage.total_tokens = total;
    if (!total && (prompt || completion))
        usage.total_tokens = prompt.value_or(0) + completion.value_or(0);
    return usage;
}

// ── Provider base ───────────────────────────────────────────────

std::vector<ModelInfo> Provider::list_models_with_details() {
    std::vector<ModelInfo> result;
    for (auto& name : list_models()) {
        ModelInfo info;
        info.name = std::move(name);
        result.push_back(std::move(info));
    }
    return result;
}

std::string Provider::resolve_model(const ChatRequest& request) {
    std::string model = request.model.value_or(config_.model);
    auto models = list_models();
    if (!models.empty() &&
        std::find(models.begin(), models.end(), model) == models.end()) {
        std::cerr << "[" << id() << "] Configured model '" << model
                  << "' not found. Using '" << models.front() << "' instead.\n";
        model = models.front();
    }
    return model;
}

RetryOptions Provider::retry_options(const ChatRequest& request) const {
    RetryOptions options;
    options.max_retries = config_.max_retries;
    options.backoff = config_.backoff;
    options.token = request.token;
    options.provider_id = config_.id;
    options.on_retry = [this](uint32_t retry, std::chrono::milliseconds delay,
                              const std::exception& e) {
        std::cerr << "[retry] Provider " << id() << " retry " << retry << "/"
                  << config_.max_retries << " in " << delay.count()
                  << "ms after: " << e.what() << '\n';
    };
    return options;
}

// ── Defaults & factory ──────────────────────────────────────────

const std::vector<std::string>& known_provider_ids() {
    static const std::vector<std::string> ids = {
        "ollama", "gemini", "openrouter", "custom", "gemini-cli"
    };
    return ids;
}

ProviderConfig default_provider_config(const std::string& id) {
    ProviderConfig cfg;
    cfg.id = id;
    if (id == "ollama") {
        cfg.name = "Ollama";
        cfg.base_url = "http://127.0.0.1:11434";
        cfg.model = "llama3";
        cfg.timeout = std::chrono::milliseconds(30000);
    } else if (id == "gemini") {
        cfg.name = "Google Gemini";
        cfg.base_url = "https://generativelanguage.googleapis.com/v1beta/openai";
        cfg.model = "gemini-2.0-flash-exp";
        cfg.timeout = std::chrono::milliseconds(60000);
    } else if (id == "openrouter") {
        cfg.name = "OpenRouter";
        cfg.base_url = "https://openrouter.ai/api/v1";
        cfg.model = "openai/gpt-4o";
        cfg.timeout = std::chrono::milliseconds(60000);
    } else if (id == "custom") {
        cfg.name = "Custom OpenAI-Compatible";
        cfg.base_url = "http://localhost:8080/v1";
        cfg.model = "gpt-3.5-turbo";
        cfg.timeout = std::chrono::milliseconds(60000);
    } else if (id == "gemini-cli") {
        cfg.name = "Gemini CLI";
        cfg.model = "gemini-cli";
        cfg.command = "gemini";
        cfg.timeout = std::chrono::milliseconds(120000);
        cfg.max_retries = 0;
    } else {
        throw std::invalid_argument("Unknown provider: " + id);
    }
    return cfg;
}

std::unique_ptr<Provider> create_provider(const ProviderConfig& config, HttpClient& http) {
    if (config.id == "ollama")
        return std::make_unique<OllamaProvider>(config, http);
    if (config.id == "gemini" || config.id == "openrouter")
        return std::make_unique<OpenAICompatibleProvider>(config, http, true);
    if (config.id == "custom")
        return std::make_unique<OpenAICompatibleProvider>(config, http, false);
    if (config.id == "gemini-cli")
        return std::make_unique<CliProvider>(config);
    throw std::invalid_argument("Unknown provider: " + config.id);
}

} // namespace junkrat
