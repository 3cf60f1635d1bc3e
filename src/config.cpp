#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace junkrat {

static const char* kConfigPath = "~/.junkrat/config.json";

nlohmann::json Config::defaults_json() {
    nlohmann::json providers = nlohmann::json::object();
    for (const auto& id : known_provider_ids()) {
        ProviderConfig d = default_provider_config(id);
        nlohmann::json entry = {
            {"name", d.name},
            {"base_url", d.base_url},
            {"model", d.model},
            {"timeout_ms", d.timeout.count()},
            {"max_retries", d.max_retries}
        };
        if (id == "gemini" || id == "openrouter" || id == "custom") entry["api_key"] = "";
        if (!d.command.empty()) entry["command"] = d.command;
        providers[id] = entry;
    }

    PollerPolicy poller;
    BackoffPolicy retry;
    return {
        {"active_provider", "ollama"},
        {"providers", providers},
        {"poller", {
            {"base_interval_ms", poller.base_interval.count()},
            {"early_warning_attempts", poller.early_warning_attempts},
            {"backoff_threshold", poller.backoff_threshold},
            {"backoff_factor", poller.backoff_factor},
            {"max_attempts", poller.max_attempts},
            {"keep_polling_when_available", poller.keep_polling_when_available},
            {"healthy_interval_ms", poller.healthy_interval.count()}
        }},
        {"retry", {
            {"initial_delay_ms", retry.initial_delay.count()},
            {"max_delay_ms", retry.max_delay.count()},
            {"factor", retry.factor},
            {"jitter", retry.jitter}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static bool is_count(const nlohmann::json& obj, const char* key) {
    return obj.contains(key) && obj[key].is_number_integer() && obj[key].get<int64_t>() >= 0;
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (is_count(obj, key)) out = obj[key].get<uint32_t>();
}

static void read_millis(const nlohmann::json& obj, const char* key, std::chrono::milliseconds& out) {
    if (is_count(obj, key)) out = std::chrono::milliseconds(obj[key].get<int64_t>());
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    for (const auto& id : known_provider_ids()) {
        cfg.providers[id] = default_provider_config(id);
    }

    read_string(j, "active_provider", cfg.active_provider);

    if (j.contains("retry") && j["retry"].is_object()) {
        const auto& r = j["retry"];
        read_millis(r, "initial_delay_ms", cfg.retry.initial_delay);
        read_millis(r, "max_delay_ms", cfg.retry.max_delay);
        if (r.contains("factor") && r["factor"].is_number())
            cfg.retry.factor = r["factor"].get<double>();
        if (r.contains("jitter") && r["jitter"].is_boolean())
            cfg.retry.jitter = r["jitter"].get<bool>();
    }

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [id, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            auto it = cfg.providers.find(id);
            if (it == cfg.providers.end()) {
                std::cerr << "[config] Ignoring unknown provider: " << id << "\n";
                continue;
            }
            ProviderConfig& p = it->second;
            read_string(obj, "name", p.name);
            read_string(obj, "base_url", p.base_url);
            read_string(obj, "model", p.model);
            read_string(obj, "command", p.command);
            if (obj.contains("api_key") && obj["api_key"].is_string()) {
                std::string key = obj["api_key"].get<std::string>();
                if (!key.empty()) p.api_key = key;
            }
            read_millis(obj, "timeout_ms", p.timeout);
            read_uint(obj, "max_retries", p.max_retries);
        }
    }
    for (auto& entry : cfg.providers) entry.second.backoff = cfg.retry;

    if (j.contains("poller") && j["poller"].is_object()) {
        const auto& p = j["poller"];
        read_millis(p, "base_interval_ms", cfg.poller.base_interval);
        read_uint(p, "early_warning_attempts", cfg.poller.early_warning_attempts);
        read_uint(p, "backoff_threshold", cfg.poller.backoff_threshold);
        read_uint(p, "backoff_factor", cfg.poller.backoff_factor);
        read_uint(p, "max_attempts", cfg.poller.max_attempts);
        if (p.contains("keep_polling_when_available") && p["keep_polling_when_available"].is_boolean())
            cfg.poller.keep_polling_when_available = p["keep_polling_when_available"].get<bool>();
        read_millis(p, "healthy_interval_ms", cfg.poller.healthy_interval);
    }

    if (cfg.providers.find(cfg.active_provider) == cfg.providers.end()) {
        std::cerr << "[config] Unknown active_provider '" << cfg.active_provider
                  << "', using ollama\n";
        cfg.active_provider = "ollama";
    }
    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("GEMINI_API_KEY"))
        providers["gemini"].api_key = std::string(v);
    if (const char* v = std::getenv("OPENROUTER_API_KEY"))
        providers["openrouter"].api_key = std::string(v);
    if (const char* v = std::getenv("CUSTOM_API_KEY"))
        providers["custom"].api_key = std::string(v);
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        providers["ollama"].base_url = v;
    if (const char* v = std::getenv("CUSTOM_BASE_URL"))
        providers["custom"].base_url = v;
    if (const char* v = std::getenv("JUNKRAT_PROVIDER")) {
        if (providers.count(v)) active_provider = v;
        else std::cerr << "[config] JUNKRAT_PROVIDER names unknown provider: " << v << "\n";
    }
}

Config Config::load() {
    std::string config_path = expand_home(kConfigPath);
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        nlohmann::json original = nlohmann::json::parse(file, nullptr, false);
        file.close();
        if (original.is_discarded() || !original.is_object()) {
            std::cerr << "[config] Malformed config, using defaults: " << config_path << "\n";
            j = defaults_json();
        } else {
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

const ProviderConfig& Config::provider(const std::string& id) const {
    auto it = providers.find(id);
    if (it == providers.end()) throw std::invalid_argument("Unknown provider: " + id);
    return it->second;
}

bool Config::persist_selection() const {
    auto it = providers.find(active_provider);
    std::string model = it != providers.end() ? it->second.model : std::string();
    return modify_config_json([&](nlohmann::json& j) {
        j["active_provider"] = active_provider;
        if (model.empty()) return;
        if (!j.contains("providers") || !j["providers"].is_object())
            j["providers"] = nlohmann::json::object();
        if (!j["providers"].contains(active_provider) || !j["providers"][active_provider].is_object())
            j["providers"][active_provider] = nlohmann::json::object();
        j["providers"][active_provider]["model"] = model;
    });
}

bool modify_config_json(const std::function<void(nlohmann::json&)>& modifier) {
    std::string config_path = expand_home(kConfigPath);
    nlohmann::json j = nlohmann::json::object();

    std::ifstream file(config_path);
    if (file.is_open()) {
        j = nlohmann::json::parse(file, nullptr, false);
        file.close();
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "[config] Refusing to overwrite malformed config: " << config_path << "\n";
            return false;
        }
    }

    modifier(j);
    return atomic_write_file(config_path, j.dump(4) + "\n");
}

} // namespace junkrat
