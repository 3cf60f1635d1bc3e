#pragma once
#include "availability_poller.hpp"
#include "provider.hpp"
#include "retry.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace junkrat {

struct Config {
    std::string active_provider = "ollama";

    // One entry per known provider id, defaults filled in.
    std::unordered_map<std::string, ProviderConfig> providers;

    PollerPolicy poller;
    BackoffPolicy retry;

    // Load from ~/.junkrat/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse an already-merged config document. Unknown keys are ignored and
    // values of the wrong type keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // Environment variables always override the file.
    void apply_env();

    // Throws std::invalid_argument for an unknown id.
    const ProviderConfig& provider(const std::string& id) const;

    // Persist the active provider and its model to the config file
    bool persist_selection() const;
};

// Read-modify-write ~/.junkrat/config.json atomically.
// The callback receives a mutable reference to the parsed JSON.
bool modify_config_json(const std::function<void(nlohmann::json&)>& modifier);

} // namespace junkrat
