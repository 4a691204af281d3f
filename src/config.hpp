#pragma once
#include <string>
#include <functional>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace agentsh {

struct ProviderEntry {
    std::string base_url;
};

struct Config {
    std::string agents_dir = "agents";
    std::string history_file = "~/.agentsh/history";
    bool color = true;

    std::unordered_map<std::string, ProviderEntry> providers;

    // Load from ~/.agentsh/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;

    // <agents_dir>/general.json
    std::string general_path() const;
};

// Path of ~/.agentsh/config.json
std::string config_path();

// Read-modify-write a JSON document atomically. A missing file starts
// from an empty object; a malformed one fails without being touched.
bool modify_json_file(const std::string& path,
                      const std::function<void(nlohmann::json&)>& modifier);

// Name stored under "default_agent" in general.json, empty if unset.
// Throws std::runtime_error if the file is missing or malformed.
std::string read_default_agent(const Config& config);

// Persist default_agent into general.json
bool persist_default_agent(const Config& config, const std::string& agent_name);

} // namespace agentsh
