#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace agentsh {

nlohmann::json Config::defaults_json() {
    return {
        {"agents_dir", "agents"},
        {"history_file", "~/.agentsh/history"},
        {"color", true},
        {"providers", {
            {"ollama", {{"base_url", "http://localhost:11434"}}}
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

std::string config_path() {
    return expand_home("~/.agentsh/config.json");
}

Config Config::load() {
    Config cfg;

    std::string path = config_path();
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << path << ": "
                      << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << path << "\n";
    }

    if (j.contains("agents_dir") && j["agents_dir"].is_string())
        cfg.agents_dir = j["agents_dir"].get<std::string>();
    if (j.contains("history_file") && j["history_file"].is_string())
        cfg.history_file = j["history_file"].get<std::string>();
    if (j.contains("color") && j["color"].is_boolean())
        cfg.color = j["color"].get<bool>();

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            if (obj.contains("base_url") && obj["base_url"].is_string())
                entry.base_url = obj["base_url"].get<std::string>();
            cfg.providers[name] = std::move(entry);
        }
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("AGENTSH_AGENTS_DIR"))
        cfg.agents_dir = v;
    if (const char* v = std::getenv("AGENTSH_HISTORY_FILE"))
        cfg.history_file = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        cfg.providers["ollama"].base_url = v;

    cfg.agents_dir = expand_home(cfg.agents_dir);
    cfg.history_file = expand_home(cfg.history_file);
    return cfg;
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

std::string Config::general_path() const {
    return agents_dir + "/general.json";
}

bool modify_json_file(const std::string& path,
                      const std::function<void(nlohmann::json&)>& modifier) {
    nlohmann::json j = nlohmann::json::object();
    std::ifstream file(path);
    if (file.is_open()) {
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::exception&) {
            return false;
        }
        if (!j.is_object()) return false;
    }
    modifier(j);
    return atomic_write_file(path, j.dump(4) + "\n");
}

std::string read_default_agent(const Config& config) {
    std::string path = config.general_path();
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error(path + ": expected a JSON object");
    }
    if (j.contains("default_agent") && j["default_agent"].is_string())
        return j["default_agent"].get<std::string>();
    return {};
}

bool persist_default_agent(const Config& config, const std::string& agent_name) {
    return modify_json_file(config.general_path(), [&](nlohmann::json& j) {
        j["default_agent"] = agent_name;
    });
}

} // namespace agentsh
