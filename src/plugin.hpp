#pragma once
#include "provider.hpp"
#include "connection.hpp"
#include "http.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <nlohmann/json.hpp>

namespace agentsh {

// Factory function types
using ProviderFactory = std::function<std::unique_ptr<Provider>(
    HttpClient& http, const std::string& base_url)>;

// settings is the connection's object from the agent definition
using ConnectionFactory = std::function<std::unique_ptr<Connection>(
    const nlohmann::json& settings, const Config& config, HttpClient& http)>;

// Central registry for self-registering plugins.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_provider(const std::string& name, ProviderFactory factory);
    void register_connection(const std::string& name, ConnectionFactory factory);

    // Creation. Unknown names throw std::invalid_argument listing the
    // registered alternatives.
    std::unique_ptr<Provider> create_provider(const std::string& name,
                                              HttpClient& http,
                                              const std::string& base_url) const;

    std::unique_ptr<Connection> create_connection(const std::string& name,
                                                  const nlohmann::json& settings,
                                                  const Config& config,
                                                  HttpClient& http) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
    std::unordered_map<std::string, ConnectionFactory> connections_;
};

// ── Self-registrar helpers (used at file scope in each plugin .cpp) ──

struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(name, std::move(factory));
    }
};

struct ConnectionRegistrar {
    ConnectionRegistrar(const std::string& name, ConnectionFactory factory) {
        PluginRegistry::instance().register_connection(name, std::move(factory));
    }
};

} // namespace agentsh
