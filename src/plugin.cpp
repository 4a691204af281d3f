#include "plugin.hpp"
#include "util.hpp"
#include <stdexcept>
#include <algorithm>

namespace agentsh {

namespace {

template <typename Map>
std::string unknown_message(const char* kind, const std::string& name, const Map& factories) {
    std::vector<std::string> names;
    names.reserve(factories.size());
    for (const auto& entry : factories) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return std::string("Unknown ") + kind + ": " + name + " (available: " + join(names, ", ") + ")";
}

} // namespace

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_provider(const std::string& name, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[name] = std::move(factory);
}

void PluginRegistry::register_connection(const std::string& name, ConnectionFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_[name] = std::move(factory);
}

// Factories are copied out and run unlocked so they may use the registry
// themselves (a connection building its provider, for one).

std::unique_ptr<Provider> PluginRegistry::create_provider(const std::string& name,
                                                           HttpClient& http,
                                                           const std::string& base_url) const {
    ProviderFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = providers_.find(name);
        if (it == providers_.end()) {
            throw std::invalid_argument(unknown_message("provider", name, providers_));
        }
        factory = it->second;
    }
    return factory(http, base_url);
}

std::unique_ptr<Connection> PluginRegistry::create_connection(const std::string& name,
                                                               const nlohmann::json& settings,
                                                               const Config& config,
                                                               HttpClient& http) const {
    ConnectionFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(name);
        if (it == connections_.end()) {
            throw std::invalid_argument(unknown_message("connection", name, connections_));
        }
        factory = it->second;
    }
    return factory(settings, config, http);
}

} // namespace agentsh
