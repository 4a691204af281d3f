#pragma once
#include <string>
#include <memory>
#include <nlohmann/json.hpp>

namespace agentsh {

class HttpClient; // forward declaration
struct Config;

// Abstract base class for LLM providers
class Provider {
public:
    virtual ~Provider() = default;

    virtual std::string chat_simple(const std::string& system_prompt,
                                    const std::string& message,
                                    const std::string& model,
                                    double temperature) = 0;

    virtual std::string provider_name() const = 0;
};

// Which provider/model an agent or connection talks to
struct ModelSettings {
    std::string provider = "echo";
    std::string model;
    double temperature = 0.7;
    std::string base_url; // empty = config / provider default
};

// Reads provider, model, temperature, base_url; absent keys keep defaults
ModelSettings model_settings_from_json(const nlohmann::json& j);

// Factory: create provider by name through the plugin registry.
// Throws std::invalid_argument for unknown names.
std::unique_ptr<Provider> create_provider(const std::string& name,
                                          HttpClient& http,
                                          const std::string& base_url = "");

// create_provider() with the base URL filled in from config
std::unique_ptr<Provider> create_provider(const ModelSettings& settings,
                                          const Config& config,
                                          HttpClient& http);

} // namespace agentsh
