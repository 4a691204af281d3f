#include "provider.hpp"
#include "plugin.hpp"
#include "config.hpp"

namespace agentsh {

ModelSettings model_settings_from_json(const nlohmann::json& j) {
    ModelSettings s;
    if (!j.is_object()) return s;
    if (j.contains("provider") && j["provider"].is_string())
        s.provider = j["provider"].get<std::string>();
    if (j.contains("model") && j["model"].is_string())
        s.model = j["model"].get<std::string>();
    if (j.contains("temperature") && j["temperature"].is_number())
        s.temperature = j["temperature"].get<double>();
    if (j.contains("base_url") && j["base_url"].is_string())
        s.base_url = j["base_url"].get<std::string>();
    return s;
}

std::unique_ptr<Provider> create_provider(const std::string& name,
                                           HttpClient& http,
                                           const std::string& base_url) {
    return PluginRegistry::instance().create_provider(name, http, base_url);
}

std::unique_ptr<Provider> create_provider(const ModelSettings& settings,
                                          const Config& config,
                                          HttpClient& http) {
    std::string base_url = settings.base_url.empty()
        ? config.base_url_for(settings.provider) : settings.base_url;
    return create_provider(settings.provider, http, base_url);
}

} // namespace agentsh
