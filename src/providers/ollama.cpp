#include "ollama.hpp"
#include "../plugin.hpp"
#include <stdexcept>

static agentsh::ProviderRegistrar reg_ollama("ollama",
    [](agentsh::HttpClient& http, const std::string& base_url) {
        return std::make_unique<agentsh::OllamaProvider>(
            http, base_url.empty() ? agentsh::kOllamaDefaultUrl : base_url);
    });

using json = nlohmann::json;

namespace agentsh {

OllamaProvider::OllamaProvider(HttpClient& http, std::string base_url)
    : http_(http), base_url_(std::move(base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

json OllamaProvider::build_request(const std::string& system_prompt,
                                   const std::string& message,
                                   const std::string& model,
                                   double temperature) {
    json messages = json::array();
    if (!system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", system_prompt}});
    }
    messages.push_back({{"role", "user"}, {"content", message}});

    return {
        {"model", model},
        {"stream", false},
        {"options", {{"temperature", temperature}}},
        {"messages", messages},
    };
}

std::string OllamaProvider::chat_simple(const std::string& system_prompt,
                                        const std::string& message,
                                        const std::string& model,
                                        double temperature) {
    auto body = build_request(system_prompt, message, model, temperature).dump();
    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    auto response = http_.post(base_url_ + "/api/chat", body, headers);

    if (response.status_code == 0) {
        throw std::runtime_error("Ollama request failed: " +
            (response.error.empty() ? std::string("no response") : response.error));
    }
    if (!response.ok()) {
        throw std::runtime_error("Ollama API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }

    json parsed = json::parse(response.body, nullptr, false);
    if (parsed.is_discarded()) {
        throw std::runtime_error("Ollama returned invalid JSON");
    }
    const auto& msg = parsed.value("message", json::object());
    if (msg.is_object() && msg.contains("content") && msg["content"].is_string()) {
        return msg["content"].get<std::string>();
    }
    return "";
}

} // namespace agentsh
