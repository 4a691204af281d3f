#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace agentsh {

constexpr const char* kOllamaDefaultUrl = "http://localhost:11434";

// Local models served by Ollama's /api/chat endpoint (non-streaming)
class OllamaProvider : public Provider {
public:
    explicit OllamaProvider(HttpClient& http, std::string base_url = kOllamaDefaultUrl);

    // Throws std::runtime_error on transport failure or a non-2xx status
    std::string chat_simple(const std::string& system_prompt,
                            const std::string& message,
                            const std::string& model,
                            double temperature) override;

    std::string provider_name() const override { return "ollama"; }

    static nlohmann::json build_request(const std::string& system_prompt,
                                        const std::string& message,
                                        const std::string& model,
                                        double temperature);

private:
    HttpClient& http_;
    std::string base_url_;
};

} // namespace agentsh
