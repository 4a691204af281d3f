#pragma once
#include "../connection.hpp"
#include "../provider.hpp"
#include "../config.hpp"
#include "../http.hpp"
#include <memory>

namespace agentsh {

// Text generation through a model provider
class LlmConnection : public Connection {
public:
    LlmConnection(ModelSettings settings, const Config& config, HttpClient& http);

    std::string connection_name() const override { return "llm"; }
    std::vector<ActionSpec> actions() const override;
    bool is_configured() const override { return provider_ != nullptr; }

    // Creates the provider; reports unknown provider names instead of throwing
    std::string configure() override;

    ActionResult perform(const std::string& action,
                         const std::vector<std::string>& params) override;

    const ModelSettings& settings() const { return settings_; }

private:
    ModelSettings settings_;
    Config config_;
    HttpClient& http_;
    std::unique_ptr<Provider> provider_;
};

} // namespace agentsh
