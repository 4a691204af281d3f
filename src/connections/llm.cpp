#include "llm.hpp"
#include "../plugin.hpp"
#include <stdexcept>

static agentsh::ConnectionRegistrar reg_llm("llm",
    [](const nlohmann::json& settings, const agentsh::Config& config,
       agentsh::HttpClient& http) {
        return std::make_unique<agentsh::LlmConnection>(
            agentsh::model_settings_from_json(settings), config, http);
    });

namespace agentsh {

LlmConnection::LlmConnection(ModelSettings settings, const Config& config, HttpClient& http)
    : settings_(std::move(settings)), config_(config), http_(http) {}

std::vector<ActionSpec> LlmConnection::actions() const {
    return {
        {"generate-text", "Generate text from a prompt",
         {{"prompt", true, "User prompt"},
          {"system_prompt", false, "System prompt"}}},
    };
}

std::string LlmConnection::configure() {
    try {
        provider_ = create_provider(settings_, config_, http_);
    } catch (const std::invalid_argument& e) {
        return "Cannot configure 'llm': " + std::string(e.what());
    }
    return "Connection 'llm' configured with provider '" + settings_.provider + "'.";
}

ActionResult LlmConnection::perform(const std::string& action,
                                    const std::vector<std::string>& params) {
    if (action != "generate-text") {
        return ActionResult{false, "Unknown action: " + action};
    }
    if (params.empty()) {
        return ActionResult{false, "Missing required parameter: prompt"};
    }
    if (!provider_) {
        std::string status = configure();
        if (!provider_) return ActionResult{false, status};
    }
    std::string system_prompt = params.size() > 1 ? params[1] : "";
    try {
        return ActionResult{true, provider_->chat_simple(system_prompt, params[0],
                                                          settings_.model,
                                                          settings_.temperature)};
    } catch (const std::exception& e) {
        return ActionResult{false, e.what()};
    }
}

} // namespace agentsh
