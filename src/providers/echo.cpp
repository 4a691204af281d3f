#include "echo.hpp"
#include "../plugin.hpp"

static agentsh::ProviderRegistrar reg_echo("echo",
    [](agentsh::HttpClient&, const std::string&) {
        return std::make_unique<agentsh::EchoProvider>();
    });

namespace agentsh {

std::string EchoProvider::chat_simple(const std::string& /* system_prompt */,
                                      const std::string& message,
                                      const std::string& /* model */,
                                      double /* temperature */) {
    return "LLM response to: " + message;
}

} // namespace agentsh
