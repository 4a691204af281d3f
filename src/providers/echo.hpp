#pragma once
#include "../provider.hpp"
#include <string>

namespace agentsh {

// Offline provider: answers without a model. Default for new agents.
class EchoProvider : public Provider {
public:
    std::string chat_simple(const std::string& system_prompt,
                            const std::string& message,
                            const std::string& model,
                            double temperature) override;

    std::string provider_name() const override { return "echo"; }
};

} // namespace agentsh
