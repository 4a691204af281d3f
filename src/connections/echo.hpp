#pragma once
#include "../connection.hpp"

namespace agentsh {

// Local connection with no credentials; useful for wiring up tasks
class EchoConnection : public Connection {
public:
    std::string connection_name() const override { return "echo"; }
    std::vector<ActionSpec> actions() const override;
    bool is_configured() const override { return true; }
    std::string configure() override;
    ActionResult perform(const std::string& action,
                         const std::vector<std::string>& params) override;
};

} // namespace agentsh
