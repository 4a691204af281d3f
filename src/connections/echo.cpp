#include "echo.hpp"
#include "../plugin.hpp"
#include "../util.hpp"

static agentsh::ConnectionRegistrar reg_echo("echo",
    [](const nlohmann::json&, const agentsh::Config&, agentsh::HttpClient&) {
        return std::make_unique<agentsh::EchoConnection>();
    });

namespace agentsh {

std::vector<ActionSpec> EchoConnection::actions() const {
    return {
        {"echo", "Repeat the given text", {{"text", true, "Text to repeat"}}},
        {"time", "Current UTC time", {}},
    };
}

std::string EchoConnection::configure() {
    return "Connection 'echo' needs no configuration.";
}

ActionResult EchoConnection::perform(const std::string& action,
                                     const std::vector<std::string>& params) {
    if (action == "echo") {
        return ActionResult{true, join(params, " ")};
    }
    if (action == "time") {
        return ActionResult{true, timestamp_now()};
    }
    return ActionResult{false, "Unknown action: " + action};
}

} // namespace agentsh
