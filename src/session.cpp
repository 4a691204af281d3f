#include "session.hpp"

namespace agentsh {

Session::Session(Config config, AgentLoader loader, Output& out, LineReader& input)
    : config_(std::move(config)), loader_(std::move(loader)), out_(out), input_(input) {}

bool Session::require_agent(const std::string& message) {
    if (agent_) return true;
    out_.info(message);
    return false;
}

CommandResult Session::load_agent(const std::string& name) {
    std::unique_ptr<Agent> loaded;
    try {
        loaded = loader_(name);
    } catch (const std::exception& e) {
        return CommandResult::fail("Could not load agent: " + std::string(e.what()));
    }
    if (!loaded) {
        return CommandResult::fail("Could not load agent: " + name);
    }
    agent_ = std::move(loaded);
    out_.success("Loaded agent: " + agent_->name());
    return CommandResult::ok();
}

void Session::ensure_model_ready() {
    if (agent_ && !agent_->is_model_ready()) {
        agent_->initialize_model_provider();
    }
}

} // namespace agentsh
