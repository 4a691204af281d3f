#pragma once
#include "agent.hpp"
#include "command_registry.hpp"
#include "config.hpp"
#include "line_reader.hpp"
#include "output.hpp"
#include <functional>
#include <memory>
#include <string>

namespace agentsh {

// Builds an agent by name; throws std::exception subclasses on failure
using AgentLoader = std::function<std::unique_ptr<Agent>(const std::string& name)>;

// State shared by every command for the life of the shell: the active
// agent plus the I/O and configuration the handlers need. Passed by
// reference; there is exactly one per process.
class Session {
public:
    Session(Config config, AgentLoader loader, Output& out, LineReader& input);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Agent* agent() const { return agent_.get(); }
    bool has_agent() const { return agent_ != nullptr; }

    // Prints `message` and returns false when no agent is loaded
    bool require_agent(const std::string& message = "No agent loaded.");

    // On success the new agent replaces the old one outright. On failure
    // the current agent is kept.
    CommandResult load_agent(const std::string& name);

    // Initializes the agent's model provider if it is not ready yet
    void ensure_model_ready();

    void request_exit() { exit_requested_ = true; }
    bool exit_requested() const { return exit_requested_; }

    const Config& config() const { return config_; }
    Output& out() { return out_; }
    LineReader& input() { return input_; }

private:
    Config config_;
    AgentLoader loader_;
    Output& out_;
    LineReader& input_;
    std::unique_ptr<Agent> agent_;
    bool exit_requested_ = false;
};

} // namespace agentsh
