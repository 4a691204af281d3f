#pragma once
#include "agent.hpp"
#include "interrupt.hpp"
#include "output.hpp"
#include "session.hpp"
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace agentsh {

class MockConnection : public Connection {
public:
    explicit MockConnection(std::string name) : name_(std::move(name)) {}

    int configure_calls = 0;

    std::string connection_name() const override { return name_; }
    std::vector<ActionSpec> actions() const override {
        return {{"post", "Post a message", {{"text", true, "Message"}}}};
    }
    bool is_configured() const override { return configure_calls > 0; }
    std::string configure() override {
        configure_calls++;
        return "Configured " + name_;
    }
    ActionResult perform(const std::string& action,
                         const std::vector<std::string>& params) override {
        return ActionResult{true, action + ":" + (params.empty() ? "" : params[0])};
    }

private:
    std::string name_;
};

class MockAgent : public Agent {
public:
    explicit MockAgent(std::string name) : name_(std::move(name)) {
        manager.add(std::make_unique<MockConnection>("twitter"));
    }

    bool model_ready = true;
    bool interrupt_loop = true; // simulate Ctrl+C while looping
    bool interrupt_prompt = false; // simulate Ctrl+C during a model request
    bool fail_prompt = false;
    int init_calls = 0;
    int loop_calls = 0;
    int action_calls = 0;
    std::vector<std::string> prompts;
    ConnectionManager manager;

    std::string name() const override { return name_; }

    ActionResult perform_action(const std::string& connection,
                                const std::string& action,
                                const std::vector<std::string>& params) override {
        action_calls++;
        std::string list;
        for (size_t i = 0; i < params.size(); ++i) {
            if (i > 0) list += ", ";
            list += "'" + params[i] + "'";
        }
        return ActionResult{true, "Performed action '" + action + "' on connection '" +
                                  connection + "' with params [" + list + "]"};
    }

    void run_loop(const std::atomic<bool>& stop, Output& out) override {
        loop_calls++;
        out.info("looping");
        if (interrupt_loop) raise_interrupt();
        (void)stop;
    }

    std::string prompt_model(const std::string& text) override {
        prompts.push_back(text);
        if (interrupt_prompt) {
            raise_interrupt();
            throw std::runtime_error("Ollama request failed: request cancelled");
        }
        if (fail_prompt) {
            throw std::runtime_error("Ollama API error (HTTP 500): boom");
        }
        return "LLM response to: " + text;
    }

    bool is_model_ready() const override { return model_ready; }
    void initialize_model_provider() override {
        init_calls++;
        model_ready = true;
    }

    ConnectionManager& connections() override { return manager; }

private:
    std::string name_;
};

// Loader that hands out MockAgents and remembers the last one
struct MockAgentFactory {
    std::vector<std::string> requested;
    std::set<std::string> missing;
    MockAgent* last = nullptr;
    bool next_model_ready = true;

    AgentLoader loader() {
        return [this](const std::string& name) -> std::unique_ptr<Agent> {
            requested.push_back(name);
            if (missing.count(name)) {
                throw std::runtime_error("agent file not found: " + name);
            }
            auto agent = std::make_unique<MockAgent>(name);
            agent->model_ready = next_model_ready;
            last = agent.get();
            return agent;
        };
    }
};

} // namespace agentsh
