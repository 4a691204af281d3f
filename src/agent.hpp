#pragma once
#include "connection.hpp"
#include "provider.hpp"
#include "config.hpp"
#include "http.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentsh {

class Output;

// What the shell needs from an agent. The session owns exactly one.
class Agent {
public:
    virtual ~Agent() = default;

    virtual std::string name() const = 0;

    virtual ActionResult perform_action(const std::string& connection,
                                        const std::string& action,
                                        const std::vector<std::string>& params) = 0;

    // Blocks until `stop` becomes true (or there is nothing to do)
    virtual void run_loop(const std::atomic<bool>& stop, Output& out) = 0;

    virtual std::string prompt_model(const std::string& text) = 0;
    virtual bool is_model_ready() const = 0;
    virtual void initialize_model_provider() = 0;

    virtual ConnectionManager& connections() = 0;
};

struct AgentTask {
    std::string connection;
    std::string action;
    std::vector<std::string> params;
    double weight = 1.0;
};

struct AgentDefinition {
    std::string name;
    std::vector<std::string> bio;
    uint32_t loop_delay = 900; // seconds between tasks
    ModelSettings model;
    std::vector<nlohmann::json> connections; // each has at least "name"
    std::vector<AgentTask> tasks;

    // Throws std::runtime_error on missing/invalid fields
    static AgentDefinition from_json(const nlohmann::json& j);
};

// Reads <agents_dir>/<name>.json. Throws std::runtime_error if the file
// is missing or malformed.
AgentDefinition load_agent_definition(const std::string& agents_dir,
                                      const std::string& name);

// Agent described by a JSON definition file
class ConfiguredAgent : public Agent {
public:
    // Throws std::invalid_argument for unknown connection names
    ConfiguredAgent(AgentDefinition definition, const Config& config, HttpClient& http);

    std::string name() const override { return definition_.name; }

    ActionResult perform_action(const std::string& connection,
                                const std::string& action,
                                const std::vector<std::string>& params) override;

    void run_loop(const std::atomic<bool>& stop, Output& out) override;

    std::string prompt_model(const std::string& text) override;
    bool is_model_ready() const override { return provider_ != nullptr; }
    void initialize_model_provider() override;

    ConnectionManager& connections() override { return connections_; }

    const AgentDefinition& definition() const { return definition_; }
    std::string system_prompt() const;

private:
    AgentDefinition definition_;
    Config config_;
    HttpClient& http_;
    ConnectionManager connections_;
    std::unique_ptr<Provider> provider_;
};

// load_agent_definition() + ConfiguredAgent, as one throwing call
std::unique_ptr<Agent> load_configured_agent(const std::string& name,
                                             const Config& config,
                                             HttpClient& http);

} // namespace agentsh
