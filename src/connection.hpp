#pragma once
#include <string>
#include <memory>
#include <vector>

namespace agentsh {

struct ActionParameter {
    std::string name;
    bool required = true;
    std::string description;
};

struct ActionSpec {
    std::string name;
    std::string description;
    std::vector<ActionParameter> parameters;

    size_t required_count() const;
};

struct ActionResult {
    bool success;
    std::string output;
};

// An external service an agent can act on (an LLM endpoint, a social
// account, ...). Actions take positional string parameters.
class Connection {
public:
    virtual ~Connection() = default;
    virtual std::string connection_name() const = 0;
    virtual std::vector<ActionSpec> actions() const = 0;
    virtual bool is_configured() const = 0;

    // Returns a human-readable status line
    virtual std::string configure() = 0;

    // Parameters have already been checked against the action's spec
    virtual ActionResult perform(const std::string& action,
                                 const std::vector<std::string>& params) = 0;
};

// Owns an agent's connections and routes actions to them
class ConnectionManager {
public:
    ConnectionManager() = default;

    void add(std::unique_ptr<Connection> connection);
    Connection* find(const std::string& name) const;
    size_t size() const { return connections_.size(); }

    std::string list_connections() const;
    std::string list_actions(const std::string& name) const;
    std::string configure_connection(const std::string& name);

    ActionResult perform_action(const std::string& connection,
                                const std::string& action,
                                const std::vector<std::string>& params);

private:
    std::vector<std::unique_ptr<Connection>> connections_;
};

} // namespace agentsh
