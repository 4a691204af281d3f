#include "connection.hpp"
#include <stdexcept>

namespace agentsh {

size_t ActionSpec::required_count() const {
    size_t n = 0;
    for (const auto& p : parameters) {
        if (p.required) ++n;
    }
    return n;
}

void ConnectionManager::add(std::unique_ptr<Connection> connection) {
    if (find(connection->connection_name())) {
        throw std::invalid_argument("Duplicate connection: " +
                                    connection->connection_name());
    }
    connections_.push_back(std::move(connection));
}

Connection* ConnectionManager::find(const std::string& name) const {
    for (const auto& c : connections_) {
        if (c->connection_name() == name) return c.get();
    }
    return nullptr;
}

std::string ConnectionManager::list_connections() const {
    std::string out = "Available connections:";
    if (connections_.empty()) {
        return out + "\n  (none)";
    }
    for (const auto& c : connections_) {
        out += "\n  - " + c->connection_name();
        out += c->is_configured() ? " (configured)" : " (not configured)";
    }
    return out;
}

std::string ConnectionManager::list_actions(const std::string& name) const {
    Connection* conn = find(name);
    if (!conn) return "Unknown connection: " + name;

    std::string out = "Available actions for connection '" + name + "':";
    auto specs = conn->actions();
    if (specs.empty()) {
        return out + "\n  (none)";
    }
    for (const auto& spec : specs) {
        out += "\n  - " + spec.name + "(";
        for (size_t i = 0; i < spec.parameters.size(); ++i) {
            if (i > 0) out += ", ";
            out += spec.parameters[i].name;
            if (!spec.parameters[i].required) out += "?";
        }
        out += "): " + spec.description;
    }
    return out;
}

std::string ConnectionManager::configure_connection(const std::string& name) {
    Connection* conn = find(name);
    if (!conn) return "Unknown connection: " + name;
    return conn->configure();
}

ActionResult ConnectionManager::perform_action(const std::string& connection,
                                               const std::string& action,
                                               const std::vector<std::string>& params) {
    Connection* conn = find(connection);
    if (!conn) {
        return ActionResult{false, "Unknown connection: " + connection};
    }

    for (const auto& spec : conn->actions()) {
        if (spec.name != action) continue;
        if (params.size() < spec.required_count()) {
            std::string missing;
            for (size_t i = params.size(); i < spec.parameters.size(); ++i) {
                if (!spec.parameters[i].required) continue;
                if (!missing.empty()) missing += ", ";
                missing += spec.parameters[i].name;
            }
            return ActionResult{false, "Missing required parameters for " + connection +
                                       "." + action + ": " + missing};
        }
        return conn->perform(action, params);
    }
    return ActionResult{false, "Unknown action '" + action + "' for connection '" +
                               connection + "'"};
}

} // namespace agentsh
