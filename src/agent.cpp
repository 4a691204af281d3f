#include "agent.hpp"
#include "output.hpp"
#include "plugin.hpp"
#include "util.hpp"

#include <chrono>
#include <fstream>
#include <limits>
#include <random>
#include <stdexcept>
#include <thread>

namespace agentsh {

static std::vector<std::string> string_array(const nlohmann::json& j,
                                             const std::string& field) {
    std::vector<std::string> out;
    if (!j.is_array()) {
        throw std::runtime_error("'" + field + "' must be an array of strings");
    }
    for (const auto& item : j) {
        if (!item.is_string()) {
            throw std::runtime_error("'" + field + "' must be an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

AgentDefinition AgentDefinition::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("agent definition must be a JSON object");
    }

    AgentDefinition def;
    if (!j.contains("name") || !j["name"].is_string() ||
        j["name"].get<std::string>().empty()) {
        throw std::runtime_error("agent definition is missing 'name'");
    }
    def.name = j["name"].get<std::string>();

    if (j.contains("bio"))
        def.bio = string_array(j["bio"], "bio");
    if (j.contains("loop_delay")) {
        // Non-negative integers parse as unsigned; negatives and fractions do not
        const auto& delay = j["loop_delay"];
        if (!delay.is_number_unsigned() ||
            delay.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
            throw std::runtime_error("'loop_delay' must be a whole number of seconds");
        }
        def.loop_delay = static_cast<uint32_t>(delay.get<uint64_t>());
    }
    if (j.contains("model"))
        def.model = model_settings_from_json(j["model"]);

    if (j.contains("connections")) {
        if (!j["connections"].is_array()) {
            throw std::runtime_error("'connections' must be an array");
        }
        for (const auto& c : j["connections"]) {
            if (!c.is_object() || !c.contains("name") || !c["name"].is_string()) {
                throw std::runtime_error("each connection needs a 'name'");
            }
            def.connections.push_back(c);
        }
    }

    if (j.contains("tasks")) {
        if (!j["tasks"].is_array()) {
            throw std::runtime_error("'tasks' must be an array");
        }
        for (const auto& t : j["tasks"]) {
            if (!t.is_object() || !t.contains("connection") || !t["connection"].is_string() ||
                !t.contains("action") || !t["action"].is_string()) {
                throw std::runtime_error("each task needs 'connection' and 'action'");
            }
            AgentTask task;
            task.connection = t["connection"].get<std::string>();
            task.action = t["action"].get<std::string>();
            if (t.contains("params"))
                task.params = string_array(t["params"], "params");
            if (t.contains("weight")) {
                if (!t["weight"].is_number() || t["weight"].get<double>() <= 0.0) {
                    throw std::runtime_error("task weight must be a positive number");
                }
                task.weight = t["weight"].get<double>();
            }
            def.tasks.push_back(std::move(task));
        }
    }
    return def;
}

AgentDefinition load_agent_definition(const std::string& agents_dir,
                                      const std::string& name) {
    std::string path = agents_dir + "/" + name + ".json";
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("agent file not found: " + path);
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
    try {
        return AgentDefinition::from_json(j);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

// ── ConfiguredAgent ─────────────────────────────────────────────

ConfiguredAgent::ConfiguredAgent(AgentDefinition definition, const Config& config,
                                 HttpClient& http)
    : definition_(std::move(definition)), config_(config), http_(http) {
    auto& registry = PluginRegistry::instance();
    for (const auto& settings : definition_.connections) {
        auto conn_name = settings["name"].get<std::string>();
        connections_.add(registry.create_connection(conn_name, settings, config_, http_));
    }
    for (const auto& task : definition_.tasks) {
        if (!connections_.find(task.connection)) {
            throw std::invalid_argument("task uses unknown connection: " + task.connection);
        }
    }
}

ActionResult ConfiguredAgent::perform_action(const std::string& connection,
                                             const std::string& action,
                                             const std::vector<std::string>& params) {
    return connections_.perform_action(connection, action, params);
}

std::string ConfiguredAgent::system_prompt() const {
    return join(definition_.bio, "\n");
}

void ConfiguredAgent::initialize_model_provider() {
    if (provider_) return;
    provider_ = create_provider(definition_.model, config_, http_);
}

std::string ConfiguredAgent::prompt_model(const std::string& text) {
    initialize_model_provider();
    return provider_->chat_simple(system_prompt(), text, definition_.model.model,
                                  definition_.model.temperature);
}

void ConfiguredAgent::run_loop(const std::atomic<bool>& stop, Output& out) {
    out.info("Running agent loop... (Ctrl+C to stop)");
    if (definition_.tasks.empty()) {
        out.warn("Agent '" + definition_.name + "' has no tasks.");
        return;
    }

    std::vector<double> weights;
    weights.reserve(definition_.tasks.size());
    for (const auto& task : definition_.tasks) {
        weights.push_back(task.weight);
    }
    std::mt19937 gen(std::random_device{}());
    std::discrete_distribution<size_t> pick(weights.begin(), weights.end());

    constexpr auto kSlice = std::chrono::milliseconds(100);
    while (!stop.load()) {
        const auto& task = definition_.tasks[pick(gen)];
        auto result = perform_action(task.connection, task.action, task.params);
        std::string label = "[" + task.connection + "." + task.action + "] ";
        if (result.success) {
            out.info(label + result.output);
        } else {
            out.warn(label + result.output);
        }

        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::seconds(definition_.loop_delay);
        while (!stop.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kSlice);
        }
    }
}

std::unique_ptr<Agent> load_configured_agent(const std::string& name,
                                             const Config& config,
                                             HttpClient& http) {
    auto definition = load_agent_definition(config.agents_dir, name);
    return std::make_unique<ConfiguredAgent>(std::move(definition), config, http);
}

} // namespace agentsh
