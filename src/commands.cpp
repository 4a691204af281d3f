#include "commands.hpp"
#include "interrupt.hpp"
#include "output.hpp"
#include "session.hpp"
#include "util.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace agentsh {

void print_welcome(Output& out) {
    out.rule();
    out.info("Welcome to the agentsh CLI!");
    out.info("Type 'help' to list commands.");
    out.rule();
}

void exit_session(Session& session) {
    session.out().info("Goodbye!");
    session.request_exit();
}

// ── General ─────────────────────────────────────────────────────

CommandResult cmd_help(const Args& args, Session& session, const CommandRegistry& registry) {
    auto& out = session.out();
    if (args.size() > 1) {
        const Command* cmd = registry.resolve(args[1]);
        if (!cmd) {
            out.warn("Command not found.");
            return CommandResult::ok();
        }
        out.info(cmd->name + ": " + cmd->description);
        if (!cmd->aliases.empty()) {
            out.info("  aliases: " + join(cmd->aliases, ", "));
        }
        for (const auto& tip : cmd->tips) {
            out.info("  - " + tip);
        }
        return CommandResult::ok();
    }

    out.info("Commands:");
    for (const Command* cmd : registry.list()) {
        std::string name = cmd->name;
        if (name.size() < 20) name.append(20 - name.size(), ' ');
        out.info("  " + name + " - " + cmd->description);
    }
    return CommandResult::ok();
}

CommandResult cmd_clear(const Args&, Session& session) {
    // Escapes would only litter a pipe or log file
    if (session.out().terminal()) session.out().write("\033[2J\033[H");
    print_welcome(session.out());
    return CommandResult::ok();
}

CommandResult cmd_exit(const Args&, Session& session) {
    exit_session(session);
    return CommandResult::ok();
}

// ── Agent management ────────────────────────────────────────────

CommandResult cmd_list_agents(const Args&, Session& session) {
    namespace fs = std::filesystem;
    const std::string& dir = session.config().agents_dir;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return CommandResult::fail("Agents directory not found: " + dir);
    }

    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        const auto& p = entry.path();
        if (p.extension() != ".json" || p.stem() == "general") continue;
        names.push_back(p.stem().string());
    }
    if (ec) {
        return CommandResult::fail("Cannot read " + dir + ": " + ec.message());
    }
    std::sort(names.begin(), names.end());

    auto& out = session.out();
    if (names.empty()) {
        out.info("No agents found in " + dir);
        return CommandResult::ok();
    }
    out.info("Available agents:");
    for (const auto& name : names) {
        out.info("- " + name);
    }
    return CommandResult::ok();
}

CommandResult cmd_load_agent(const Args& args, Session& session) {
    if (args.size() < 2) {
        session.out().info("Usage: load-agent <agent_name>");
        return CommandResult::ok();
    }
    return session.load_agent(args[1]);
}

CommandResult cmd_create_agent(const Args&, Session& session) {
    session.out().info("Manual creation: add a .json file in the " +
                       session.config().agents_dir + "/ folder.");
    return CommandResult::ok();
}

CommandResult cmd_set_default_agent(const Args& args, Session& session) {
    if (args.size() < 2) {
        session.out().info("Usage: set-default-agent <agent_name>");
        return CommandResult::ok();
    }
    if (!persist_default_agent(session.config(), args[1])) {
        return CommandResult::fail("Error updating default agent in " +
                                   session.config().general_path());
    }
    session.out().success("Default agent set to " + args[1]);
    return CommandResult::ok();
}

// ── Agent operations ────────────────────────────────────────────

CommandResult cmd_agent_action(const Args& args, Session& session) {
    if (!session.require_agent()) return CommandResult::ok();
    if (args.size() < 3) {
        session.out().info("Usage: agent-action <connection> <action> [params...]");
        return CommandResult::ok();
    }
    std::vector<std::string> params(args.begin() + 3, args.end());
    auto result = session.agent()->perform_action(args[1], args[2], params);
    if (!result.success) {
        return CommandResult::fail(result.output);
    }
    session.out().info("Result: " + result.output);
    return CommandResult::ok();
}

CommandResult cmd_agent_loop(const Args&, Session& session) {
    if (!session.require_agent()) return CommandResult::ok();
    clear_interrupt();
    session.agent()->run_loop(interrupt_flag(), session.out());
    if (interrupt_requested()) {
        clear_interrupt();
        session.out().info("Stopped.");
    }
    return CommandResult::ok();
}

CommandResult cmd_chat(const Args&, Session& session) {
    if (!session.require_agent("Load an agent first.")) return CommandResult::ok();
    session.ensure_model_ready();

    auto& out = session.out();
    Agent& agent = *session.agent();
    out.rule();
    out.info("Chatting with " + agent.name());
    out.rule();

    while (true) {
        auto read = session.input().read_line("\nYou: ");
        if (read.status != ReadStatus::Line) break;
        std::string message = trim(read.line);
        if (message.empty()) continue;
        if (to_lower(message) == "exit") break;

        std::string reply;
        try {
            reply = agent.prompt_model(message);
        } catch (const std::exception&) {
            // Ctrl+C aborts the request in flight; that ends the chat
            if (!interrupt_requested()) throw;
            clear_interrupt();
            out.info("");
            break;
        }
        out.info(agent.name() + ": " + reply);
        out.rule();
    }
    return CommandResult::ok();
}

// ── Connections ─────────────────────────────────────────────────

CommandResult cmd_list_actions(const Args& args, Session& session) {
    if (!session.require_agent()) return CommandResult::ok();
    if (args.size() < 2) {
        session.out().info("Usage: list-actions <connection>");
        return CommandResult::ok();
    }
    session.out().info(session.agent()->connections().list_actions(args[1]));
    return CommandResult::ok();
}

CommandResult cmd_configure_connection(const Args& args, Session& session) {
    if (!session.require_agent()) return CommandResult::ok();
    if (args.size() < 2) {
        session.out().info("Usage: configure-connection <connection>");
        return CommandResult::ok();
    }
    session.out().info(session.agent()->connections().configure_connection(args[1]));
    return CommandResult::ok();
}

CommandResult cmd_list_connections(const Args&, Session& session) {
    if (!session.require_agent()) return CommandResult::ok();
    session.out().info(session.agent()->connections().list_connections());
    return CommandResult::ok();
}

// ── Registration ────────────────────────────────────────────────

void register_builtin_commands(CommandRegistry& registry) {
    registry.add({"help", "Show help for commands",
                  {"help", "help load-agent"},
                  [&registry](const Args& args, Session& session) {
                      return cmd_help(args, session, registry);
                  },
                  {"h", "?"}});
    registry.add({"clear", "Clear the terminal screen",
                  {"clear"}, cmd_clear, {"cls"}});
    registry.add({"agent-action", "Run a single agent action",
                  {"agent-action <connection> <action> [params...]",
                   "agent-action echo echo hello"},
                  cmd_agent_action, {"action", "run"}});
    registry.add({"agent-loop", "Start the agent loop (Ctrl+C to stop)",
                  {"agent-loop"}, cmd_agent_loop, {"loop", "start"}});
    registry.add({"list-agents", "List available agents",
                  {"list-agents"}, cmd_list_agents, {"agents", "ls-agents"}});
    registry.add({"load-agent", "Load an agent",
                  {"load-agent <agent_name>", "load-agent example"},
                  cmd_load_agent, {"load"}});
    registry.add({"create-agent", "Create a new agent",
                  {"create-agent"}, cmd_create_agent, {"new-agent", "create"}});
    registry.add({"set-default-agent", "Set the agent loaded at startup",
                  {"set-default-agent <agent_name>", "default example"},
                  cmd_set_default_agent, {"default"}});
    registry.add({"chat", "Start a chat session with the agent",
                  {"chat", "type 'exit' to leave the chat"},
                  cmd_chat, {"talk"}});
    registry.add({"list-actions", "List actions for a connection",
                  {"list-actions <connection>", "list-actions llm"},
                  cmd_list_actions, {"actions", "ls-actions"}});
    registry.add({"configure-connection", "Configure a connection",
                  {"configure-connection <connection>", "configure-connection llm"},
                  cmd_configure_connection, {"config", "setup"}});
    registry.add({"list-connections", "List the agent's connections",
                  {"list-connections"}, cmd_list_connections,
                  {"connections", "ls-connections"}});
    registry.add({"exit", "Exit the CLI",
                  {"exit"}, cmd_exit, {"quit", "q"}});
}

} // namespace agentsh
