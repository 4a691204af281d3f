#pragma once
#include "command_registry.hpp"
#include <string>
#include <vector>

namespace agentsh {

class Output;
class Session;

using Args = std::vector<std::string>;

// Adds the full built-in command table. Throws std::invalid_argument if a
// name or alias clashes with something already in `registry`.
void register_builtin_commands(CommandRegistry& registry);

// Banner shown at startup and after `clear`
void print_welcome(Output& out);

// Shared by the exit command and end of input
void exit_session(Session& session);

// Command handlers. args[0] is the command token as typed.
CommandResult cmd_help(const Args& args, Session& session, const CommandRegistry& registry);
CommandResult cmd_clear(const Args& args, Session& session);
CommandResult cmd_agent_action(const Args& args, Session& session);
CommandResult cmd_agent_loop(const Args& args, Session& session);
CommandResult cmd_list_agents(const Args& args, Session& session);
CommandResult cmd_load_agent(const Args& args, Session& session);
CommandResult cmd_create_agent(const Args& args, Session& session);
CommandResult cmd_set_default_agent(const Args& args, Session& session);
CommandResult cmd_chat(const Args& args, Session& session);
CommandResult cmd_list_actions(const Args& args, Session& session);
CommandResult cmd_configure_connection(const Args& args, Session& session);
CommandResult cmd_list_connections(const Args& args, Session& session);
CommandResult cmd_exit(const Args& args, Session& session);

} // namespace agentsh
