#include "agent.hpp"
#include "command_registry.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "history.hpp"
#include "http.hpp"
#include "interrupt.hpp"
#include "line_reader.hpp"
#include "output.hpp"
#include "repl.hpp"
#include "session.hpp"
#include "util.hpp"
#include <cstring>
#include <iostream>
#include <string>

static void print_usage() {
    std::cout << "Usage: agentsh [options]\n"
              << "\n"
              << "Options:\n"
              << "  --agents-dir DIR     Directory holding agent definitions (default: agents)\n"
              << "  --agent NAME         Load this agent instead of the default\n"
              << "  --no-color           Disable colored output\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Type 'help' inside the shell for the command list.\n"
              << "\n"
              << "Environment variables:\n"
              << "  AGENTSH_AGENTS_DIR   Agents directory\n"
              << "  AGENTSH_HISTORY_FILE Line history file (default: ~/.agentsh/history)\n"
              << "  OLLAMA_BASE_URL      Base URL for Ollama (default: http://localhost:11434)\n";
}

int main(int argc, char* argv[]) try {
    std::string agents_dir;
    std::string agent_name;
    bool no_color = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--agents-dir") == 0 && i + 1 < argc) {
            agents_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--agent") == 0 && i + 1 < argc) {
            agent_name = argv[++i];
        } else if (std::strcmp(argv[i], "--no-color") == 0) {
            no_color = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = agentsh::Config::load();
    if (!agents_dir.empty()) {
        config.agents_dir = agentsh::expand_home(agents_dir);
    }

    agentsh::http_init();
    agentsh::install_interrupt_handler();
    agentsh::http_set_abort_flag(&agentsh::interrupt_flag());

    agentsh::CommandRegistry registry;
    agentsh::register_builtin_commands(registry);

    agentsh::CurlHttpClient http_client;
    bool tty = agentsh::stdout_is_tty();
    agentsh::Output out(std::cout, std::cerr, config.color && !no_color && tty, tty);
    agentsh::StdinLineReader input;
    agentsh::History history(config.history_file);

    agentsh::Session session(config,
        [&config, &http_client](const std::string& name) {
            return agentsh::load_configured_agent(name, config, http_client);
        },
        out, input);

    agentsh::Repl repl(registry, session, &history);
    if (!agent_name.empty()) {
        repl.set_startup_agent(agent_name);
    }
    int rc = repl.run();

    agentsh::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
