#pragma once
#include "commands.hpp"
#include "dispatcher.hpp"
#include "mock_agent.hpp"
#include "mock_line_reader.hpp"
#include "output.hpp"
#include "session.hpp"
#include <sstream>

namespace agentsh {

// Registry + session + dispatcher wired to string streams and mocks
struct TestShell {
    std::ostringstream out;
    std::ostringstream err;
    Output output{out, err};
    MockLineReader input;
    MockAgentFactory agents;
    CommandRegistry registry;
    Session session;
    Dispatcher dispatcher;

    explicit TestShell(Config config = Config{})
        : session(std::move(config), agents.loader(), output, input),
          dispatcher(registry, session) {
        register_builtin_commands(registry);
    }

    DispatchStatus run(const std::string& line) { return dispatcher.handle(line); }

    void clear_output() {
        out.str("");
        err.str("");
    }
};

} // namespace agentsh
