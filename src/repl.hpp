#pragma once
#include "command_registry.hpp"
#include "dispatcher.hpp"
#include "history.hpp"
#include "session.hpp"
#include <string>

namespace agentsh {

// Interactive read-dispatch loop over a Session
class Repl {
public:
    // history may be null (nothing recorded)
    Repl(const CommandRegistry& registry, Session& session, History* history = nullptr);

    // Banner, default agent, then loop until exit or end of input.
    // Returns the process exit status (always 0).
    int run();

    // Loads the startup agent if one was set, else the one named in
    // general.json. Failures only warn.
    void load_default_agent();

    // Overrides general.json for this run
    void set_startup_agent(const std::string& name) { startup_agent_ = name; }

    std::string prompt() const;

private:
    Session& session_;
    Dispatcher dispatcher_;
    History* history_;
    std::string startup_agent_;
    bool history_warned_ = false;
};

} // namespace agentsh
