#pragma once
#include "command_registry.hpp"
#include "session.hpp"
#include <string>
#include <vector>

namespace agentsh {

enum class DispatchStatus {
    Empty,      // nothing but whitespace
    Ok,         // handler ran and succeeded
    Failed,     // handler reported or threw an error (already logged)
    ParseError, // bad quoting; nothing dispatched
    Unknown,    // no such command; suggestions printed
};

// Turns one input line into a command invocation
class Dispatcher {
public:
    Dispatcher(const CommandRegistry& registry, Session& session);

    DispatchStatus handle(const std::string& line);

    // Close registry keys for an unrecognized token
    std::vector<std::string> suggestions_for(const std::string& token) const;

private:
    void report_unknown(const std::string& token);

    const CommandRegistry& registry_;
    Session& session_;
};

} // namespace agentsh
