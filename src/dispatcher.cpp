#include "dispatcher.hpp"
#include "suggest.hpp"
#include "tokenize.hpp"
#include "util.hpp"

namespace agentsh {

Dispatcher::Dispatcher(const CommandRegistry& registry, Session& session)
    : registry_(registry), session_(session) {}

DispatchStatus Dispatcher::handle(const std::string& line) {
    auto parsed = tokenize(line);
    if (!parsed.ok()) {
        session_.out().error("Error: " + parsed.error);
        return DispatchStatus::ParseError;
    }
    if (parsed.tokens.empty()) {
        return DispatchStatus::Empty;
    }

    std::string name = to_lower(parsed.tokens.front());
    const Command* command = registry_.resolve(name);
    if (!command) {
        report_unknown(name);
        return DispatchStatus::Unknown;
    }

    CommandResult result;
    try {
        result = command->handler(parsed.tokens, session_);
    } catch (const std::exception& e) {
        result = CommandResult::fail(e.what());
    }

    if (!result.success) {
        session_.out().error("Error: " + result.error);
        return DispatchStatus::Failed;
    }
    return DispatchStatus::Ok;
}

std::vector<std::string> Dispatcher::suggestions_for(const std::string& token) const {
    return suggest(token, registry_.keys());
}

void Dispatcher::report_unknown(const std::string& token) {
    auto& out = session_.out();
    out.warn("Unknown command: '" + token + "'");
    auto suggestions = suggestions_for(token);
    if (!suggestions.empty()) {
        out.info("Did you mean?");
        for (const auto& s : suggestions) {
            out.info("  - " + s);
        }
    }
    out.info("Use 'help' to see all commands.");
}

} // namespace agentsh
