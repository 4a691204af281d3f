#include "repl.hpp"
#include "commands.hpp"
#include "util.hpp"
#include <iostream>

namespace agentsh {

Repl::Repl(const CommandRegistry& registry, Session& session, History* history)
    : session_(session), dispatcher_(registry, session), history_(history) {}

std::string Repl::prompt() const {
    std::string status = session_.has_agent()
        ? "(" + session_.agent()->name() + ")"
        : "(no agent)";
    std::string name = "agentsh";
    if (session_.out().color()) {
        name = "\033[1;36m" + name + "\033[0m";
    }
    return name + " " + status + " > ";
}

void Repl::load_default_agent() {
    std::string name = startup_agent_;
    if (!name.empty()) {
        auto result = session_.load_agent(name);
        if (!result.success) {
            session_.out().warn("Failed to load agent: " + result.error);
        }
        return;
    }
    try {
        name = read_default_agent(session_.config());
    } catch (const std::exception& e) {
        session_.out().warn("Failed to load default agent: " + std::string(e.what()));
        return;
    }
    if (name.empty()) {
        session_.out().warn("No default agent set.");
        return;
    }
    auto result = session_.load_agent(name);
    if (!result.success) {
        session_.out().warn("Failed to load default agent: " + result.error);
    }
}

int Repl::run() {
    print_welcome(session_.out());
    load_default_agent();

    while (!session_.exit_requested()) {
        auto read = session_.input().read_line(prompt());

        if (read.status == ReadStatus::Interrupted) continue;
        if (read.status == ReadStatus::Eof) {
            exit_session(session_);
            break;
        }

        std::string line = trim(read.line);
        if (line.empty()) continue;

        if (history_ && !history_->append(line) && !history_warned_) {
            std::cerr << "[history] Cannot write " << history_->path() << "\n";
            history_warned_ = true;
        }
        dispatcher_.handle(line);
        if (session_.exit_requested()) break;
        session_.out().rule();
    }
    return 0;
}

} // namespace agentsh
