#pragma once
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentsh {

class Session;

struct CommandResult {
    bool success = true;
    std::string error; // shown at error level when !success

    static CommandResult ok() { return {}; }
    static CommandResult fail(std::string message) {
        return CommandResult{false, std::move(message)};
    }
};

// args[0] is the token the user typed (name or alias)
using CommandHandler = std::function<CommandResult(
    const std::vector<std::string>& args, Session& session)>;

struct Command {
    std::string name;
    std::string description;
    std::vector<std::string> tips;
    CommandHandler handler;
    std::vector<std::string> aliases;
};

// Name/alias -> Command table. Keys are stored lower-cased; lookups are
// case-insensitive. Built once at startup, read-only afterwards.
class CommandRegistry {
public:
    CommandRegistry() = default;
    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    // Throws std::invalid_argument if the name or any alias is already
    // taken (or repeated within the command). Nothing is inserted then.
    void add(Command command);

    // nullptr when no name or alias matches
    const Command* resolve(const std::string& token) const;

    // Distinct commands in registration order
    std::vector<const Command*> list() const;

    // Every name and alias in registration order
    const std::vector<std::string>& keys() const { return keys_; }

    size_t size() const { return commands_.size(); }

private:
    std::vector<std::unique_ptr<Command>> commands_;
    std::unordered_map<std::string, const Command*> index_;
    std::vector<std::string> keys_;
};

} // namespace agentsh
