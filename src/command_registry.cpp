#include "command_registry.hpp"
#include "util.hpp"
#include <stdexcept>
#include <unordered_set>

namespace agentsh {

void CommandRegistry::add(Command command) {
    if (command.name.empty()) {
        throw std::invalid_argument("Command name must not be empty");
    }
    if (!command.handler) {
        throw std::invalid_argument("Command '" + command.name + "' has no handler");
    }

    std::vector<std::string> new_keys;
    new_keys.push_back(to_lower(command.name));
    for (const auto& alias : command.aliases) {
        new_keys.push_back(to_lower(alias));
    }

    std::unordered_set<std::string> seen;
    for (const auto& key : new_keys) {
        if (key.empty()) {
            throw std::invalid_argument("Command '" + command.name + "' has an empty alias");
        }
        auto it = index_.find(key);
        if (it != index_.end()) {
            throw std::invalid_argument("Command key '" + key + "' of '" + command.name +
                                        "' is already registered by '" + it->second->name + "'");
        }
        if (!seen.insert(key).second) {
            throw std::invalid_argument("Command key '" + key + "' repeated in '" +
                                        command.name + "'");
        }
    }

    commands_.push_back(std::make_unique<Command>(std::move(command)));
    const Command* stored = commands_.back().get();
    for (auto& key : new_keys) {
        index_[key] = stored;
        keys_.push_back(std::move(key));
    }
}

const Command* CommandRegistry::resolve(const std::string& token) const {
    auto it = index_.find(to_lower(token));
    if (it == index_.end()) return nullptr;
    return it->second;
}

std::vector<const Command*> CommandRegistry::list() const {
    std::vector<const Command*> out;
    out.reserve(commands_.size());
    for (const auto& cmd : commands_) {
        out.push_back(cmd.get());
    }
    return out;
}

} // namespace agentsh
