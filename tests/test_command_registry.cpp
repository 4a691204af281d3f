#include <catch2/catch.hpp>
#include "command_registry.hpp"
#include "commands.hpp"
#include <set>
#include <stdexcept>

using namespace agentsh;

static CommandResult noop(const std::vector<std::string>&, Session&) {
    return CommandResult::ok();
}

static Command make(const std::string& name, std::vector<std::string> aliases = {}) {
    return Command{name, name + " description", {}, noop, std::move(aliases)};
}

TEST_CASE("CommandRegistry: name and alias resolve to same command", "[registry]") {
    CommandRegistry registry;
    registry.add(make("agent-action", {"action", "run"}));

    const Command* by_name = registry.resolve("agent-action");
    REQUIRE(by_name != nullptr);
    REQUIRE(registry.resolve("action") == by_name);
    REQUIRE(registry.resolve("run") == by_name);
    REQUIRE(by_name->name == "agent-action");
}

TEST_CASE("CommandRegistry: lookup is case-insensitive", "[registry]") {
    CommandRegistry registry;
    registry.add(make("Help", {"H"}));

    REQUIRE(registry.resolve("help") != nullptr);
    REQUIRE(registry.resolve("HELP") == registry.resolve("help"));
    REQUIRE(registry.resolve("h") == registry.resolve("help"));
}

TEST_CASE("CommandRegistry: unknown token resolves to nullptr", "[registry]") {
    CommandRegistry registry;
    registry.add(make("help"));
    REQUIRE(registry.resolve("nope") == nullptr);
    REQUIRE(registry.resolve("") == nullptr);
}

TEST_CASE("CommandRegistry: alias colliding with a name throws", "[registry]") {
    CommandRegistry registry;
    registry.add(make("exit", {"quit", "q"}));

    REQUIRE_THROWS_AS(registry.add(make("query", {"q"})), std::invalid_argument);

    // Rejected command left no trace
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.resolve("query") == nullptr);
    REQUIRE(registry.resolve("q")->name == "exit");
}

TEST_CASE("CommandRegistry: duplicate name throws", "[registry]") {
    CommandRegistry registry;
    registry.add(make("chat"));
    REQUIRE_THROWS_AS(registry.add(make("CHAT")), std::invalid_argument);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("CommandRegistry: alias repeated within a command throws", "[registry]") {
    CommandRegistry registry;
    REQUIRE_THROWS_AS(registry.add(make("load-agent", {"load", "load"})),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(registry.add(make("list", {"list"})), std::invalid_argument);
    REQUIRE(registry.size() == 0);
    REQUIRE(registry.keys().empty());
}

TEST_CASE("CommandRegistry: invalid commands rejected", "[registry]") {
    CommandRegistry registry;
    REQUIRE_THROWS_AS(registry.add(make("")), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.add(make("x", {""})), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.add(Command{"nohandler", "d", {}, nullptr, {}}),
                      std::invalid_argument);
}

TEST_CASE("CommandRegistry: list yields each command once in order", "[registry]") {
    CommandRegistry registry;
    registry.add(make("help", {"h", "?"}));
    registry.add(make("clear", {"cls"}));
    registry.add(make("exit", {"quit", "q"}));

    auto cmds = registry.list();
    REQUIRE(cmds.size() == 3);
    REQUIRE(cmds[0]->name == "help");
    REQUIRE(cmds[1]->name == "clear");
    REQUIRE(cmds[2]->name == "exit");
}

TEST_CASE("CommandRegistry: keys cover names and aliases", "[registry]") {
    CommandRegistry registry;
    registry.add(make("help", {"h", "?"}));
    registry.add(make("exit", {"q"}));
    REQUIRE(registry.keys() == std::vector<std::string>{"help", "h", "?", "exit", "q"});
}

// ── Built-in table ───────────────────────────────────────────────

TEST_CASE("Builtins: full table registers without collisions", "[registry]") {
    CommandRegistry registry;
    REQUIRE_NOTHROW(register_builtin_commands(registry));
    REQUIRE(registry.size() == 13);

    const char* names[] = {
        "help", "clear", "agent-action", "agent-loop", "list-agents",
        "load-agent", "create-agent", "set-default-agent", "chat",
        "list-actions", "configure-connection", "list-connections", "exit"};
    for (const char* name : names) {
        const Command* cmd = registry.resolve(name);
        REQUIRE(cmd != nullptr);
        REQUIRE(cmd->name == name);
        REQUIRE_FALSE(cmd->description.empty());
    }
}

TEST_CASE("Builtins: aliases map to their commands", "[registry]") {
    CommandRegistry registry;
    register_builtin_commands(registry);

    struct { const char* alias; const char* name; } cases[] = {
        {"h", "help"}, {"?", "help"}, {"cls", "clear"},
        {"action", "agent-action"}, {"run", "agent-action"},
        {"loop", "agent-loop"}, {"start", "agent-loop"},
        {"agents", "list-agents"}, {"ls-agents", "list-agents"},
        {"load", "load-agent"}, {"new-agent", "create-agent"},
        {"create", "create-agent"}, {"default", "set-default-agent"},
        {"talk", "chat"}, {"actions", "list-actions"},
        {"ls-actions", "list-actions"}, {"config", "configure-connection"},
        {"setup", "configure-connection"}, {"connections", "list-connections"},
        {"ls-connections", "list-connections"}, {"quit", "exit"}, {"q", "exit"}};
    for (const auto& c : cases) {
        const Command* cmd = registry.resolve(c.alias);
        REQUIRE(cmd != nullptr);
        REQUIRE(cmd->name == c.name);
    }
}

TEST_CASE("Builtins: registering twice collides", "[registry]") {
    CommandRegistry registry;
    register_builtin_commands(registry);
    REQUIRE_THROWS_AS(register_builtin_commands(registry), std::invalid_argument);
    REQUIRE(registry.size() == 13);
}

TEST_CASE("Builtins: every key is unique", "[registry]") {
    CommandRegistry registry;
    register_builtin_commands(registry);
    std::set<std::string> unique(registry.keys().begin(), registry.keys().end());
    REQUIRE(unique.size() == registry.keys().size());
}
