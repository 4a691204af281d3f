#include <catch2/catch.hpp>
#include "mock_agent.hpp"
#include "mock_http_client.hpp"
#include "plugin.hpp"

using namespace agentsh;

// Tests use unique prefixed names to avoid colliding with real registrations.
// The singleton is never reset since that would drop the static
// registrations from the provider and connection .cpp files.

class PluginTestProvider : public Provider {
public:
    std::string name_;
    std::string base_url_;
    PluginTestProvider(std::string name, std::string base_url)
        : name_(std::move(name)), base_url_(std::move(base_url)) {}
    std::string chat_simple(const std::string&, const std::string&,
                            const std::string&, double) override { return ""; }
    std::string provider_name() const override { return name_; }
};

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// ── Built-in registrations ───────────────────────────────────────

TEST_CASE("PluginRegistry: built-in providers are registered", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    MockHttpClient http;
    REQUIRE(reg.create_provider("echo", http, "")->provider_name() == "echo");
    REQUIRE(reg.create_provider("ollama", http, "")->provider_name() == "ollama");
}

TEST_CASE("PluginRegistry: built-in connections are registered", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    MockHttpClient http;
    Config config;
    auto echo = reg.create_connection("echo", nlohmann::json::object(), config, http);
    REQUIRE(echo->connection_name() == "echo");
    auto llm = reg.create_connection("llm", nlohmann::json::object(), config, http);
    REQUIRE(llm->connection_name() == "llm");
}

// ── Providers ────────────────────────────────────────────────────

TEST_CASE("PluginRegistry: register and create provider", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    reg.register_provider("plugin-test-provider",
        [](HttpClient&, const std::string& url) {
            return std::make_unique<PluginTestProvider>("plugin-test-provider", url);
        });

    MockHttpClient http;
    auto provider = reg.create_provider("plugin-test-provider", http, "http://u");
    REQUIRE(provider->provider_name() == "plugin-test-provider");
    auto* typed = dynamic_cast<PluginTestProvider*>(provider.get());
    REQUIRE(typed != nullptr);
    REQUIRE(typed->base_url_ == "http://u");
}

TEST_CASE("PluginRegistry: unknown provider lists the registered ones", "[plugin]") {
    MockHttpClient http;
    try {
        PluginRegistry::instance().create_provider("plugin-missing", http, "");
        FAIL("expected an exception");
    } catch (const std::invalid_argument& e) {
        std::string msg = e.what();
        REQUIRE(msg.rfind("Unknown provider: plugin-missing (available: ", 0) == 0);
        REQUIRE(contains(msg, "echo, ollama"));
        REQUIRE(msg.back() == ')');
    }
}

// ── Connections ──────────────────────────────────────────────────

TEST_CASE("PluginRegistry: register and create connection", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    reg.register_connection("plugin-test-conn",
        [](const nlohmann::json& settings, const Config&, HttpClient&) {
            return std::make_unique<MockConnection>(settings.value("label", "unnamed"));
        });

    MockHttpClient http;
    auto conn = reg.create_connection("plugin-test-conn", {{"label", "custom"}},
                                      Config{}, http);
    REQUIRE(conn->connection_name() == "custom");
}

TEST_CASE("PluginRegistry: unknown connection throws", "[plugin]") {
    MockHttpClient http;
    try {
        PluginRegistry::instance().create_connection("plugin-missing-conn",
                                                     nlohmann::json::object(), Config{}, http);
        FAIL("expected an exception");
    } catch (const std::invalid_argument& e) {
        std::string msg = e.what();
        REQUIRE(msg.rfind("Unknown connection: plugin-missing-conn (available: ", 0) == 0);
        REQUIRE(contains(msg, "echo, llm"));
    }
}

TEST_CASE("PluginRegistry: later registration replaces earlier", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    reg.register_provider("plugin-test-replace",
        [](HttpClient&, const std::string&) {
            return std::make_unique<PluginTestProvider>("first", "");
        });
    reg.register_provider("plugin-test-replace",
        [](HttpClient&, const std::string&) {
            return std::make_unique<PluginTestProvider>("second", "");
        });

    MockHttpClient http;
    REQUIRE(reg.create_provider("plugin-test-replace", http, "")->provider_name() == "second");
}

TEST_CASE("PluginRegistry: factory may call back into the registry", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    reg.register_connection("plugin-test-reentrant",
        [](const nlohmann::json&, const Config&, HttpClient& http) {
            // Re-enters the registry from inside a factory
            auto provider = PluginRegistry::instance().create_provider("echo", http, "");
            return std::make_unique<MockConnection>(provider->provider_name() + "-backed");
        });

    MockHttpClient http;
    auto conn = reg.create_connection("plugin-test-reentrant", nlohmann::json::object(),
                                      Config{}, http);
    REQUIRE(conn->connection_name() == "echo-backed");
}
