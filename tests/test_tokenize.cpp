#include <catch2/catch.hpp>
#include "tokenize.hpp"

using namespace agentsh;

using Tokens = std::vector<std::string>;

TEST_CASE("tokenize: splits on whitespace", "[tokenize]") {
    auto r = tokenize("agent-action  conn\tact p1");
    REQUIRE(r.ok());
    REQUIRE(r.tokens == Tokens{"agent-action", "conn", "act", "p1"});
}

TEST_CASE("tokenize: empty and blank lines give no tokens", "[tokenize]") {
    REQUIRE(tokenize("").tokens.empty());
    REQUIRE(tokenize("   \t ").ok());
    REQUIRE(tokenize("   \t ").tokens.empty());
}

TEST_CASE("tokenize: double quotes keep spaces", "[tokenize]") {
    auto r = tokenize("agent-action echo echo \"hello world\"");
    REQUIRE(r.ok());
    REQUIRE(r.tokens == Tokens{"agent-action", "echo", "echo", "hello world"});
}

TEST_CASE("tokenize: single quotes are literal", "[tokenize]") {
    auto r = tokenize(R"(say 'a \"b\" c')");
    REQUIRE(r.ok());
    REQUIRE(r.tokens == Tokens{"say", R"(a \"b\" c)"});
}

TEST_CASE("tokenize: backslash escapes inside double quotes", "[tokenize]") {
    auto r = tokenize(R"(say "a \"quoted\" \\ word \n")");
    REQUIRE(r.ok());
    REQUIRE(r.tokens == Tokens{"say", R"(a "quoted" \ word \n)"});
}

TEST_CASE("tokenize: unquoted backslash escapes next char", "[tokenize]") {
    auto r = tokenize(R"(one\ token two)");
    REQUIRE(r.ok());
    REQUIRE(r.tokens == Tokens{"one token", "two"});
}

TEST_CASE("tokenize: adjacent quoted parts join", "[tokenize]") {
    auto r = tokenize(R"(pre"mid dle"'post')");
    REQUIRE(r.ok());
    REQUIRE(r.tokens == Tokens{"premid dlepost"});
}

TEST_CASE("tokenize: empty quotes produce an empty token", "[tokenize]") {
    auto r = tokenize(R"(load-agent "" x)");
    REQUIRE(r.ok());
    REQUIRE(r.tokens == Tokens{"load-agent", "", "x"});
}

TEST_CASE("tokenize: unterminated quote is an error", "[tokenize]") {
    auto dq = tokenize("say \"hello");
    REQUIRE_FALSE(dq.ok());
    REQUIRE(dq.error == "No closing quotation");
    REQUIRE(dq.tokens.empty());

    auto sq = tokenize("say 'hello");
    REQUIRE_FALSE(sq.ok());
    REQUIRE(sq.error == "No closing quotation");
}

TEST_CASE("tokenize: trailing backslash is an error", "[tokenize]") {
    auto r = tokenize("say hello\\");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error == "No escaped character");
}
