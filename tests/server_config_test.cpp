#include <catch2/catch_test_macros.hpp>

#include "mcplink/config/server_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace mcplink;

namespace {

/// Sets an environment variable for one test.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

std::filesystem::path write_temp(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << contents;
    return path;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Full MCP config parses", "[config]") {
    auto config = parse_config(Json::parse(R"({
        "client_enabled": true,
        "server_enabled": true,
        "servers": {
            "filesystem": {
                "command": "npx",
                "args": ["-y", "@modelcontextprotocol/server-filesystem", "/tmp"],
                "env": {"DEBUG": "1"},
                "permissions": {"trust_level": "trusted"}
            },
            "remote": {"command": "x", "transport": "sse"}
        }
    })"));

    REQUIRE(config.has_value());
    REQUIRE(config->client_enabled);
    REQUIRE(config->server_enabled);
    REQUIRE(config->servers.size() == 2);

    const auto& fs = config->servers.at("filesystem");
    REQUIRE(fs.command == "npx");
    REQUIRE(fs.args.size() == 3);
    REQUIRE(fs.env.at("DEBUG") == "1");
    REQUIRE(fs.transport == "stdio");
    REQUIRE(fs.trust_level == TrustLevel::Trusted);

    REQUIRE(config->servers.at("remote").transport == "sse");
    REQUIRE(config->servers.at("remote").trust_level == TrustLevel::Untrusted);
}

TEST_CASE("Empty config uses defaults", "[config]") {
    auto config = parse_config(Json::object());
    REQUIRE(config.has_value());
    REQUIRE(config->client_enabled);
    REQUIRE_FALSE(config->server_enabled);
    REQUIRE(config->servers.empty());
}

TEST_CASE("Invalid server entries name the server and field", "[config][error]") {
    SECTION("missing command") {
        auto config = parse_config(Json::parse(R"({"servers":{"broken":{"args":[]}}})"));
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().message == "server 'broken': field 'command' is required");
    }
    SECTION("args is not a list of strings") {
        auto config = parse_config(Json::parse(R"({"servers":{"s":{"command":"x","args":[1]}}})"));
        REQUIRE(config.error().message.find("'args'") != std::string::npos);
    }
    SECTION("env value is not a string") {
        auto config = parse_config(Json::parse(R"({"servers":{"s":{"command":"x","env":{"A":1}}}})"));
        REQUIRE(config.error().message.find("env.A") != std::string::npos);
    }
    SECTION("unknown trust level") {
        auto config = parse_config(Json::parse(
            R"({"servers":{"s":{"command":"x","permissions":{"trust_level":"root"}}}})"));
        REQUIRE(config.error().message.find("trusted, untrusted, sandbox") != std::string::npos);
        REQUIRE(config.error().message.find("'root'") != std::string::npos);
    }
    SECTION("client_enabled is not a boolean") {
        auto config = parse_config(Json::parse(R"({"client_enabled":"yes"})"));
        REQUIRE_FALSE(config.has_value());
    }
    SECTION("document is not an object") {
        REQUIRE_FALSE(parse_config(Json::array()).has_value());
    }
}

TEST_CASE("Trust level names", "[config]") {
    REQUIRE(trust_level_from_string("sandbox") == std::optional<TrustLevel>(TrustLevel::Sandbox));
    REQUIRE_FALSE(trust_level_from_string("Sandbox").has_value());
    REQUIRE(to_string(TrustLevel::Untrusted) == "untrusted");
}

TEST_CASE("Config files load from disk", "[config]") {
    SECTION("valid file") {
        const auto path = write_temp("mcplink_config_ok.json", R"({"servers":{"a":{"command":"cat"}}})");
        auto config = load_config_file(path);
        REQUIRE(config.has_value());
        REQUIRE(config->servers.at("a").command == "cat");
        std::filesystem::remove(path);
    }
    SECTION("invalid JSON") {
        const auto path = write_temp("mcplink_config_bad.json", "{ not json");
        auto config = load_config_file(path);
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().message.find("not valid JSON") != std::string::npos);
        std::filesystem::remove(path);
    }
    SECTION("missing file") {
        auto config = load_config_file("/nonexistent/mcplink.json");
        REQUIRE(config.error().message.find("cannot open") != std::string::npos);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Environment expansion
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("expand_env_vars substitutes set variables", "[config][env]") {
    ScopedEnv token("MCPLINK_TEST_TOKEN", "s3cret");

    REQUIRE(expand_env_vars("${MCPLINK_TEST_TOKEN}") == "s3cret");
    REQUIRE(expand_env_vars("Bearer ${MCPLINK_TEST_TOKEN}!") == "Bearer s3cret!");
    REQUIRE(expand_env_vars("${MCPLINK_TEST_TOKEN}${MCPLINK_TEST_TOKEN}") == "s3crets3cret");
    REQUIRE(expand_env_vars("no refs") == "no refs");
}

TEST_CASE("expand_env_vars leaves unresolvable references alone", "[config][env]") {
    ::unsetenv("MCPLINK_TEST_UNSET");

    REQUIRE(expand_env_vars("${MCPLINK_TEST_UNSET}") == "${MCPLINK_TEST_UNSET}");
    REQUIRE(expand_env_vars("a ${} b") == "a ${} b");
    REQUIRE(expand_env_vars("open ${MCPLINK_TEST_TOKEN") == "open ${MCPLINK_TEST_TOKEN");
    REQUIRE(expand_env_vars("$HOME") == "$HOME");
}

TEST_CASE("expand_server_config expands command, args and env", "[config][env]") {
    ScopedEnv dir("MCPLINK_TEST_DIR", "/srv/data");

    McpServerConfig server;
    server.command = "${MCPLINK_TEST_DIR}/bin/server";
    server.args = {"--root", "${MCPLINK_TEST_DIR}"};
    server.env = {{"DATA", "${MCPLINK_TEST_DIR}/db"}};

    const auto expanded = expand_server_config(server);

    REQUIRE(expanded.command == "/srv/data/bin/server");
    REQUIRE(expanded.args[1] == "/srv/data");
    REQUIRE(expanded.env.at("DATA") == "/srv/data/db");
    REQUIRE(server.command == "${MCPLINK_TEST_DIR}/bin/server");
}
