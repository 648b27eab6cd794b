// ─────────────────────────────────────────────────────────────────────────────
// MCP Types Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcplink/protocol/mcp_types.hpp"

using namespace mcplink;

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("InitializeParams encodes the client side of the handshake", "[mcp][types]") {
    InitializeParams params;
    params.capabilities.roots = ClientCapabilities::Roots{true};
    params.client_info = {"mcplink", "0.1.0"};

    const auto j = params.to_json();

    REQUIRE(j["protocolVersion"] == MCP_PROTOCOL_VERSION);
    REQUIRE(j["clientInfo"]["name"] == "mcplink");
    REQUIRE(j["capabilities"]["roots"]["listChanged"] == true);
    REQUIRE_FALSE(j["capabilities"].contains("sampling"));
    REQUIRE_FALSE(j["capabilities"].contains("experimental"));
}

TEST_CASE("InitializeResult decodes server info and capabilities", "[mcp][types]") {
    const auto j = Json::parse(R"({
        "protocolVersion": "2025-11-25",
        "capabilities": {"tools": {"listChanged": true}, "resources": {"subscribe": true}, "logging": {}},
        "serverInfo": {"name": "fs", "version": "2.1.0"},
        "instructions": "be nice"
    })");

    const auto result = InitializeResult::from_json(j);

    REQUIRE(result.protocol_version == "2025-11-25");
    REQUIRE(result.server_info.name == "fs");
    REQUIRE(result.server_info.version == "2.1.0");
    REQUIRE(result.capabilities.tools.has_value());
    REQUIRE(result.capabilities.tools->list_changed);
    REQUIRE(result.capabilities.resources->subscribe);
    REQUIRE_FALSE(result.capabilities.resources->list_changed);
    REQUIRE(result.capabilities.logging);
    REQUIRE_FALSE(result.capabilities.prompts.has_value());
    REQUIRE(result.instructions == std::optional<std::string>("be nice"));
}

TEST_CASE("InitializeResult without required fields throws", "[mcp][types][error]") {
    REQUIRE_THROWS_AS(InitializeResult::from_json(Json::parse(R"({"serverInfo":{"name":"x"}})")), Json::exception);
    REQUIRE_THROWS_AS(InitializeResult::from_json(Json::parse(R"({"protocolVersion":"x"})")), Json::exception);
    REQUIRE_THROWS_AS(InitializeResult::from_json(Json::parse(R"({"protocolVersion":5,"serverInfo":{"name":"x"}})")),
                      Json::exception);
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Tool decodes schema, description and annotations", "[mcp][types]") {
    const auto tool = Tool::from_json(Json::parse(R"({
        "name": "read_file",
        "description": "Read a file",
        "inputSchema": {"type": "object", "properties": {"path": {"type": "string"}}},
        "annotations": {"readOnlyHint": true}
    })"));

    REQUIRE(tool.name == "read_file");
    REQUIRE(tool.description == std::optional<std::string>("Read a file"));
    REQUIRE(tool.input_schema["properties"]["path"]["type"] == "string");
    REQUIRE(tool.annotations->read_only_hint == std::optional<bool>(true));
    REQUIRE_FALSE(tool.annotations->destructive_hint.has_value());
}

TEST_CASE("Tool defaults to an empty object schema", "[mcp][types]") {
    const auto tool = Tool::from_json(Json::parse(R"({"name": "ping"})"));
    REQUIRE(tool.input_schema.is_object());
    REQUIRE(tool.input_schema.empty());
    REQUIRE_FALSE(tool.description.has_value());
    REQUIRE(tool.to_json()["inputSchema"].is_object());
}

TEST_CASE("ListToolsResult carries the cursor", "[mcp][types]") {
    const auto page = ListToolsResult::from_json(Json::parse(
        R"({"tools":[{"name":"a"},{"name":"b"}],"nextCursor":"page-2"})"));
    REQUIRE(page.tools.size() == 2);
    REQUIRE(page.next_cursor == std::optional<std::string>("page-2"));

    const auto last = ListToolsResult::from_json(Json::parse(R"({"tools":[],"nextCursor":null})"));
    REQUIRE_FALSE(last.next_cursor.has_value());
}

TEST_CASE("CallToolResult decodes mixed content", "[mcp][types]") {
    const auto result = CallToolResult::from_json(Json::parse(R"({
        "content": [
            {"type": "text", "text": "hello"},
            {"type": "image", "data": "aGk=", "mimeType": "image/png"},
            {"type": "resource", "resource": {"uri": "file:///a", "text": "body"}},
            {"type": "audio", "data": "xx", "mimeType": "audio/wav"}
        ],
        "isError": true
    })"));

    REQUIRE(result.is_error);
    REQUIRE(result.content.size() == 3);
    REQUIRE(std::get<TextContent>(result.content[0]).text == "hello");
    REQUIRE(std::get<ImageContent>(result.content[1]).mime_type == "image/png");
    REQUIRE(std::get<EmbeddedResource>(result.content[2]).resource.uri == "file:///a");
}

TEST_CASE("CallToolResult isError defaults to false", "[mcp][types]") {
    const auto result = CallToolResult::from_json(Json::parse(R"({"content":[]})"));
    REQUIRE_FALSE(result.is_error);
    REQUIRE(result.to_json()["isError"] == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Resources decode", "[mcp][types]") {
    const auto listed = ListResourcesResult::from_json(Json::parse(
        R"({"resources":[{"uri":"file:///x","name":"x","mimeType":"text/plain"}]})"));
    REQUIRE(listed.resources.size() == 1);
    REQUIRE(listed.resources[0].mime_type == std::optional<std::string>("text/plain"));
    REQUIRE_FALSE(listed.next_cursor.has_value());

    const auto read = ReadResourceResult::from_json(Json::parse(
        R"({"contents":[{"uri":"file:///x","blob":"AAEC"}]})"));
    REQUIRE(read.contents.size() == 1);
    REQUIRE(read.contents[0].blob == std::optional<std::string>("AAEC"));
    REQUIRE_FALSE(read.contents[0].text.has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("LoggingMessageParams decodes level and data", "[mcp][types]") {
    const auto params = LoggingMessageParams::from_json(Json::parse(
        R"({"level":"warning","logger":"db","data":"disk almost full"})"));

    REQUIRE(params.level == LoggingLevel::Warning);
    REQUIRE(params.logger == std::optional<std::string>("db"));
    REQUIRE(params.text() == "disk almost full");
}

TEST_CASE("LoggingMessageParams renders structured data as JSON", "[mcp][types]") {
    const auto params = LoggingMessageParams::from_json(Json::parse(
        R"({"level":"bogus","data":{"rows":3}})"));

    REQUIRE(params.level == LoggingLevel::Info);
    REQUIRE(params.text() == R"({"rows":3})");
}

TEST_CASE("LoggingLevel names round trip", "[mcp][types]") {
    for (auto level : {LoggingLevel::Debug, LoggingLevel::Notice, LoggingLevel::Critical, LoggingLevel::Emergency}) {
        REQUIRE(logging_level_from_string(to_string(level)) == level);
    }
}
