#include <catch2/catch_test_macros.hpp>

#include "mcplink/client/tool_catalog.hpp"

using namespace mcplink;

TEST_CASE("Namespaced tool names", "[catalog]") {
    REQUIRE(namespaced_tool_name("filesystem", "read_file") == "mcp__filesystem__read_file");

    auto parts = split_namespaced_tool_name("mcp__filesystem__read_file");
    REQUIRE(parts.has_value());
    REQUIRE(parts->first == "filesystem");
    REQUIRE(parts->second == "read_file");
}

TEST_CASE("Tool names may contain the separator", "[catalog]") {
    auto parts = split_namespaced_tool_name("mcp__git__log__oneline");
    REQUIRE(parts.has_value());
    REQUIRE(parts->first == "git");
    REQUIRE(parts->second == "log__oneline");
}

TEST_CASE("Malformed namespaced names are rejected", "[catalog]") {
    REQUIRE_FALSE(split_namespaced_tool_name("read_file").has_value());
    REQUIRE_FALSE(split_namespaced_tool_name("mcp__").has_value());
    REQUIRE_FALSE(split_namespaced_tool_name("mcp____tool").has_value());
    REQUIRE_FALSE(split_namespaced_tool_name("mcp__server").has_value());
    REQUIRE_FALSE(split_namespaced_tool_name("mcp__server__").has_value());
}

TEST_CASE("Tool results render as plain text", "[catalog]") {
    SECTION("text items are joined by newlines") {
        std::vector<Content> content{TextContent{"first"}, TextContent{"second"}};
        REQUIRE(format_tool_result(content) == "first\nsecond");
    }
    SECTION("images show their mime type") {
        std::vector<Content> content{ImageContent{"aGVsbG8=", "image/png"}};
        REQUIRE(format_tool_result(content) == "[Image: image/png]");
    }
    SECTION("embedded resources prefer text, then blob, then uri") {
        ResourceContents with_text{"file:///a", std::nullopt, "body", std::nullopt};
        ResourceContents with_blob{"file:///b", std::nullopt, std::nullopt, "AAECAw=="};
        ResourceContents bare{"file:///c", std::nullopt, std::nullopt, std::nullopt};

        std::vector<Content> content{
            EmbeddedResource{with_text}, EmbeddedResource{with_blob}, EmbeddedResource{bare}};
        REQUIRE(format_tool_result(content) == "body\n[Resource blob: 8 bytes]\n[Resource: file:///c]");
    }
    SECTION("empty content") {
        REQUIRE(format_tool_result({}).empty());
    }
}
