#ifndef MCPLINK_PROTOCOL_MCP_TYPES_HPP
#define MCPLINK_PROTOCOL_MCP_TYPES_HPP

// ═══════════════════════════════════════════════════════════════════════════
// MCP payload shapes
// ═══════════════════════════════════════════════════════════════════════════
// Plain structs with static from_json / member to_json. Decoders read through
// nlohmann's checked accessors (at(), get<>()), so a payload with a missing
// required field or a wrong type raises nlohmann::json::exception; the client
// turns that into a Serialization error.

#include "mcplink/log/logger.hpp"
#include "mcplink/protocol/json_rpc.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcplink {

inline constexpr const char* MCP_PROTOCOL_VERSION = "2025-11-25";

namespace detail {

inline std::optional<std::string> optional_string(const Json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

inline std::optional<bool> optional_bool(const Json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<bool>();
}

}  // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {
            j.at("name").get<std::string>(),
            j.value("version", "")
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════

/// What this client offers the server. Only roots are ever advertised; the
/// client answers no server-initiated requests.
struct ClientCapabilities {
    struct Roots {
        bool list_changed = false;
    };

    std::optional<Roots> roots;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (roots) {
            j["roots"] = {{"listChanged", roots->list_changed}};
        }
        return j;
    }
};

/// What the server offers. A key being present enables the feature; nested
/// flags default to false.
struct ServerCapabilities {
    struct ListChanged {
        bool list_changed = false;
    };
    struct Resources {
        bool subscribe = false;
        bool list_changed = false;
    };

    std::optional<ListChanged> prompts;
    std::optional<Resources> resources;
    std::optional<ListChanged> tools;
    bool logging = false;

    static ServerCapabilities from_json(const Json& j) {
        const auto flag = [](const Json& node, const char* key) {
            return node.is_object() && node.value(key, false);
        };

        ServerCapabilities caps;
        if (const auto it = j.find("prompts"); it != j.end()) {
            caps.prompts = ListChanged{flag(*it, "listChanged")};
        }
        if (const auto it = j.find("resources"); it != j.end()) {
            caps.resources = Resources{flag(*it, "subscribe"), flag(*it, "listChanged")};
        }
        if (const auto it = j.find("tools"); it != j.end()) {
            caps.tools = ListChanged{flag(*it, "listChanged")};
        }
        caps.logging = j.contains("logging");
        return caps;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ClientCapabilities capabilities;
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"clientInfo", client_info.to_json()}
        };
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        result.protocol_version = j.at("protocolVersion").get<std::string>();
        if (j.contains("capabilities")) {
            result.capabilities = ServerCapabilities::from_json(j["capabilities"]);
        }
        result.server_info = Implementation::from_json(j.at("serverInfo"));
        result.instructions = detail::optional_string(j, "instructions");
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

/// Behavior hints; advisory only, servers are not trusted to be accurate.
struct ToolAnnotations {
    std::optional<std::string> title;
    std::optional<bool> read_only_hint;
    std::optional<bool> destructive_hint;
    std::optional<bool> idempotent_hint;
    std::optional<bool> open_world_hint;

    static ToolAnnotations from_json(const Json& j) {
        ToolAnnotations ann;
        ann.title = detail::optional_string(j, "title");
        ann.read_only_hint = detail::optional_bool(j, "readOnlyHint");
        ann.destructive_hint = detail::optional_bool(j, "destructiveHint");
        ann.idempotent_hint = detail::optional_bool(j, "idempotentHint");
        ann.open_world_hint = detail::optional_bool(j, "openWorldHint");
        return ann;
    }

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (title) j["title"] = *title;
        if (read_only_hint) j["readOnlyHint"] = *read_only_hint;
        if (destructive_hint) j["destructiveHint"] = *destructive_hint;
        if (idempotent_hint) j["idempotentHint"] = *idempotent_hint;
        if (open_world_hint) j["openWorldHint"] = *open_world_hint;
        return j;
    }
};

struct Tool {
    std::string name;
    std::optional<std::string> description;
    Json input_schema = Json::object();
    std::optional<ToolAnnotations> annotations;

    static Tool from_json(const Json& j) {
        Tool tool;
        tool.name = j.at("name").get<std::string>();
        tool.description = detail::optional_string(j, "description");
        if (j.contains("inputSchema")) {
            tool.input_schema = j["inputSchema"];
        }
        if (j.contains("annotations") && !j["annotations"].is_null()) {
            tool.annotations = ToolAnnotations::from_json(j["annotations"]);
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}, {"inputSchema", input_schema}};
        if (description) {
            j["description"] = *description;
        }
        if (annotations) {
            j["annotations"] = annotations->to_json();
        }
        return j;
    }
};

struct ListToolsResult {
    std::vector<Tool> tools;
    std::optional<std::string> next_cursor;

    static ListToolsResult from_json(const Json& j) {
        ListToolsResult result;
        for (const auto& t : j.at("tools")) {
            result.tools.push_back(Tool::from_json(t));
        }
        result.next_cursor = detail::optional_string(j, "nextCursor");
        return result;
    }
};

struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"arguments", arguments}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Content
// ═══════════════════════════════════════════════════════════════════════════

struct ResourceContents {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64

    static ResourceContents from_json(const Json& j) {
        ResourceContents contents;
        contents.uri = j.at("uri").get<std::string>();
        contents.mime_type = detail::optional_string(j, "mimeType");
        contents.text = detail::optional_string(j, "text");
        contents.blob = detail::optional_string(j, "blob");
        return contents;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}};
        if (mime_type) j["mimeType"] = *mime_type;
        if (text) j["text"] = *text;
        if (blob) j["blob"] = *blob;
        return j;
    }
};

struct TextContent {
    std::string text;

    [[nodiscard]] Json to_json() const {
        return {{"type", "text"}, {"text", text}};
    }
};

struct ImageContent {
    std::string data;  // base64
    std::string mime_type;

    [[nodiscard]] Json to_json() const {
        return {{"type", "image"}, {"data", data}, {"mimeType", mime_type}};
    }
};

struct EmbeddedResource {
    ResourceContents resource;

    [[nodiscard]] Json to_json() const {
        return {{"type", "resource"}, {"resource", resource.to_json()}};
    }
};

using Content = std::variant<TextContent, ImageContent, EmbeddedResource>;

/// Decode one content item; nullopt for content types this client does not render.
inline std::optional<Content> content_from_json(const Json& j) {
    const auto type = j.at("type").get<std::string>();
    if (type == "text") {
        return TextContent{j.at("text").get<std::string>()};
    }
    if (type == "image") {
        return ImageContent{j.at("data").get<std::string>(), j.at("mimeType").get<std::string>()};
    }
    if (type == "resource") {
        return EmbeddedResource{ResourceContents::from_json(j.at("resource"))};
    }
    return std::nullopt;
}

struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;

    static CallToolResult from_json(const Json& j) {
        CallToolResult result;
        result.is_error = j.value("isError", false);
        for (const auto& item : j.at("content")) {
            if (auto decoded = content_from_json(item)) {
                result.content.push_back(std::move(*decoded));
            }
        }
        return result;
    }

    [[nodiscard]] Json to_json() const {
        Json items = Json::array();
        for (const auto& item : content) {
            items.push_back(std::visit([](const auto& c) { return c.to_json(); }, item));
        }
        return {{"content", std::move(items)}, {"isError", is_error}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    static Resource from_json(const Json& j) {
        Resource res;
        res.uri = j.at("uri").get<std::string>();
        res.name = j.value("name", "");
        res.description = detail::optional_string(j, "description");
        res.mime_type = detail::optional_string(j, "mimeType");
        return res;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}, {"name", name}};
        if (description) j["description"] = *description;
        if (mime_type) j["mimeType"] = *mime_type;
        return j;
    }
};

struct ListResourcesResult {
    std::vector<Resource> resources;
    std::optional<std::string> next_cursor;

    static ListResourcesResult from_json(const Json& j) {
        ListResourcesResult result;
        for (const auto& r : j.at("resources")) {
            result.resources.push_back(Resource::from_json(r));
        }
        result.next_cursor = detail::optional_string(j, "nextCursor");
        return result;
    }
};

struct ReadResourceResult {
    std::vector<ResourceContents> contents;

    static ReadResourceResult from_json(const Json& j) {
        ReadResourceResult result;
        for (const auto& c : j.at("contents")) {
            result.contents.push_back(ResourceContents::from_json(c));
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════

/// Server log severities, in RFC 5424 order
enum class LoggingLevel {
    Debug,
    Info,
    Notice,
    Warning,
    Error,
    Critical,
    Alert,
    Emergency
};

inline constexpr std::string_view kLoggingLevelNames[] = {
    "debug", "info", "notice", "warning", "error", "critical", "alert", "emergency"
};

inline std::string to_string(LoggingLevel level) {
    return std::string(kLoggingLevelNames[static_cast<std::size_t>(level)]);
}

/// Unknown names map to Info.
inline LoggingLevel logging_level_from_string(std::string_view s) {
    for (std::size_t i = 0; i < std::size(kLoggingLevelNames); ++i) {
        if (kLoggingLevelNames[i] == s) {
            return static_cast<LoggingLevel>(i);
        }
    }
    return LoggingLevel::Info;
}

[[nodiscard]] constexpr LogLevel to_log_level(LoggingLevel level) noexcept {
    switch (level) {
        case LoggingLevel::Debug: return LogLevel::Debug;
        case LoggingLevel::Info:
        case LoggingLevel::Notice: return LogLevel::Info;
        case LoggingLevel::Warning: return LogLevel::Warn;
        case LoggingLevel::Error: return LogLevel::Error;
        case LoggingLevel::Critical:
        case LoggingLevel::Alert:
        case LoggingLevel::Emergency: return LogLevel::Fatal;
    }
    return LogLevel::Info;
}

/// params of notifications/message
struct LoggingMessageParams {
    LoggingLevel level = LoggingLevel::Info;
    std::optional<std::string> logger;
    Json data;

    static LoggingMessageParams from_json(const Json& j) {
        LoggingMessageParams params;
        params.level = logging_level_from_string(j.value("level", "info"));
        params.logger = detail::optional_string(j, "logger");
        if (const auto it = j.find("data"); it != j.end()) {
            params.data = *it;
        }
        return params;
    }

    /// data rendered for a log line: strings verbatim, anything else as JSON.
    [[nodiscard]] std::string text() const {
        if (data.is_string()) {
            return data.get<std::string>();
        }
        return data.dump();
    }
};

}  // namespace mcplink

#endif  // MCPLINK_PROTOCOL_MCP_TYPES_HPP
