#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace mcplink {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

// ─────────────────────────────────────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────────────────────────────────────

namespace ErrorCode {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    constexpr int ResourceNotFound = -32002;  // MCP-specific
}  // namespace ErrorCode

// ─────────────────────────────────────────────────────────────────────────────
// Decode errors
// ─────────────────────────────────────────────────────────────────────────────

struct JsonError {
    enum class Code {
        InvalidJson,     ///< Not parseable as JSON at all
        InvalidVersion,  ///< "jsonrpc" present but not "2.0"
        MissingField,
        InvalidId,
        InvalidShape     ///< Parseable, but not a message this client understands
    };

    Code code{Code::InvalidShape};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

// ─────────────────────────────────────────────────────────────────────────────
// Envelopes
// ─────────────────────────────────────────────────────────────────────────────

/// Error object carried by a failed response
struct JsonRpcError {
    int code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcError> from_json(const Json& node);
};

/// Client-to-server request. Ids are allocated per connection, never reused.
struct JsonRpcRequest {
    std::uint64_t id{};
    std::string method;
    std::optional<Json> params{};

    [[nodiscard]] Json to_json() const;
};

struct JsonRpcNotification {
    std::string method;
    std::optional<Json> params{};

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcNotification> from_json(const Json& node);
};

/// Server-to-client request (ping, roots/list, ...). The id is echoed back
/// verbatim, so it may be a string as well as a number.
struct JsonRpcIncomingRequest {
    Json id;
    std::string method;
    std::optional<Json> params{};

    static JsonResult<JsonRpcIncomingRequest> from_json(const Json& node);
};

/// Server response; exactly one of result / error is set.
struct JsonRpcResponse {
    Json id;
    std::optional<Json> result{};
    std::optional<JsonRpcError> error{};

    [[nodiscard]] bool is_error() const noexcept { return error.has_value(); }

    /// The id as this client allocates them; nullopt for string, negative or null ids.
    [[nodiscard]] std::optional<std::uint64_t> numeric_id() const;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcResponse> from_json(const Json& node);
};

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────
// "method" and a non-null "id": request from the server
// "method" and no (or a null) "id": notification
// anything else must be a response

using ServerMessage = std::variant<JsonRpcResponse, JsonRpcNotification, JsonRpcIncomingRequest>;

[[nodiscard]] JsonResult<ServerMessage> classify_server_message(const Json& message);

/// Parse one wire line and classify it.
[[nodiscard]] JsonResult<ServerMessage> parse_server_message(std::string_view line);

}  // namespace mcplink
