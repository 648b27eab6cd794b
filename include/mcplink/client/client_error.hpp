#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Every request resolves with exactly one of: a result, an RpcError, a
// Timeout, or Disconnected. Serialization, Io and SpawnFailed come from the
// local side; ProtocolMismatch is informational and never fails connect().

#include "mcplink/protocol/json_rpc.hpp"
#include "mcplink/transport.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcplink {

enum class ClientErrorCode {
    SpawnFailed,       ///< Server process could not be started
    Serialization,     ///< Encoding a request or decoding a result failed
    Io,                ///< Pipe read/write failure
    RpcError,          ///< Server answered with a JSON-RPC error object
    Timeout,           ///< No response within the allotted window
    Disconnected,      ///< Connection is not (or no longer) usable
    ProtocolMismatch   ///< Server chose another protocol version (non-fatal)
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::SpawnFailed:      return "SpawnFailed";
        case ClientErrorCode::Serialization:    return "Serialization";
        case ClientErrorCode::Io:               return "Io";
        case ClientErrorCode::RpcError:         return "RpcError";
        case ClientErrorCode::Timeout:          return "Timeout";
        case ClientErrorCode::Disconnected:     return "Disconnected";
        case ClientErrorCode::ProtocolMismatch: return "ProtocolMismatch";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<JsonRpcError> rpc_error;  ///< Set only for RpcError

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError spawn_failed(std::string detail) {
        return {ClientErrorCode::SpawnFailed, "failed to spawn MCP server: " + detail, std::nullopt};
    }

    [[nodiscard]] static ClientError serialization(std::string detail) {
        return {ClientErrorCode::Serialization, "JSON error: " + detail, std::nullopt};
    }

    [[nodiscard]] static ClientError io(std::string detail) {
        return {ClientErrorCode::Io, "I/O error: " + detail, std::nullopt};
    }

    [[nodiscard]] static ClientError from_rpc_error(JsonRpcError err) {
        std::string msg = "MCP server error " + std::to_string(err.code) + ": " + err.message;
        return {ClientErrorCode::RpcError, std::move(msg), std::move(err)};
    }

    [[nodiscard]] static ClientError timeout() {
        return {ClientErrorCode::Timeout, "MCP request timed out", std::nullopt};
    }

    [[nodiscard]] static ClientError disconnected() {
        return {ClientErrorCode::Disconnected, "MCP server disconnected", std::nullopt};
    }

    [[nodiscard]] static ClientError protocol_mismatch(const std::string& version) {
        return {ClientErrorCode::ProtocolMismatch, "unsupported MCP protocol version: " + version, std::nullopt};
    }

    /// Closed streams mean the peer went away, which callers see as Disconnected.
    [[nodiscard]] static ClientError from_transport_error(const TransportError& err) {
        switch (err.category) {
            case TransportError::Category::Spawn:  return spawn_failed(err.message);
            case TransportError::Category::Io:     return io(err.message);
            case TransportError::Category::Closed: return disconnected();
        }
        return io(err.message);
    }

    [[nodiscard]] bool is(ClientErrorCode c) const noexcept { return code == c; }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace mcplink
