#include <catch2/catch_test_macros.hpp>

#include "mcplink/client/client_error.hpp"

using namespace mcplink;

TEST_CASE("ClientError factories set code and message", "[error]") {
    REQUIRE(ClientError::timeout().is(ClientErrorCode::Timeout));
    REQUIRE(ClientError::disconnected().message == "MCP server disconnected");
    REQUIRE(ClientError::spawn_failed("npx: No such file or directory").message ==
            "failed to spawn MCP server: npx: No such file or directory");
    REQUIRE(ClientError::protocol_mismatch("1999-01-01").code == ClientErrorCode::ProtocolMismatch);
    REQUIRE_FALSE(ClientError::io("x").rpc_error.has_value());
}

TEST_CASE("RPC errors keep the server's error object", "[error]") {
    const auto err = ClientError::from_rpc_error(JsonRpcError{ErrorCode::InvalidParams, "bad args", Json{{"field", "x"}}});

    REQUIRE(err.code == ClientErrorCode::RpcError);
    REQUIRE(err.message == "MCP server error -32602: bad args");
    REQUIRE(err.rpc_error.has_value());
    REQUIRE(err.rpc_error->code == ErrorCode::InvalidParams);
    REQUIRE((*err.rpc_error->data)["field"] == "x");
}

TEST_CASE("Transport errors map onto client errors", "[error]") {
    using Category = TransportError::Category;

    REQUIRE(ClientError::from_transport_error({Category::Spawn, "boom"}).code == ClientErrorCode::SpawnFailed);
    REQUIRE(ClientError::from_transport_error({Category::Io, "EIO"}).code == ClientErrorCode::Io);
    REQUIRE(ClientError::from_transport_error({Category::Closed, "eof"}).code == ClientErrorCode::Disconnected);
}

TEST_CASE("ClientErrorCode names", "[error]") {
    REQUIRE(to_string(ClientErrorCode::RpcError) == "RpcError");
    REQUIRE(to_string(ClientErrorCode::Disconnected) == "Disconnected");
    REQUIRE(to_string(TransportError::Category::Closed) == "Closed");
}
