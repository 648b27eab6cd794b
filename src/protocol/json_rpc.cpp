#include "mcplink/protocol/json_rpc.hpp"

namespace mcplink {
namespace {

bool has_non_null(const Json& node, const char* key) {
    const auto it = node.find(key);
    return it != node.end() && it->is_null() == false;
}

JsonResult<void> check_version(const Json& node) {
    const auto it = node.find("jsonrpc");
    if (it == node.end()) {
        return {};
    }
    const bool is_expected = it->is_string() && it->get<std::string>() == kJsonRpcVersion;
    if (is_expected == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must be \"2.0\", got " + it->dump()});
    }
    return {};
}

std::optional<Json> optional_field(const Json& node, const char* key) {
    const auto it = node.find(key);
    if (it == node.end()) {
        return std::nullopt;
    }
    return *it;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload = {{"code", code}, {"message", message}};
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonResult<JsonRpcError> JsonRpcError::from_json(const Json& node) {
    if (node.is_object() == false) {
        return tl::unexpected(JsonError{JsonError::Code::InvalidShape, "error must be an object"});
    }
    const auto code_it = node.find("code");
    if (code_it == node.end() || code_it->is_number_integer() == false) {
        return tl::unexpected(JsonError{JsonError::Code::MissingField, "error.code must be an integer"});
    }

    JsonRpcError error;
    error.code = code_it->get<int>();
    if (const auto msg_it = node.find("message"); msg_it != node.end() && msg_it->is_string()) {
        error.message = msg_it->get<std::string>();
    }
    error.data = optional_field(node, "data");
    return error;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest / JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id;
    payload["method"] = method;
    if (params.has_value()) {
        payload["params"] = *params;
    }
    return payload;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method;
    if (params.has_value()) {
        payload["params"] = *params;
    }
    return payload;
}

JsonResult<JsonRpcNotification> JsonRpcNotification::from_json(const Json& node) {
    if (auto version = check_version(node); !version) {
        return tl::unexpected(version.error());
    }
    const auto method_it = node.find("method");
    if (method_it == node.end() || method_it->is_string() == false) {
        return tl::unexpected(JsonError{JsonError::Code::MissingField, "notification method must be a string"});
    }
    return JsonRpcNotification{method_it->get<std::string>(), optional_field(node, "params")};
}

JsonResult<JsonRpcIncomingRequest> JsonRpcIncomingRequest::from_json(const Json& node) {
    if (auto version = check_version(node); !version) {
        return tl::unexpected(version.error());
    }
    const auto method_it = node.find("method");
    if (method_it == node.end() || method_it->is_string() == false) {
        return tl::unexpected(JsonError{JsonError::Code::MissingField, "request method must be a string"});
    }
    const auto& id = node.at("id");
    if (id.is_number_integer() == false && id.is_string() == false) {
        return tl::unexpected(JsonError{JsonError::Code::InvalidId, "request id must be an integer or string"});
    }
    return JsonRpcIncomingRequest{id, method_it->get<std::string>(), optional_field(node, "params")};
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::uint64_t> JsonRpcResponse::numeric_id() const {
    if (id.is_number_unsigned()) {
        return id.get<std::uint64_t>();
    }
    if (id.is_number_integer()) {
        const auto value = id.get<std::int64_t>();
        if (value >= 0) {
            return static_cast<std::uint64_t>(value);
        }
    }
    return std::nullopt;
}

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id;
    if (error.has_value()) {
        payload["error"] = error->to_json();
    } else {
        payload["result"] = result.value_or(Json(nullptr));
    }
    return payload;
}

JsonResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& node) {
    if (auto version = check_version(node); !version) {
        return tl::unexpected(version.error());
    }
    const auto id_it = node.find("id");
    if (id_it == node.end()) {
        return tl::unexpected(JsonError{JsonError::Code::MissingField, "response is missing id"});
    }
    const bool id_ok = id_it->is_null() || id_it->is_number_integer() || id_it->is_string();
    if (id_ok == false) {
        return tl::unexpected(JsonError{JsonError::Code::InvalidId, "id must be an integer, string or null"});
    }

    const bool has_result = node.contains("result");
    const bool has_error = node.contains("error");
    if (has_result == has_error) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidShape,
            "response must carry exactly one of result or error"});
    }

    JsonRpcResponse response;
    response.id = *id_it;
    if (has_error) {
        auto error = JsonRpcError::from_json(node.at("error"));
        if (!error) {
            return tl::unexpected(error.error());
        }
        response.error = std::move(*error);
    } else {
        response.result = node.at("result");
    }
    return response;
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

JsonResult<ServerMessage> classify_server_message(const Json& message) {
    if (message.is_object() == false) {
        return tl::unexpected(JsonError{JsonError::Code::InvalidShape, "message must be a JSON object"});
    }

    const bool has_method = message.contains("method");
    if (has_method && has_non_null(message, "id")) {
        auto request = JsonRpcIncomingRequest::from_json(message);
        if (!request) {
            return tl::unexpected(request.error());
        }
        return ServerMessage{std::move(*request)};
    }
    if (has_method) {
        auto notification = JsonRpcNotification::from_json(message);
        if (!notification) {
            return tl::unexpected(notification.error());
        }
        return ServerMessage{std::move(*notification)};
    }

    auto response = JsonRpcResponse::from_json(message);
    if (!response) {
        return tl::unexpected(response.error());
    }
    return ServerMessage{std::move(*response)};
}

JsonResult<ServerMessage> parse_server_message(std::string_view line) {
    Json message = Json::parse(line.begin(), line.end(), nullptr, false);
    if (message.is_discarded()) {
        return tl::unexpected(JsonError{JsonError::Code::InvalidJson, "line is not valid JSON"});
    }
    return classify_server_message(message);
}

}  // namespace mcplink
