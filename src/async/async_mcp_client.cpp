#include "mcplink/async/async_mcp_client.hpp"
#include "mcplink/log/logger.hpp"

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <exception>

namespace mcplink::async {

namespace {

/// Decode a result payload; shape errors become Serialization, never RpcError.
template <typename T>
ClientResult<T> decode_result(const Json& payload) {
    try {
        return T::from_json(payload);
    } catch (const Json::exception& e) {
        return tl::unexpected(ClientError::serialization(e.what()));
    }
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<AsyncMcpClient> AsyncMcpClient::create(
    std::string name,
    std::shared_ptr<IAsyncTransport> transport,
    AsyncMcpClientConfig config
) {
    return std::make_shared<AsyncMcpClient>(
        PrivateTag{}, std::move(name), std::move(transport), std::move(config));
}

AsyncMcpClient::AsyncMcpClient(
    PrivateTag,
    std::string name,
    std::shared_ptr<IAsyncTransport> transport,
    AsyncMcpClientConfig config
)
    : name_(std::move(name))
    , config_(std::move(config))
    , transport_(std::move(transport))
    , strand_(asio::make_strand(transport_->get_executor()))
    , pending_(std::make_shared<PendingRequests>(transport_->get_executor()))
    , reader_done_(std::make_shared<DoneSignal>(transport_->get_executor()))
{}

AsyncMcpClient::~AsyncMcpClient() {
    state_.store(ConnectionState::Disconnected);
    pending_->fail_all(ClientError::disconnected());
    transport_->terminate();
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<InitializeResult>> AsyncMcpClient::connect() {
    auto self = shared_from_this();

    if (state_.load() != ConnectionState::Connecting) {
        co_return tl::unexpected(ClientError::disconnected());
    }

    auto started = co_await transport_->async_start();
    if (!started) {
        mark_disconnected();
        co_return tl::unexpected(ClientError::from_transport_error(started.error()));
    }

    auto expected = ConnectionState::Connecting;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Initializing)) {
        transport_->terminate();
        co_return tl::unexpected(ClientError::disconnected());
    }

    reader_started_ = true;
    asio::co_spawn(
        strand_,
        reader_loop(weak_from_this(), transport_),
        [weak = weak_from_this(), done = reader_done_](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    MCPLINK_LOG_ERROR(std::string("MCP reader stopped: ") + e.what());
                }
                if (auto client = weak.lock()) {
                    client->mark_disconnected();
                }
            }
            done->close();
        });

    // ─────────────────────────────────────────────────────────────────────────
    // initialize
    // ─────────────────────────────────────────────────────────────────────────

    InitializeParams params;
    params.protocol_version = MCP_PROTOCOL_VERSION;
    params.capabilities = config_.capabilities;
    params.client_info = {config_.client_name, config_.client_version};

    auto response = co_await send_request("initialize", params.to_json(), config_.init_timeout);
    if (!response) {
        co_return tl::unexpected(co_await abort_handshake(response.error()));
    }

    auto init = decode_result<InitializeResult>(*response);
    if (!init) {
        co_return tl::unexpected(co_await abort_handshake(init.error()));
    }

    if (init->protocol_version != MCP_PROTOCOL_VERSION) {
        MCPLINK_LOG_WARN("MCP server '" + name_ + "' negotiated protocol version " +
                         init->protocol_version + " (requested " + MCP_PROTOCOL_VERSION + ")");
    }

    server_info_.set(init->server_info);
    server_capabilities_.set(init->capabilities);
    protocol_version_.set(init->protocol_version);

    auto sent = co_await send_notification("notifications/initialized", std::nullopt);
    if (!sent) {
        co_return tl::unexpected(co_await abort_handshake(sent.error()));
    }

    expected = ConnectionState::Initializing;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Ready)) {
        co_return tl::unexpected(co_await abort_handshake(ClientError::disconnected()));
    }

    MCPLINK_LOG_INFO("Connected to MCP server '" + name_ + "' (" +
                     init->server_info.name + " " + init->server_info.version + ")");
    co_return std::move(*init);
}

asio::awaitable<ClientError> AsyncMcpClient::abort_handshake(ClientError error) {
    MCPLINK_LOG_WARN("MCP handshake with '" + name_ + "' failed: " + error.message);
    transport_->terminate();
    mark_disconnected();
    co_await join_reader();
    co_return error;
}

asio::awaitable<void> AsyncMcpClient::shutdown() {
    auto self = shared_from_this();

    bool expected = false;
    if (!shutdown_started_.compare_exchange_strong(expected, true)) {
        co_await join_reader();
        co_return;
    }

    co_await transport_->async_shutdown(config_.shutdown_timeout);
    mark_disconnected();
    co_await join_reader();

    MCPLINK_LOG_INFO("MCP server '" + name_ + "' shut down");
}

asio::awaitable<void> AsyncMcpClient::join_reader() {
    if (!reader_started_) {
        co_return;
    }
    // The reader never sends; closing the channel releases every waiter.
    auto [ec] = co_await reader_done_->async_receive(asio::as_tuple(asio::use_awaitable));
    (void)ec;
}

bool AsyncMcpClient::mark_disconnected() {
    const auto previous = state_.exchange(ConnectionState::Disconnected);
    if (previous == ConnectionState::Disconnected) {
        return false;
    }

    const auto failed = pending_->fail_all(ClientError::disconnected());
    wake_tools_waiters(false);

    if (previous != ConnectionState::Connecting) {
        MCPLINK_LOG_INFO("Disconnected from MCP server '" + name_ + "'" +
                         (failed > 0 ? " (" + std::to_string(failed) + " pending requests failed)" : ""));
    }
    return true;
}

std::string AsyncMcpClient::stderr_output() const {
    return transport_->diagnostics();
}

// ═══════════════════════════════════════════════════════════════════════════
// Raw JSON-RPC
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<Json>> AsyncMcpClient::request(
    std::string method,
    std::optional<Json> params,
    std::optional<std::chrono::milliseconds> timeout
) {
    auto self = shared_from_this();
    if (state_.load() != ConnectionState::Ready) {
        co_return tl::unexpected(ClientError::disconnected());
    }
    co_return co_await send_request(
        std::move(method), std::move(params), timeout.value_or(config_.request_timeout));
}

asio::awaitable<ClientResult<void>> AsyncMcpClient::notify(
    std::string method,
    std::optional<Json> params
) {
    auto self = shared_from_this();
    if (state_.load() != ConnectionState::Ready) {
        co_return tl::unexpected(ClientError::disconnected());
    }
    co_return co_await send_notification(std::move(method), std::move(params));
}

asio::awaitable<ClientResult<Json>> AsyncMcpClient::send_request(
    std::string method,
    std::optional<Json> params,
    std::chrono::milliseconds timeout
) {
    if (state_.load() == ConnectionState::Disconnected) {
        co_return tl::unexpected(ClientError::disconnected());
    }

    const std::uint64_t id = pending_->allocate();

    std::string line;
    try {
        line = JsonRpcRequest{id, method, std::move(params)}.to_json().dump();
    } catch (const Json::exception& e) {
        co_return tl::unexpected(ClientError::serialization(e.what()));
    }

    auto slot = pending_->register_request(id);
    if (!slot) {
        co_return tl::unexpected(ClientError::disconnected());
    }

    // The timer only ever touches the table; whoever removes the entry first
    // (response, timeout or disconnect) is the one that resolves the caller.
    asio::steady_timer timer(transport_->get_executor());
    if (timeout.count() > 0) {
        timer.expires_after(timeout);
        timer.async_wait([table = pending_, id](asio::error_code ec) {
            if (!ec) {
                table->complete(id, ClientResult<Json>(tl::unexpect, ClientError::timeout()));
            }
        });
    }

    // A request that times out while queued for the pipe is never written.
    auto sent = co_await transport_->async_send(
        std::move(line), [table = pending_, id] { return table->contains(id); });
    if (!sent) {
        timer.cancel();
        pending_->remove(id);
        co_return tl::unexpected(ClientError::from_transport_error(sent.error()));
    }

    auto [ec, result] = co_await slot->async_receive(asio::as_tuple(asio::use_awaitable));
    timer.cancel();
    if (ec) {
        pending_->remove(id);
        co_return tl::unexpected(ClientError::disconnected());
    }

    if (!result && result.error().is(ClientErrorCode::Timeout)) {
        MCPLINK_LOG_WARN("MCP request '" + method + "' to '" + name_ + "' timed out after " +
                         std::to_string(timeout.count()) + "ms");
    }
    co_return std::move(result);
}

asio::awaitable<ClientResult<void>> AsyncMcpClient::send_notification(
    std::string method,
    std::optional<Json> params
) {
    if (state_.load() == ConnectionState::Disconnected) {
        co_return tl::unexpected(ClientError::disconnected());
    }

    std::string line;
    try {
        line = JsonRpcNotification{std::move(method), std::move(params)}.to_json().dump();
    } catch (const Json::exception& e) {
        co_return tl::unexpected(ClientError::serialization(e.what()));
    }

    auto sent = co_await transport_->async_send(std::move(line));
    if (!sent) {
        co_return tl::unexpected(ClientError::from_transport_error(sent.error()));
    }
    co_return ClientResult<void>{};
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools API
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<ListToolsResult>> AsyncMcpClient::list_tools(
    std::optional<std::string> cursor
) {
    auto self = shared_from_this();

    Json params = Json::object();
    if (cursor) {
        params["cursor"] = *cursor;
    }

    auto result = co_await request("tools/list", std::move(params));
    if (!result) {
        co_return tl::unexpected(result.error());
    }
    co_return decode_result<ListToolsResult>(*result);
}

asio::awaitable<ClientResult<std::vector<Tool>>> AsyncMcpClient::list_all_tools() {
    auto self = shared_from_this();

    std::vector<Tool> tools;
    std::optional<std::string> cursor;
    for (;;) {
        auto page = co_await list_tools(cursor);
        if (!page) {
            co_return tl::unexpected(page.error());
        }
        for (auto& tool : page->tools) {
            tools.push_back(std::move(tool));
        }
        if (!page->next_cursor || page->next_cursor->empty() || page->next_cursor == cursor) {
            break;
        }
        cursor = std::move(page->next_cursor);
    }
    co_return tools;
}

asio::awaitable<ClientResult<CallToolResult>> AsyncMcpClient::call_tool(
    std::string name,
    Json arguments
) {
    auto self = shared_from_this();

    CallToolParams params;
    params.name = std::move(name);
    if (!arguments.is_null()) {
        params.arguments = std::move(arguments);
    }

    auto result = co_await request("tools/call", params.to_json());
    if (!result) {
        co_return tl::unexpected(result.error());
    }
    co_return decode_result<CallToolResult>(*result);
}

asio::awaitable<ClientResult<void>> AsyncMcpClient::async_wait_tools_changed() {
    auto self = shared_from_this();

    auto signal = std::make_shared<ChangeSignal>(transport_->get_executor(), 1);
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        if (waiters_closed_) {
            co_return tl::unexpected(ClientError::disconnected());
        }
        tools_waiters_.push_back(signal);
    }

    auto [ec, changed] = co_await signal->async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec || !changed) {
        co_return tl::unexpected(ClientError::disconnected());
    }
    co_return ClientResult<void>{};
}

void AsyncMcpClient::wake_tools_waiters(bool changed) {
    std::vector<std::shared_ptr<ChangeSignal>> waiters;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        waiters.swap(tools_waiters_);
        if (!changed) {
            waiters_closed_ = true;
        }
    }
    for (auto& waiter : waiters) {
        waiter->try_send(asio::error_code{}, changed);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Resources API
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<ListResourcesResult>> AsyncMcpClient::list_resources(
    std::optional<std::string> cursor
) {
    auto self = shared_from_this();

    Json params = Json::object();
    if (cursor) {
        params["cursor"] = *cursor;
    }

    auto result = co_await request("resources/list", std::move(params));
    if (!result) {
        co_return tl::unexpected(result.error());
    }
    co_return decode_result<ListResourcesResult>(*result);
}

asio::awaitable<ClientResult<ReadResourceResult>> AsyncMcpClient::read_resource(std::string uri) {
    auto self = shared_from_this();

    auto result = co_await request("resources/read", Json{{"uri", std::move(uri)}});
    if (!result) {
        co_return tl::unexpected(result.error());
    }
    co_return decode_result<ReadResourceResult>(*result);
}

// ═══════════════════════════════════════════════════════════════════════════
// Notification Handlers
// ═══════════════════════════════════════════════════════════════════════════

void AsyncMcpClient::on_tools_changed(ToolsChangedHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    tools_changed_handler_ = std::move(handler);
}

void AsyncMcpClient::on_resources_changed(ResourcesChangedHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    resources_changed_handler_ = std::move(handler);
}

void AsyncMcpClient::on_log_message(LogMessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    log_message_handler_ = std::move(handler);
}

// ═══════════════════════════════════════════════════════════════════════════
// Reader
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> AsyncMcpClient::reader_loop(
    std::weak_ptr<AsyncMcpClient> weak_self,
    std::shared_ptr<IAsyncTransport> transport
) {
    for (;;) {
        auto line = co_await transport->async_receive();

        // Only hold the client while handling a line, never across a read.
        auto self = weak_self.lock();
        if (!self) {
            co_return;
        }

        if (!line) {
            if (line.error().category == TransportError::Category::Closed) {
                MCPLINK_LOG_INFO("MCP server '" + self->name_ + "' closed its output");
            } else {
                MCPLINK_LOG_WARN("Reading from MCP server '" + self->name_ + "' failed: " +
                                 line.error().message);
            }
            self->mark_disconnected();
            co_return;
        }

        co_await self->handle_line(*line);
    }
}

asio::awaitable<void> AsyncMcpClient::handle_line(const std::string& line) {
    auto message = parse_server_message(line);
    if (!message) {
        MCPLINK_LOG_WARN("Skipping invalid message from MCP server '" + name_ + "' (" +
                         message.error().message + "): " + line);
        co_return;
    }

    if (const auto* response = std::get_if<JsonRpcResponse>(&*message)) {
        handle_response(*response);
    } else if (const auto* notification = std::get_if<JsonRpcNotification>(&*message)) {
        handle_notification(*notification);
    } else {
        co_await answer_server_request(std::get<JsonRpcIncomingRequest>(*message));
    }
}

asio::awaitable<void> AsyncMcpClient::answer_server_request(const JsonRpcIncomingRequest& request) {
    JsonRpcResponse reply{request.id};
    if (request.method == "ping") {
        reply.result = Json::object();
    } else if (request.method == "roots/list") {
        // Roots are advertised but none are configured
        reply.result = Json{{"roots", Json::array()}};
    } else {
        MCPLINK_LOG_DEBUG("MCP server '" + name_ + "' sent unsupported request '" +
                          request.method + "'");
        reply.error = JsonRpcError{ErrorCode::MethodNotFound, "Method not found: " + request.method};
    }

    std::string line;
    try {
        line = reply.to_json().dump();
    } catch (const Json::exception& e) {
        MCPLINK_LOG_ERROR("Failed to encode reply to '" + request.method + "': " + e.what());
        co_return;
    }

    auto sent = co_await transport_->async_send(std::move(line));
    if (!sent) {
        MCPLINK_LOG_ERROR("Failed to answer '" + request.method + "' from MCP server '" + name_ +
                          "': " + sent.error().message);
    }
}

void AsyncMcpClient::handle_response(const JsonRpcResponse& response) {
    const auto id = response.numeric_id();
    if (!id) {
        MCPLINK_LOG_WARN("MCP server '" + name_ + "' sent a response with unexpected id " +
                         response.id.dump());
        return;
    }

    ClientResult<Json> result = response.is_error()
        ? ClientResult<Json>(tl::unexpect, ClientError::from_rpc_error(*response.error))
        : ClientResult<Json>(response.result.value_or(Json()));

    if (!pending_->complete(*id, std::move(result))) {
        MCPLINK_LOG_DEBUG("Dropping response for unknown request id " + std::to_string(*id) +
                          " from MCP server '" + name_ + "'");
    }
}

void AsyncMcpClient::handle_notification(const JsonRpcNotification& notification) {
    const auto& method = notification.method;

    if (method == "notifications/tools/list_changed") {
        MCPLINK_LOG_INFO("MCP server '" + name_ + "' tool list changed");
        tools_changed_generation_.fetch_add(1);

        ToolsChangedHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handler = tools_changed_handler_;
        }
        if (handler) {
            handler();
        }
        wake_tools_waiters(true);
        return;
    }

    if (method == "notifications/resources/list_changed") {
        MCPLINK_LOG_INFO("MCP server '" + name_ + "' resource list changed");

        ResourcesChangedHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handler = resources_changed_handler_;
        }
        if (handler) {
            handler();
        }
        return;
    }

    if (method == "notifications/message") {
        handle_log_message(notification.params.value_or(Json::object()));
        return;
    }

    MCPLINK_LOG_DEBUG("Ignoring notification '" + method + "' from MCP server '" + name_ + "'");
}

void AsyncMcpClient::handle_log_message(const Json& params) {
    LoggingMessageParams message;
    try {
        message = LoggingMessageParams::from_json(params);
    } catch (const Json::exception& e) {
        MCPLINK_LOG_WARN("Malformed log message from MCP server '" + name_ + "': " + e.what());
        return;
    }

    get_logger().write(
        to_log_level(message.level),
        "MCP server '" + name_ + "' [" + to_string(message.level) + "]: " + message.text());

    LogMessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = log_message_handler_;
    }
    if (handler) {
        handler(message);
    }
}

}  // namespace mcplink::async
