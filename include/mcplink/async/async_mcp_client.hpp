#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async MCP Client
// ═══════════════════════════════════════════════════════════════════════════
// One live connection to one MCP server.
//
// Usage:
//   asio::io_context io;
//   auto transport = make_async_process_transport(io.get_executor(), {"my-server"});
//   auto client = AsyncMcpClient::create("files", transport);
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       co_await client->connect();
//       auto tools = co_await client->list_all_tools();
//       auto result = co_await client->call_tool("echo", {{"text", "hi"}});
//       co_await client->shutdown();
//   }, asio::detached);
//
//   io.run();
//
// - Lifecycle: Connecting -> Initializing -> Ready -> Disconnected, and
//   Disconnected is terminal.
// - Each request gets its own id and slot in a per-connection correlation
//   table, so responses may arrive in any order.
// - A reader coroutine runs on the connection's strand for as long as the
//   server's stdout is open; shutdown() joins it.
// - Instances are shared (create()); every coroutine keeps the client alive
//   until it completes.

#include "mcplink/async/async_transport.hpp"
#include "mcplink/client/client_error.hpp"
#include "mcplink/client/pending_requests.hpp"
#include "mcplink/protocol/mcp_types.hpp"
#include "mcplink/util/write_once.hpp"

#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcplink::async {

inline constexpr const char* MCPLINK_VERSION = "0.1.0";

// ═══════════════════════════════════════════════════════════════════════════
// Connection State
// ═══════════════════════════════════════════════════════════════════════════

enum class ConnectionState {
    Connecting,
    Initializing,
    Ready,
    Disconnected
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Initializing: return "Initializing";
        case ConnectionState::Ready:        return "Ready";
        case ConnectionState::Disconnected: return "Disconnected";
    }
    return "Unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct AsyncMcpClientConfig {
    /// Client identification sent in initialize
    std::string client_name = "mcplink";
    std::string client_version = MCPLINK_VERSION;

    /// Advertised capabilities (roots with listChanged)
    ClientCapabilities capabilities{ClientCapabilities::Roots{true}};

    /// Wait for the initialize response
    std::chrono::milliseconds init_timeout{30000};

    /// Default per-request wait
    std::chrono::milliseconds request_timeout{60000};

    /// Grace period between closing stdin and killing the server
    std::chrono::milliseconds shutdown_timeout{5000};
};

// ═══════════════════════════════════════════════════════════════════════════
// Async MCP Client
// ═══════════════════════════════════════════════════════════════════════════

class AsyncMcpClient : public std::enable_shared_from_this<AsyncMcpClient> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    using ToolsChangedHandler = std::function<void()>;
    using ResourcesChangedHandler = std::function<void()>;
    using LogMessageHandler = std::function<void(const LoggingMessageParams&)>;

    // ─────────────────────────────────────────────────────────────────────────
    // Construction
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static std::shared_ptr<AsyncMcpClient> create(
        std::string name,
        std::shared_ptr<IAsyncTransport> transport,
        AsyncMcpClientConfig config = {}
    );

    /// Use create(); the tag keeps construction on the shared_ptr path.
    AsyncMcpClient(
        PrivateTag,
        std::string name,
        std::shared_ptr<IAsyncTransport> transport,
        AsyncMcpClientConfig config
    );

    /// Kills the server if it is still running; no graceful wait.
    ~AsyncMcpClient();

    AsyncMcpClient(const AsyncMcpClient&) = delete;
    AsyncMcpClient& operator=(const AsyncMcpClient&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Start the transport and run the initialize handshake. On failure the
    /// server is killed and the connection is left Disconnected.
    [[nodiscard]] asio::awaitable<ClientResult<InitializeResult>> connect();

    /// Close stdin, wait shutdown_timeout for exit, then kill. Fails every
    /// pending request and joins the reader. Safe to call more than once.
    [[nodiscard]] asio::awaitable<void> shutdown();

    [[nodiscard]] ConnectionState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool is_connected() const noexcept { return state() == ConnectionState::Ready; }

    // ─────────────────────────────────────────────────────────────────────────
    // Raw JSON-RPC
    // ─────────────────────────────────────────────────────────────────────────

    /// Send a request and wait for its response (request_timeout by default).
    [[nodiscard]] asio::awaitable<ClientResult<Json>> request(
        std::string method,
        std::optional<Json> params = std::nullopt,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    [[nodiscard]] asio::awaitable<ClientResult<void>> notify(
        std::string method,
        std::optional<Json> params = std::nullopt
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Tools API
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<ClientResult<ListToolsResult>> list_tools(
        std::optional<std::string> cursor = std::nullopt
    );

    /// Every page of tools/list, following nextCursor
    [[nodiscard]] asio::awaitable<ClientResult<std::vector<Tool>>> list_all_tools();

    [[nodiscard]] asio::awaitable<ClientResult<CallToolResult>> call_tool(
        std::string name,
        Json arguments = Json::object()
    );

    /// Completes on the next tools/list_changed notification, or with
    /// Disconnected once the connection ends.
    [[nodiscard]] asio::awaitable<ClientResult<void>> async_wait_tools_changed();

    /// Number of tools/list_changed notifications seen so far
    [[nodiscard]] std::uint64_t tools_changed_generation() const noexcept {
        return tools_changed_generation_.load();
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Resources API
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<ClientResult<ListResourcesResult>> list_resources(
        std::optional<std::string> cursor = std::nullopt
    );

    [[nodiscard]] asio::awaitable<ClientResult<ReadResourceResult>> read_resource(std::string uri);

    // ─────────────────────────────────────────────────────────────────────────
    // Notification Handlers
    // ─────────────────────────────────────────────────────────────────────────
    // Invoked from the reader coroutine; keep them short.

    void on_tools_changed(ToolsChangedHandler handler);
    void on_resources_changed(ResourcesChangedHandler handler);
    void on_log_message(LogMessageHandler handler);

    // ─────────────────────────────────────────────────────────────────────────
    // Server Information
    // ─────────────────────────────────────────────────────────────────────────
    // Set once during the handshake; empty before Ready.

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::optional<Implementation> server_info() const { return server_info_.copy(); }
    [[nodiscard]] std::optional<ServerCapabilities> server_capabilities() const { return server_capabilities_.copy(); }
    [[nodiscard]] std::optional<std::string> protocol_version() const { return protocol_version_.copy(); }

    /// Whatever the server wrote to stderr (bounded)
    [[nodiscard]] std::string stderr_output() const;

    [[nodiscard]] std::size_t pending_request_count() const { return pending_->size(); }
    [[nodiscard]] const AsyncMcpClientConfig& config() const noexcept { return config_; }

private:
    using DoneSignal = asio::experimental::channel<void(asio::error_code)>;
    using ChangeSignal = asio::experimental::channel<void(asio::error_code, bool)>;

    // ─────────────────────────────────────────────────────────────────────────
    // Internal
    // ─────────────────────────────────────────────────────────────────────────

    asio::awaitable<ClientResult<Json>> send_request(
        std::string method,
        std::optional<Json> params,
        std::chrono::milliseconds timeout
    );

    asio::awaitable<ClientResult<void>> send_notification(
        std::string method,
        std::optional<Json> params
    );

    /// Tear down a failed handshake and hand back the error.
    asio::awaitable<ClientError> abort_handshake(ClientError error);

    asio::awaitable<void> join_reader();

    static asio::awaitable<void> reader_loop(
        std::weak_ptr<AsyncMcpClient> weak_self,
        std::shared_ptr<IAsyncTransport> transport
    );

    asio::awaitable<void> handle_line(const std::string& line);
    void handle_response(const JsonRpcResponse& response);
    void handle_notification(const JsonRpcNotification& notification);
    void handle_log_message(const Json& params);

    /// ping and roots/list are answered; any other method gets MethodNotFound.
    asio::awaitable<void> answer_server_request(const JsonRpcIncomingRequest& request);

    /// Single convergence point for EOF, read errors, shutdown and failed
    /// handshakes. Returns true only for the call that made the transition.
    bool mark_disconnected();

    void wake_tools_waiters(bool changed);

    // ─────────────────────────────────────────────────────────────────────────
    // State
    // ─────────────────────────────────────────────────────────────────────────

    std::string name_;
    AsyncMcpClientConfig config_;
    std::shared_ptr<IAsyncTransport> transport_;
    asio::strand<asio::any_io_executor> strand_;

    std::atomic<ConnectionState> state_{ConnectionState::Connecting};
    std::atomic<bool> shutdown_started_{false};

    std::shared_ptr<PendingRequests> pending_;

    bool reader_started_{false};
    std::shared_ptr<DoneSignal> reader_done_;

    WriteOnce<Implementation> server_info_;
    WriteOnce<ServerCapabilities> server_capabilities_;
    WriteOnce<std::string> protocol_version_;

    std::atomic<std::uint64_t> tools_changed_generation_{0};

    mutable std::mutex handlers_mutex_;
    ToolsChangedHandler tools_changed_handler_;
    ResourcesChangedHandler resources_changed_handler_;
    LogMessageHandler log_message_handler_;
    std::vector<std::shared_ptr<ChangeSignal>> tools_waiters_;
    bool waiters_closed_{false};
};

}  // namespace mcplink::async
