#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP Client Manager
// ═══════════════════════════════════════════════════════════════════════════
// Owns the connections to every configured server and the flat tool catalog
// built from them. A server that fails to start, handshake or list its tools
// is logged and skipped; it never prevents the others from connecting.
//
// All methods are expected to run on the manager's executor (one io_context
// thread); the manager itself does no locking.

#include "mcplink/async/async_mcp_client.hpp"
#include "mcplink/config/server_config.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcplink {

struct DiscoveredTool {
    std::string server_name;
    Tool tool;

    [[nodiscard]] std::string namespaced_name() const;
};

/// Spawn one stdio server and run the handshake. The config is used as is;
/// expand environment references first.
[[nodiscard]] asio::awaitable<ClientResult<std::shared_ptr<async::AsyncMcpClient>>> connect_stdio_server(
    asio::any_io_executor executor,
    std::string name,
    const McpServerConfig& config,
    async::AsyncMcpClientConfig client_config = {}
);

class McpClientManager {
public:
    explicit McpClientManager(
        asio::any_io_executor executor,
        async::AsyncMcpClientConfig client_config = {}
    );

    McpClientManager(const McpClientManager&) = delete;
    McpClientManager& operator=(const McpClientManager&) = delete;

    /// Connect every enabled stdio server, in name order.
    [[nodiscard]] asio::awaitable<void> connect_all(const McpConfig& config);

    /// Graceful shutdown of every connection. Failures are logged only.
    [[nodiscard]] asio::awaitable<void> shutdown_all();

    /// Route mcp__{server}__{tool} to its server. An unknown name or a
    /// disconnected server yields an error *result*, not a ClientError, so it
    /// can be shown to whoever asked for the tool.
    [[nodiscard]] asio::awaitable<ClientResult<CallToolResult>> call_tool(
        const std::string& namespaced_name,
        Json arguments = Json::object()
    );

    [[nodiscard]] std::shared_ptr<async::AsyncMcpClient> get_client(const std::string& name) const;
    [[nodiscard]] const std::vector<DiscoveredTool>& discovered_tools() const noexcept { return tools_; }
    [[nodiscard]] const DiscoveredTool* find_tool(const std::string& namespaced_name) const;
    [[nodiscard]] std::size_t server_count() const noexcept { return clients_.size(); }
    [[nodiscard]] std::vector<std::string> server_names() const;

private:
    asio::any_io_executor executor_;
    async::AsyncMcpClientConfig client_config_;

    std::map<std::string, std::shared_ptr<async::AsyncMcpClient>> clients_;
    std::vector<DiscoveredTool> tools_;
};

}  // namespace mcplink
