#include "mcplink/client/client_manager.hpp"
#include "mcplink/async/async_process_transport.hpp"
#include "mcplink/client/tool_catalog.hpp"
#include "mcplink/log/logger.hpp"

#include <exception>

namespace mcplink {

namespace {

CallToolResult error_result(std::string text) {
    CallToolResult result;
    result.content.push_back(TextContent{std::move(text)});
    result.is_error = true;
    return result;
}

}  // namespace

std::string DiscoveredTool::namespaced_name() const {
    return namespaced_tool_name(server_name, tool.name);
}

// ═══════════════════════════════════════════════════════════════════════════
// Single server
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<std::shared_ptr<async::AsyncMcpClient>>> connect_stdio_server(
    asio::any_io_executor executor,
    std::string name,
    const McpServerConfig& config,
    async::AsyncMcpClientConfig client_config
) {
    async::AsyncProcessConfig process;
    process.command = config.command;
    process.args = config.args;
    process.env = config.env;
    process.stderr_handling = async::StderrHandling::Capture;

    auto transport = async::make_async_process_transport(executor, std::move(process));
    auto client = async::AsyncMcpClient::create(std::move(name), transport, std::move(client_config));

    auto init = co_await client->connect();
    if (!init) {
        co_return tl::unexpected(init.error());
    }
    co_return client;
}

// ═══════════════════════════════════════════════════════════════════════════
// Manager
// ═══════════════════════════════════════════════════════════════════════════

McpClientManager::McpClientManager(
    asio::any_io_executor executor,
    async::AsyncMcpClientConfig client_config
)
    : executor_(std::move(executor))
    , client_config_(std::move(client_config))
{}

asio::awaitable<void> McpClientManager::connect_all(const McpConfig& config) {
    if (!config.client_enabled) {
        MCPLINK_LOG_INFO("MCP client disabled in config, not connecting to any server");
        co_return;
    }

    for (const auto& [name, server] : config.servers) {
        if (clients_.contains(name)) {
            MCPLINK_LOG_WARN("MCP server '" + name + "' is already connected, skipping");
            continue;
        }
        if (server.transport != "stdio") {
            MCPLINK_LOG_WARN("MCP server '" + name + "' uses unsupported transport '" +
                             server.transport + "', skipping");
            continue;
        }

        const auto expanded = expand_server_config(server);
        auto connected = co_await connect_stdio_server(executor_, name, expanded, client_config_);
        if (!connected) {
            MCPLINK_LOG_WARN("Failed to connect to MCP server '" + name + "': " +
                             connected.error().message);
            continue;
        }
        auto client = std::move(*connected);

        auto tools = co_await client->list_all_tools();
        if (!tools) {
            MCPLINK_LOG_WARN("Failed to list tools of MCP server '" + name + "': " +
                             tools.error().message);
            co_await client->shutdown();
            continue;
        }

        MCPLINK_LOG_INFO("MCP server '" + name + "' provides " + std::to_string(tools->size()) + " tools");
        for (auto& tool : *tools) {
            tools_.push_back(DiscoveredTool{name, std::move(tool)});
        }
        clients_.emplace(name, std::move(client));
    }
}

asio::awaitable<void> McpClientManager::shutdown_all() {
    auto clients = std::move(clients_);
    clients_.clear();
    tools_.clear();

    for (auto& [name, client] : clients) {
        try {
            co_await client->shutdown();
        } catch (const std::exception& e) {
            MCPLINK_LOG_WARN("Shutting down MCP server '" + name + "' failed: " + e.what());
        }
    }
}

asio::awaitable<ClientResult<CallToolResult>> McpClientManager::call_tool(
    const std::string& namespaced_name,
    Json arguments
) {
    // Route through the catalog: server names may themselves contain "__"
    const auto* entry = find_tool(namespaced_name);
    const auto it = entry ? clients_.find(entry->server_name) : clients_.end();
    if (it == clients_.end()) {
        co_return error_result("unknown MCP tool: " + namespaced_name);
    }

    auto client = it->second;
    if (!client->is_connected()) {
        co_return error_result("MCP server '" + entry->server_name + "' is disconnected");
    }
    const std::string tool_name = entry->tool.name;
    co_return co_await client->call_tool(tool_name, std::move(arguments));
}

std::shared_ptr<async::AsyncMcpClient> McpClientManager::get_client(const std::string& name) const {
    const auto it = clients_.find(name);
    return it == clients_.end() ? nullptr : it->second;
}

const DiscoveredTool* McpClientManager::find_tool(const std::string& namespaced_name) const {
    for (const auto& tool : tools_) {
        if (tool.namespaced_name() == namespaced_name) {
            return &tool;
        }
    }
    return nullptr;
}

std::vector<std::string> McpClientManager::server_names() const {
    std::vector<std::string> names;
    names.reserve(clients_.size());
    for (const auto& [name, client] : clients_) {
        names.push_back(name);
    }
    return names;
}

}  // namespace mcplink
