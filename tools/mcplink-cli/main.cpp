// ─────────────────────────────────────────────────────────────────────────────
// mcplink-cli - MCP stdio client
// ─────────────────────────────────────────────────────────────────────────────
// Launches one or more MCP servers over stdio and talks to them.
//
// Usage:
//   # A single server
//   mcplink-cli -c npx -a -y -a @modelcontextprotocol/server-filesystem -a /tmp --list-tools
//
//   # Every server in a config file
//   mcplink-cli --config mcp.json --list-tools
//   mcplink-cli --config mcp.json --call-tool mcp__filesystem__read_file \
//               --tool-args '{"path":"/tmp/notes.txt"}'
//   mcplink-cli --config mcp.json --server filesystem --read-resource file:///tmp/notes.txt

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcplink/client/client_manager.hpp"
#include "mcplink/client/tool_catalog.hpp"
#include "mcplink/log/logger.hpp"
#include "mcplink/log/spdlog_logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace mcplink;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* blue    = "\033[34m";
    const char* magenta = "\033[35m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

struct CliOptions {
    bool json_output = false;
    std::optional<std::string> server;
    std::string tool_args = "{}";
};

/// The connection a per-server command applies to: --server, or the only one.
std::shared_ptr<async::AsyncMcpClient> pick_client(const McpClientManager& manager, const CliOptions& opts) {
    if (opts.server) {
        auto client = manager.get_client(*opts.server);
        if (!client) {
            print_error("no connected MCP server named '" + *opts.server + "'");
        }
        return client;
    }
    if (manager.server_count() != 1) {
        print_error("several servers are connected, choose one with --server");
        return nullptr;
    }
    return manager.get_client(manager.server_names().front());
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_info(const McpClientManager& manager, const CliOptions& opts) {
    if (opts.json_output) {
        Json output = Json::array();
        for (const auto& name : manager.server_names()) {
            auto client = manager.get_client(name);
            Json entry = {{"name", name}, {"state", std::string(to_string(client->state()))}};
            if (auto info = client->server_info()) {
                entry["serverInfo"] = info->to_json();
            }
            if (auto version = client->protocol_version()) {
                entry["protocolVersion"] = *version;
            }
            output.push_back(std::move(entry));
        }
        print_json(output);
        return 0;
    }

    print_header("Servers");
    for (const auto& name : manager.server_names()) {
        auto client = manager.get_client(name);
        std::cout << color::c(color::bold) << color::c(color::green) << "• " << name << color::c(color::reset);
        if (auto info = client->server_info()) {
            std::cout << "  " << info->name << " " << color::c(color::dim) << info->version << color::c(color::reset);
        }
        std::cout << "\n";
        if (auto version = client->protocol_version()) {
            std::cout << "  Protocol: " << *version << "\n";
        }
        if (auto caps = client->server_capabilities()) {
            std::vector<std::string> names;
            if (caps->tools) names.push_back("tools");
            if (caps->resources) names.push_back("resources");
            if (caps->prompts) names.push_back("prompts");
            if (caps->logging) names.push_back("logging");
            std::cout << "  Capabilities: " << color::c(color::magenta);
            for (std::size_t i = 0; i < names.size(); ++i) {
                if (i > 0) std::cout << ", ";
                std::cout << names[i];
            }
            std::cout << color::c(color::reset) << "\n";
        }
        std::cout << "\n";
    }
    std::cout << manager.discovered_tools().size() << " tools discovered\n";
    return 0;
}

int cmd_list_tools(const McpClientManager& manager, const CliOptions& opts) {
    const auto& tools = manager.discovered_tools();

    if (opts.json_output) {
        Json output = Json::array();
        for (const auto& entry : tools) {
            Json j = entry.tool.to_json();
            j["server"] = entry.server_name;
            j["namespacedName"] = entry.namespaced_name();
            output.push_back(std::move(j));
        }
        print_json(output);
        return 0;
    }

    print_header("Tools");
    if (tools.empty()) {
        std::cout << color::c(color::dim) << "(no tools available)" << color::c(color::reset) << "\n";
        return 0;
    }
    for (const auto& entry : tools) {
        std::cout << color::c(color::bold) << color::c(color::yellow)
                  << "• " << entry.namespaced_name() << color::c(color::reset);
        if (entry.tool.description) {
            std::cout << "\n  " << color::c(color::dim) << *entry.tool.description << color::c(color::reset);
        }
        if (const auto& ann = entry.tool.annotations) {
            std::vector<std::string> hints;
            if (ann->read_only_hint.value_or(false)) hints.push_back("read-only");
            if (ann->destructive_hint.value_or(false)) hints.push_back("destructive");
            if (ann->idempotent_hint.value_or(false)) hints.push_back("idempotent");
            if (ann->open_world_hint.value_or(false)) hints.push_back("open-world");
            if (!hints.empty()) {
                std::cout << "\n  " << color::c(color::magenta) << "[";
                for (std::size_t i = 0; i < hints.size(); ++i) {
                    if (i > 0) std::cout << ", ";
                    std::cout << hints[i];
                }
                std::cout << "]" << color::c(color::reset);
            }
        }
        std::cout << "\n\n";
    }
    return 0;
}

asio::awaitable<int> cmd_list_resources(const McpClientManager& manager, const CliOptions& opts) {
    Json output = Json::array();
    int exit_code = 0;

    if (!opts.json_output) {
        print_header("Resources");
    }

    for (const auto& name : manager.server_names()) {
        if (opts.server && *opts.server != name) {
            continue;
        }
        auto client = manager.get_client(name);
        auto result = co_await client->list_resources();
        if (!result) {
            print_error(name + ": " + result.error().message);
            exit_code = 1;
            continue;
        }

        for (const auto& res : result->resources) {
            if (opts.json_output) {
                Json j = res.to_json();
                j["server"] = name;
                output.push_back(std::move(j));
                continue;
            }
            std::cout << color::c(color::bold) << color::c(color::blue)
                      << "• " << res.name << color::c(color::reset)
                      << color::c(color::dim) << "  (" << name << ")" << color::c(color::reset) << "\n";
            std::cout << "  " << color::c(color::dim) << res.uri << color::c(color::reset);
            if (res.mime_type) {
                std::cout << " (" << *res.mime_type << ")";
            }
            std::cout << "\n";
            if (res.description) {
                std::cout << "  " << *res.description << "\n";
            }
            std::cout << "\n";
        }
    }

    if (opts.json_output) {
        print_json(output);
    }
    co_return exit_code;
}

asio::awaitable<int> cmd_call_tool(McpClientManager& manager, const std::string& tool_name, const CliOptions& opts) {
    Json args = Json::parse(opts.tool_args, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        print_error("--tool-args must be a JSON object");
        co_return 1;
    }

    auto result = co_await manager.call_tool(tool_name, std::move(args));
    if (!result) {
        print_error(result.error().message);
        co_return 1;
    }

    if (opts.json_output) {
        print_json(result->to_json());
    } else {
        if (result->is_error) {
            print_error("Tool returned error");
        }
        std::cout << format_tool_result(result->content) << "\n";
    }
    co_return result->is_error ? 1 : 0;
}

asio::awaitable<int> cmd_read_resource(const McpClientManager& manager, const std::string& uri, const CliOptions& opts) {
    auto client = pick_client(manager, opts);
    if (!client) {
        co_return 1;
    }

    auto result = co_await client->read_resource(uri);
    if (!result) {
        print_error(result.error().message);
        co_return 1;
    }

    if (opts.json_output) {
        Json contents = Json::array();
        for (const auto& item : result->contents) {
            contents.push_back(item.to_json());
        }
        print_json({{"contents", std::move(contents)}});
        co_return 0;
    }

    for (const auto& item : result->contents) {
        std::cout << color::c(color::dim) << item.uri;
        if (item.mime_type) {
            std::cout << " (" << *item.mime_type << ")";
        }
        std::cout << color::c(color::reset) << "\n";
        if (item.text) {
            std::cout << *item.text << "\n";
        } else if (item.blob) {
            std::cout << "[blob: " << item.blob->size() << " bytes base64]\n";
        }
    }
    co_return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<int> run(McpClientManager& manager, const McpConfig& config,
                         const cxxopts::ParseResult& result, CliOptions opts) {
    co_await manager.connect_all(config);

    int exit_code = 0;
    if (manager.server_count() == 0) {
        print_error("no MCP server could be connected");
        exit_code = 1;
    } else if (result.count("list-tools")) {
        exit_code = cmd_list_tools(manager, opts);
    } else if (result.count("list-resources")) {
        exit_code = co_await cmd_list_resources(manager, opts);
    } else if (result.count("call-tool")) {
        exit_code = co_await cmd_call_tool(manager, result["call-tool"].as<std::string>(), opts);
    } else if (result.count("read-resource")) {
        exit_code = co_await cmd_read_resource(manager, result["read-resource"].as<std::string>(), opts);
    } else {
        exit_code = cmd_info(manager, opts);
    }

    co_await manager.shutdown_all();
    co_return exit_code;
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcplink-cli", "MCP stdio client");

    options.add_options()
        // Servers
        ("config", "MCP config file (JSON)", cxxopts::value<std::string>())
        ("c,command", "Server command to execute", cxxopts::value<std::string>())
        ("a,args", "Arguments for the server command", cxxopts::value<std::vector<std::string>>())
        ("server", "Server to use for per-server commands", cxxopts::value<std::string>())

        // Commands
        ("list-tools", "List tools of every server (namespaced)")
        ("list-resources", "List resources")
        ("call-tool", "Call a tool by namespaced name (mcp__server__tool)", cxxopts::value<std::string>())
        ("tool-args", "JSON arguments for tool call", cxxopts::value<std::string>()->default_value("{}"))
        ("read-resource", "Read a resource by URI", cxxopts::value<std::string>())
        ("info", "Show server info (default)")

        // Output options
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("v,verbose", "Enable verbose logging")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    mcplink-cli -c npx -a -y -a @modelcontextprotocol/server-everything --list-tools\n";
            std::cout << "    mcplink-cli --config mcp.json --call-tool mcp__everything__echo --tool-args '{\"message\":\"hi\"}'\n";
            std::cout << "    mcplink-cli --config mcp.json --server everything --read-resource test://static/resource/1\n";
            return 0;
        }

        color::enabled = !result.count("no-color");

        if (result.count("verbose")) {
            set_logger(make_spdlog_console_logger(LogLevel::Debug));
        } else {
            auto console = std::make_unique<ConsoleLogger>(LogLevel::Warn);
            console->set_colors_enabled(color::enabled);
            set_logger(std::move(console));
        }

        CliOptions opts;
        opts.json_output = result.count("json") > 0;
        opts.tool_args = result["tool-args"].as<std::string>();
        if (result.count("server")) {
            opts.server = result["server"].as<std::string>();
        }

        const bool use_config = result.count("config") > 0;
        const bool use_command = result.count("command") > 0;
        if (use_config == use_command) {
            print_error("Specify exactly one of --config or --command");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        McpConfig config;
        if (use_config) {
            auto loaded = load_config_file(result["config"].as<std::string>());
            if (!loaded) {
                print_error(loaded.error().message);
                return 1;
            }
            config = std::move(*loaded);
        } else {
            McpServerConfig server;
            server.command = result["command"].as<std::string>();
            if (result.count("args")) {
                server.args = result["args"].as<std::vector<std::string>>();
            }
            config.servers.emplace("cli", std::move(server));
        }

        asio::io_context io;
        McpClientManager manager(io.get_executor());

        int exit_code = 1;
        asio::co_spawn(io, run(manager, config, result, opts),
            [&exit_code](std::exception_ptr ep, int code) {
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        print_error(e.what());
                    }
                    return;
                }
                exit_code = code;
            });
        io.run();

        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
