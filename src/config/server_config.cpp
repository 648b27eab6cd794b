#include "mcplink/config/server_config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace mcplink {

namespace {

ConfigError field_error(const std::string& server, const std::string& field, const std::string& what) {
    return ConfigError{"server '" + server + "': field '" + field + "' " + what};
}

ConfigResult<std::vector<std::string>> read_string_array(
    const std::string& server, const Json& node, const char* field
) {
    std::vector<std::string> out;
    const auto it = node.find(field);
    if (it == node.end() || it->is_null()) {
        return out;
    }
    if (!it->is_array()) {
        return tl::unexpected(field_error(server, field, "must be an array of strings"));
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return tl::unexpected(field_error(server, field, "must be an array of strings"));
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

ConfigResult<std::map<std::string, std::string>> read_string_map(
    const std::string& server, const Json& node, const char* field
) {
    std::map<std::string, std::string> out;
    const auto it = node.find(field);
    if (it == node.end() || it->is_null()) {
        return out;
    }
    if (!it->is_object()) {
        return tl::unexpected(field_error(server, field, "must be an object of strings"));
    }
    for (const auto& [key, value] : it->items()) {
        if (!value.is_string()) {
            return tl::unexpected(field_error(server, std::string(field) + "." + key, "must be a string"));
        }
        out.emplace(key, value.get<std::string>());
    }
    return out;
}

ConfigResult<bool> read_bool(const Json& node, const char* field, bool fallback) {
    const auto it = node.find(field);
    if (it == node.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        return tl::unexpected(ConfigError{std::string("field '") + field + "' must be a boolean"});
    }
    return it->get<bool>();
}

}  // namespace

std::optional<TrustLevel> trust_level_from_string(std::string_view s) noexcept {
    if (s == "trusted") return TrustLevel::Trusted;
    if (s == "untrusted") return TrustLevel::Untrusted;
    if (s == "sandbox") return TrustLevel::Sandbox;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Environment expansion
// ═══════════════════════════════════════════════════════════════════════════

std::string expand_env_vars(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    std::size_t pos = 0;
    while (pos < input.size()) {
        const auto start = input.find("${", pos);
        if (start == std::string_view::npos) {
            out.append(input.substr(pos));
            break;
        }
        out.append(input.substr(pos, start - pos));

        const auto end = input.find('}', start + 2);
        if (end == std::string_view::npos) {
            out.append(input.substr(start));
            break;
        }

        const std::string name(input.substr(start + 2, end - start - 2));
        const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
        if (value != nullptr) {
            out.append(value);
        } else {
            out.append(input.substr(start, end - start + 1));
        }
        pos = end + 1;
    }
    return out;
}

McpServerConfig expand_server_config(const McpServerConfig& config) {
    McpServerConfig expanded = config;
    expanded.command = expand_env_vars(config.command);
    for (auto& arg : expanded.args) {
        arg = expand_env_vars(arg);
    }
    for (auto& [key, value] : expanded.env) {
        value = expand_env_vars(value);
    }
    return expanded;
}

// ═══════════════════════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════════════════════

ConfigResult<McpServerConfig> parse_server_config(const std::string& name, const Json& node) {
    if (!node.is_object()) {
        return tl::unexpected(ConfigError{"server '" + name + "' must be an object"});
    }

    McpServerConfig config;

    const auto command = node.find("command");
    if (command == node.end()) {
        return tl::unexpected(field_error(name, "command", "is required"));
    }
    if (!command->is_string()) {
        return tl::unexpected(field_error(name, "command", "must be a string"));
    }
    config.command = command->get<std::string>();

    auto args = read_string_array(name, node, "args");
    if (!args) {
        return tl::unexpected(args.error());
    }
    config.args = std::move(*args);

    auto env = read_string_map(name, node, "env");
    if (!env) {
        return tl::unexpected(env.error());
    }
    config.env = std::move(*env);

    if (const auto it = node.find("transport"); it != node.end() && !it->is_null()) {
        if (!it->is_string()) {
            return tl::unexpected(field_error(name, "transport", "must be a string"));
        }
        config.transport = it->get<std::string>();
    }

    if (const auto perms = node.find("permissions"); perms != node.end() && !perms->is_null()) {
        if (!perms->is_object()) {
            return tl::unexpected(field_error(name, "permissions", "must be an object"));
        }
        if (const auto level = perms->find("trust_level"); level != perms->end() && !level->is_null()) {
            if (!level->is_string()) {
                return tl::unexpected(field_error(name, "permissions.trust_level", "must be a string"));
            }
            const auto parsed = trust_level_from_string(level->get<std::string>());
            if (!parsed) {
                return tl::unexpected(field_error(
                    name, "permissions.trust_level",
                    "must be one of trusted, untrusted, sandbox (got '" + level->get<std::string>() + "')"));
            }
            config.trust_level = *parsed;
        }
    }

    return config;
}

ConfigResult<McpConfig> parse_config(const Json& document) {
    if (!document.is_object()) {
        return tl::unexpected(ConfigError{"MCP config must be a JSON object"});
    }

    McpConfig config;

    auto client_enabled = read_bool(document, "client_enabled", true);
    if (!client_enabled) {
        return tl::unexpected(client_enabled.error());
    }
    config.client_enabled = *client_enabled;

    auto server_enabled = read_bool(document, "server_enabled", false);
    if (!server_enabled) {
        return tl::unexpected(server_enabled.error());
    }
    config.server_enabled = *server_enabled;

    const auto servers = document.find("servers");
    if (servers == document.end() || servers->is_null()) {
        return config;
    }
    if (!servers->is_object()) {
        return tl::unexpected(ConfigError{"field 'servers' must be an object"});
    }

    for (const auto& [name, node] : servers->items()) {
        auto server = parse_server_config(name, node);
        if (!server) {
            return tl::unexpected(server.error());
        }
        config.servers.emplace(name, std::move(*server));
    }
    return config;
}

ConfigResult<McpConfig> load_config_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return tl::unexpected(ConfigError{"cannot open config file '" + path.string() + "'"});
    }

    std::stringstream contents;
    contents << file.rdbuf();

    const Json document = Json::parse(contents.str(), nullptr, false);
    if (document.is_discarded()) {
        return tl::unexpected(ConfigError{"config file '" + path.string() + "' is not valid JSON"});
    }
    return parse_config(document);
}

}  // namespace mcplink
