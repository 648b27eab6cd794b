#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP Server Configuration
// ═══════════════════════════════════════════════════════════════════════════
// The JSON block listing external MCP servers to launch. Values may refer to
// the environment as ${NAME}; expansion happens right before launch, not at
// parse time, so a config can be inspected without resolving secrets.

#include "mcplink/protocol/json_rpc.hpp"

#include <tl/expected.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcplink {

enum class TrustLevel {
    Trusted,
    Untrusted,
    Sandbox
};

[[nodiscard]] constexpr std::string_view to_string(TrustLevel level) noexcept {
    switch (level) {
        case TrustLevel::Trusted:   return "trusted";
        case TrustLevel::Untrusted: return "untrusted";
        case TrustLevel::Sandbox:   return "sandbox";
    }
    return "untrusted";
}

[[nodiscard]] std::optional<TrustLevel> trust_level_from_string(std::string_view s) noexcept;

struct McpServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// Only "stdio" is connectable; others are skipped with a warning.
    std::string transport = "stdio";

    TrustLevel trust_level = TrustLevel::Untrusted;
};

struct McpConfig {
    bool client_enabled = true;
    bool server_enabled = false;

    /// Ordered by name, which is also the connection order.
    std::map<std::string, McpServerConfig> servers;
};

struct ConfigError {
    std::string message;
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

// ─────────────────────────────────────────────────────────────────────────────
// Environment expansion
// ─────────────────────────────────────────────────────────────────────────────

/// Replace every ${NAME} with the value of NAME. Unset variables and an
/// unterminated "${" are kept as written.
[[nodiscard]] std::string expand_env_vars(std::string_view input);

/// expand_env_vars over command, args and env values
[[nodiscard]] McpServerConfig expand_server_config(const McpServerConfig& config);

// ─────────────────────────────────────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ConfigResult<McpServerConfig> parse_server_config(const std::string& name, const Json& node);

[[nodiscard]] ConfigResult<McpConfig> parse_config(const Json& document);

[[nodiscard]] ConfigResult<McpConfig> load_config_file(const std::filesystem::path& path);

}  // namespace mcplink
