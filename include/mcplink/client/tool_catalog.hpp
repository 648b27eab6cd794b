#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Tool Catalog Helpers
// ═══════════════════════════════════════════════════════════════════════════
// Tools from several servers share one flat namespace as
// mcp__{server}__{tool}. Server names must not contain "__" for the split to
// round-trip; tool names may.

#include "mcplink/protocol/mcp_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcplink {

inline constexpr std::string_view kToolNamePrefix{"mcp__"};
inline constexpr std::string_view kToolNameSeparator{"__"};

[[nodiscard]] std::string namespaced_tool_name(std::string_view server, std::string_view tool);

/// {server, tool}, or nullopt if `name` is not of the form mcp__{server}__{tool}
[[nodiscard]] std::optional<std::pair<std::string, std::string>>
split_namespaced_tool_name(std::string_view name);

/// Render tool output as plain text, one line per content item.
[[nodiscard]] std::string format_tool_result(const std::vector<Content>& content);

}  // namespace mcplink
