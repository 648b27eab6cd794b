#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════

#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcplink {

/// Error type for transport operations
struct TransportError {
    enum class Category {
        Spawn,   ///< The child process could not be started
        Io,      ///< A pipe read or write failed
        Closed   ///< The stream reached EOF or the transport was stopped
    };

    Category category{};
    std::string message;
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Spawn:  return "Spawn";
        case TransportError::Category::Io:     return "Io";
        case TransportError::Category::Closed: return "Closed";
    }
    return "Unknown";
}

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcplink
