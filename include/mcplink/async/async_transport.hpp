#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// Line-oriented, coroutine-based transport. Framing lives here: callers send
// and receive one complete JSON text per call, without the trailing newline.
// Parsing is left to the client so a malformed line never looks like a
// transport failure.

#include "mcplink/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/use_awaitable.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace mcplink::async {

class IAsyncTransport {
public:
    /// Asked once the write turn is ours; false drops the line unwritten.
    using SendGuard = std::function<bool()>;

    virtual ~IAsyncTransport() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// Start the transport (spawn the process, wire the pipes)
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_start() = 0;

    /// Write one line. Concurrent callers are serialized; lines never interleave.
    /// A line whose guard turns false while it queues behind other writers is
    /// skipped, and that still counts as success.
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(
        std::string line,
        SendGuard still_wanted
    ) = 0;

    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(std::string line) {
        return async_send(std::move(line), SendGuard{});
    }

    /// Read the next non-empty line. Category::Closed on EOF or after stop.
    /// Only one reader may wait at a time.
    [[nodiscard]] virtual asio::awaitable<TransportResult<std::string>> async_receive() = 0;

    /// Graceful stop: signal EOF to the peer, give it `grace` to exit, then force it.
    [[nodiscard]] virtual asio::awaitable<void> async_shutdown(std::chrono::milliseconds grace) = 0;

    /// Immediate, synchronous stop. Safe to call repeatedly and from destructors.
    virtual void terminate() noexcept = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /// Free-form diagnostics from the peer (captured stderr for processes).
    [[nodiscard]] virtual std::string diagnostics() const { return {}; }
};

}  // namespace mcplink::async
