#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async Process Transport
// ═══════════════════════════════════════════════════════════════════════════
// Spawns an MCP server and talks newline-delimited JSON over its stdin and
// stdout using asio stream descriptors.
//
// - The child runs in its own session (setsid), so terminal signals sent to
//   our process group are not forwarded to it, and a forced stop can kill
//   the whole group it created.
// - stderr is captured into a bounded buffer for diagnostics; it is never
//   parsed as protocol traffic.
// - A failed exec is reported synchronously by async_start() as a Spawn
//   error, through a close-on-exec status pipe.
// - Writers go through a one-slot gate so concurrent sends never interleave.

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "AsyncProcessTransport is only available on POSIX-compatible systems"
#endif

#include "mcplink/async/async_transport.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace mcplink::async {

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

enum class StderrHandling {
    Discard,      // /dev/null
    Passthrough,  // inherit ours
    Capture       // bounded in-memory buffer
};

struct AsyncProcessConfig {
    std::string command;
    std::vector<std::string> args;

    /// Set in the child on top of our own environment
    std::map<std::string, std::string> env;

    /// Longest accepted line on stdout
    std::size_t max_message_size{16 * 1024 * 1024};

    StderrHandling stderr_handling{StderrHandling::Capture};

    /// Captured stderr keeps only the most recent bytes
    std::size_t max_stderr_bytes{64 * 1024};
};

// ═══════════════════════════════════════════════════════════════════════════
// Async Process Transport
// ═══════════════════════════════════════════════════════════════════════════

class AsyncProcessTransport final : public IAsyncTransport {
public:
    AsyncProcessTransport(asio::any_io_executor executor, AsyncProcessConfig config);
    ~AsyncProcessTransport() override;

    AsyncProcessTransport(const AsyncProcessTransport&) = delete;
    AsyncProcessTransport& operator=(const AsyncProcessTransport&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // IAsyncTransport
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    using IAsyncTransport::async_send;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(
        std::string line,
        SendGuard still_wanted
    ) override;
    [[nodiscard]] asio::awaitable<TransportResult<std::string>> async_receive() override;
    [[nodiscard]] asio::awaitable<void> async_shutdown(std::chrono::milliseconds grace) override;
    void terminate() noexcept override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] std::string diagnostics() const override;

    // ─────────────────────────────────────────────────────────────────────────
    // Process-specific
    // ─────────────────────────────────────────────────────────────────────────

    /// Close our end of the child's stdin; the child sees EOF.
    void close_stdin() noexcept;

    /// Pid of the most recently spawned child (-1 before the first start)
    [[nodiscard]] pid_t child_pid() const noexcept;

    /// Reaps the child if it has exited; false once reaped.
    [[nodiscard]] bool is_child_alive() noexcept;

    /// Exit status once reaped; negative values are the terminating signal.
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

    [[nodiscard]] std::string get_stderr() const;

    [[nodiscard]] const AsyncProcessConfig& config() const noexcept { return config_; }

private:
    struct StderrSink;

    static asio::awaitable<void> stderr_reader_loop(std::shared_ptr<StderrSink> sink);

    TransportResult<void> spawn_process();
    bool try_reap() noexcept;
    void kill_and_reap() noexcept;
    void record_status(int status) noexcept;
    void close_streams() noexcept;

    AsyncProcessConfig config_;
    asio::any_io_executor executor_;

    std::unique_ptr<asio::posix::stream_descriptor> stdin_stream_;
    std::unique_ptr<asio::posix::stream_descriptor> stdout_stream_;
    std::shared_ptr<StderrSink> stderr_sink_;

    using WriteGate = asio::experimental::channel<void(asio::error_code)>;
    std::unique_ptr<WriteGate> write_gate_;

    // Bytes read past the last returned line
    std::string read_buffer_;

    pid_t child_pid_{-1};
    bool reaped_{true};
    std::atomic<bool> running_{false};
    std::optional<int> exit_code_;
};

inline std::shared_ptr<AsyncProcessTransport> make_async_process_transport(
    asio::any_io_executor executor,
    AsyncProcessConfig config
) {
    return std::make_shared<AsyncProcessTransport>(std::move(executor), std::move(config));
}

}  // namespace mcplink::async
