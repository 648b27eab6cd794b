#ifndef MCPLINK_TESTS_MOCK_ASYNC_TRANSPORT_HPP
#define MCPLINK_TESTS_MOCK_ASYNC_TRANSPORT_HPP

#include "mcplink/async/async_transport.hpp"
#include "mcplink/protocol/json_rpc.hpp"

#include <asio/as_tuple.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>

#include <functional>
#include <string>
#include <vector>

namespace mcplink::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockAsyncTransport
// ─────────────────────────────────────────────────────────────────────────────
// In-memory stand-in for a server process. Every line the client sends is
// recorded and handed to the responder, which scripts the server's side by
// pushing lines back.
//
// Usage:
//   auto transport = std::make_shared<MockAsyncTransport>(io.get_executor());
//   transport->set_responder([](const Json& msg, MockAsyncTransport& t) {
//       if (msg.value("method", "") == "initialize") {
//           t.push_result(msg["id"], initialize_result());
//       }
//   });

class MockAsyncTransport : public async::IAsyncTransport {
public:
    using Responder = std::function<void(const Json& message, MockAsyncTransport& transport)>;

    explicit MockAsyncTransport(asio::any_io_executor executor)
        : executor_(executor)
        , lines_(executor, 1024)
        , write_hold_(executor)
    {}

    asio::any_io_executor get_executor() override {
        return executor_;
    }

    asio::awaitable<TransportResult<void>> async_start() override {
        if (fail_start_) {
            co_return tl::unexpected(TransportError{TransportError::Category::Spawn, "no such command"});
        }
        running_ = true;
        co_return TransportResult<void>{};
    }

    using IAsyncTransport::async_send;

    asio::awaitable<TransportResult<void>> async_send(std::string line, SendGuard still_wanted) override {
        if (!running_) {
            co_return tl::unexpected(TransportError{TransportError::Category::Closed, "not running"});
        }
        if (writes_held_) {
            co_await write_hold_.async_wait(asio::as_tuple(asio::use_awaitable));
        }
        if (still_wanted && !still_wanted()) {
            ++skipped_writes_;
            co_return TransportResult<void>{};
        }
        const Json message = Json::parse(line);
        sent_.push_back(message);
        if (responder_) {
            responder_(message, *this);
        }
        co_return TransportResult<void>{};
    }

    asio::awaitable<TransportResult<std::string>> async_receive() override {
        auto [ec, line] = co_await lines_.async_receive(asio::as_tuple(asio::use_awaitable));
        if (ec) {
            co_return tl::unexpected(TransportError{TransportError::Category::Closed, "end of stream"});
        }
        co_return line;
    }

    asio::awaitable<void> async_shutdown(std::chrono::milliseconds) override {
        ++shutdown_calls_;
        terminate();
        co_return;
    }

    void terminate() noexcept override {
        running_ = false;
        lines_.close();
    }

    bool is_running() const override {
        return running_;
    }

    std::string diagnostics() const override {
        return "mock stderr";
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Test helpers
    // ─────────────────────────────────────────────────────────────────────────

    void set_responder(Responder responder) { responder_ = std::move(responder); }
    void fail_start() { fail_start_ = true; }

    /// Park every send as if another writer held the pipe.
    void hold_writes() {
        writes_held_ = true;
        write_hold_.expires_at(asio::steady_timer::time_point::max());
    }

    void release_writes() {
        writes_held_ = false;
        write_hold_.cancel();
    }

    void push_line(std::string line) {
        lines_.try_send(asio::error_code{}, std::move(line));
    }

    void push_json(const Json& message) {
        push_line(message.dump());
    }

    void push_result(const Json& id, Json result) {
        push_json({{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}});
    }

    void push_error(const Json& id, int code, const std::string& message) {
        push_json({{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}});
    }

    void push_notification(const std::string& method, Json params = Json::object()) {
        push_json({{"jsonrpc", "2.0"}, {"method", method}, {"params", std::move(params)}});
    }

    /// The server's stdout reaches EOF after the lines already pushed.
    void push_eof() {
        lines_.try_send(asio::error_code(asio::error::eof), std::string{});
    }

    [[nodiscard]] const std::vector<Json>& sent() const { return sent_; }

    [[nodiscard]] std::vector<Json> sent_with_method(const std::string& method) const {
        std::vector<Json> out;
        for (const auto& m : sent_) {
            if (m.value("method", "") == method) {
                out.push_back(m);
            }
        }
        return out;
    }

    [[nodiscard]] int shutdown_calls() const { return shutdown_calls_; }
    [[nodiscard]] int skipped_writes() const { return skipped_writes_; }

private:
    asio::any_io_executor executor_;
    asio::experimental::channel<void(asio::error_code, std::string)> lines_;
    Responder responder_;
    std::vector<Json> sent_;
    asio::steady_timer write_hold_;
    bool writes_held_ = false;
    int skipped_writes_ = 0;
    bool running_ = false;
    bool fail_start_ = false;
    int shutdown_calls_ = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Canned server payloads
// ─────────────────────────────────────────────────────────────────────────────

inline Json initialize_result(const std::string& version = "2025-11-25") {
    return {
        {"protocolVersion", version},
        {"capabilities", {{"tools", {{"listChanged", true}}}}},
        {"serverInfo", {{"name", "mock-server"}, {"version", "1.0.0"}}}
    };
}

/// Answers initialize; everything else is left to the test.
inline void answer_initialize(const Json& message, MockAsyncTransport& transport) {
    if (message.value("method", "") == "initialize") {
        transport.push_result(message["id"], initialize_result());
    }
}

}  // namespace mcplink::testing

#endif  // MCPLINK_TESTS_MOCK_ASYNC_TRANSPORT_HPP
