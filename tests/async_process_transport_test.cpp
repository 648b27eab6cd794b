// ─────────────────────────────────────────────────────────────────────────────
// AsyncProcessTransport Tests
// ─────────────────────────────────────────────────────────────────────────────
// Real child processes (cat, sh) behind the line transport.

#include <catch2/catch_test_macros.hpp>

#include "mcplink/async/async_process_transport.hpp"
#include "test_helpers.hpp"

#include <asio/io_context.hpp>

#include <signal.h>

#include <chrono>

using namespace mcplink;
using namespace mcplink::async;
using namespace mcplink::testing;
using namespace std::chrono_literals;

namespace {

AsyncProcessConfig shell(const std::string& script) {
    AsyncProcessConfig config;
    config.command = "sh";
    config.args = {"-c", script};
    return config;
}

/// Keep the io_context turning until `pred` holds or `limit` passes.
template <typename Pred>
bool wait_until(asio::io_context& io, Pred pred, std::chrono::milliseconds limit = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        run_sync(io, sleep_for(10ms));
    }
    return true;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Lines
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("AsyncProcessTransport echoes lines through cat", "[async][process]") {
    asio::io_context io;
    AsyncProcessConfig config;
    config.command = "cat";
    AsyncProcessTransport transport(io.get_executor(), config);

    REQUIRE(run_sync(io, transport.async_start()).has_value());
    REQUIRE(transport.is_running());
    REQUIRE(transport.child_pid() > 0);

    REQUIRE(run_sync(io, transport.async_send(R"({"jsonrpc":"2.0","id":1})")).has_value());
    REQUIRE(run_sync(io, transport.async_send("second")).has_value());

    auto first = run_sync(io, transport.async_receive());
    REQUIRE(first.has_value());
    REQUIRE(*first == R"({"jsonrpc":"2.0","id":1})");

    auto second = run_sync(io, transport.async_receive());
    REQUIRE(second == std::string("second"));

    SECTION("closing stdin ends the stream") {
        transport.close_stdin();
        auto eof = run_sync(io, transport.async_receive());
        REQUIRE(eof.has_value() == false);
        REQUIRE(eof.error().category == TransportError::Category::Closed);
    }

    run_sync(io, transport.async_shutdown(1000ms));
    REQUIRE(transport.is_running() == false);
    REQUIRE(transport.is_child_alive() == false);
    REQUIRE(transport.exit_code() == std::optional<int>(0));
}

TEST_CASE("AsyncProcessTransport framing", "[async][process]") {
    asio::io_context io;
    AsyncProcessTransport transport(io.get_executor(), shell("printf 'a\\r\\n\\n   \\nb\\nlast'"));

    REQUIRE(run_sync(io, transport.async_start()).has_value());

    SECTION("strips CR, skips blank lines, keeps an unterminated tail") {
        REQUIRE(run_sync(io, transport.async_receive()) == std::string("a"));
        REQUIRE(run_sync(io, transport.async_receive()) == std::string("b"));
        REQUIRE(run_sync(io, transport.async_receive()) == std::string("last"));

        auto eof = run_sync(io, transport.async_receive());
        REQUIRE(eof.has_value() == false);
        REQUIRE(eof.error().category == TransportError::Category::Closed);
    }

    transport.terminate();
}

TEST_CASE("AsyncProcessTransport rejects oversized lines", "[async][process]") {
    asio::io_context io;
    auto config = shell("head -c 4096 /dev/zero | tr '\\0' 'x'; echo");
    config.max_message_size = 1024;
    AsyncProcessTransport transport(io.get_executor(), config);

    REQUIRE(run_sync(io, transport.async_start()).has_value());

    auto line = run_sync(io, transport.async_receive());
    REQUIRE(line.has_value() == false);
    REQUIRE(line.error().category == TransportError::Category::Io);

    transport.terminate();
}

// ═══════════════════════════════════════════════════════════════════════════
// Spawn
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("AsyncProcessTransport reports a missing command", "[async][process][error]") {
    asio::io_context io;
    AsyncProcessConfig config;
    config.command = "/nonexistent/mcplink-no-such-server";
    AsyncProcessTransport transport(io.get_executor(), config);

    auto started = run_sync(io, transport.async_start());
    REQUIRE(started.has_value() == false);
    REQUIRE(started.error().category == TransportError::Category::Spawn);
    REQUIRE(started.error().message.find("mcplink-no-such-server") != std::string::npos);
    REQUIRE(transport.is_running() == false);
    REQUIRE(transport.exit_code() == std::optional<int>(127));

    auto sent = run_sync(io, transport.async_send("x"));
    REQUIRE(sent.error().category == TransportError::Category::Closed);
}

TEST_CASE("AsyncProcessTransport rejects an empty command", "[async][process][error]") {
    asio::io_context io;
    AsyncProcessTransport transport(io.get_executor(), AsyncProcessConfig{});

    auto started = run_sync(io, transport.async_start());
    REQUIRE(started.has_value() == false);
    REQUIRE(started.error().category == TransportError::Category::Spawn);
}

TEST_CASE("AsyncProcessTransport passes extra environment", "[async][process]") {
    asio::io_context io;
    auto config = shell("echo \"$MCPLINK_TEST_VALUE\"; echo \"${HOME:+home-set}\"");
    config.env["MCPLINK_TEST_VALUE"] = "from-config";
    AsyncProcessTransport transport(io.get_executor(), config);

    REQUIRE(run_sync(io, transport.async_start()).has_value());
    REQUIRE(run_sync(io, transport.async_receive()) == std::string("from-config"));

    // The parent's environment is inherited underneath the overrides
    if (std::getenv("HOME") != nullptr) {
        REQUIRE(run_sync(io, transport.async_receive()) == std::string("home-set"));
    }

    transport.terminate();
}

// ═══════════════════════════════════════════════════════════════════════════
// Stderr
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("AsyncProcessTransport captures stderr", "[async][process][stderr]") {
    asio::io_context io;
    AsyncProcessTransport transport(io.get_executor(), shell("echo 'stdout message'; echo 'stderr message' >&2"));

    REQUIRE(run_sync(io, transport.async_start()).has_value());
    REQUIRE(run_sync(io, transport.async_receive()) == std::string("stdout message"));

    REQUIRE(wait_until(io, [&] {
        return transport.get_stderr().find("stderr message") != std::string::npos;
    }));
    REQUIRE(transport.diagnostics() == transport.get_stderr());

    run_sync(io, transport.async_shutdown(1000ms));
}

TEST_CASE("AsyncProcessTransport keeps only the newest stderr bytes", "[async][process][stderr]") {
    asio::io_context io;
    auto config = shell("printf 'AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA' >&2; printf 'tail-marker' >&2; echo done");
    config.max_stderr_bytes = 16;
    AsyncProcessTransport transport(io.get_executor(), config);

    REQUIRE(run_sync(io, transport.async_start()).has_value());
    REQUIRE(run_sync(io, transport.async_receive()) == std::string("done"));

    REQUIRE(wait_until(io, [&] {
        return transport.get_stderr().find("tail-marker") != std::string::npos;
    }));
    REQUIRE(transport.get_stderr().size() <= 16);

    transport.terminate();
}

TEST_CASE("AsyncProcessTransport discards stderr on request", "[async][process][stderr]") {
    asio::io_context io;
    auto config = shell("echo 'stderr message' >&2; echo done");
    config.stderr_handling = StderrHandling::Discard;
    AsyncProcessTransport transport(io.get_executor(), config);

    REQUIRE(run_sync(io, transport.async_start()).has_value());
    REQUIRE(run_sync(io, transport.async_receive()) == std::string("done"));
    REQUIRE(transport.get_stderr().empty());

    transport.terminate();
}

// ═══════════════════════════════════════════════════════════════════════════
// Stop
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("AsyncProcessTransport shutdown kills a server that ignores EOF", "[async][process]") {
    asio::io_context io;
    AsyncProcessTransport transport(io.get_executor(), shell("trap '' TERM; sleep 30"));

    REQUIRE(run_sync(io, transport.async_start()).has_value());
    const pid_t pid = transport.child_pid();

    const auto started = std::chrono::steady_clock::now();
    run_sync(io, transport.async_shutdown(100ms));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < 5s);
    REQUIRE(transport.is_child_alive() == false);
    REQUIRE(transport.exit_code() == std::optional<int>(-SIGKILL));
    REQUIRE(::kill(pid, 0) == -1);
}

TEST_CASE("AsyncProcessTransport terminate is immediate and repeatable", "[async][process]") {
    asio::io_context io;
    AsyncProcessTransport transport(io.get_executor(), shell("sleep 30"));

    REQUIRE(run_sync(io, transport.async_start()).has_value());
    REQUIRE(transport.is_child_alive());

    transport.terminate();
    REQUIRE(transport.is_running() == false);
    REQUIRE(transport.is_child_alive() == false);

    transport.terminate();

    auto line = run_sync(io, transport.async_receive());
    REQUIRE(line.error().category == TransportError::Category::Closed);
}

TEST_CASE("AsyncProcessTransport write after the child exits", "[async][process][error]") {
    asio::io_context io;
    AsyncProcessTransport transport(io.get_executor(), shell("exit 0"));

    REQUIRE(run_sync(io, transport.async_start()).has_value());
    REQUIRE(wait_until(io, [&] { return transport.is_child_alive() == false; }));

    auto sent = run_sync(io, transport.async_send("hello"));
    REQUIRE(sent.has_value() == false);
    REQUIRE(sent.error().category == TransportError::Category::Closed);

    transport.terminate();
}
