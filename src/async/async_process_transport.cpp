#include "mcplink/async/async_process_transport.hpp"
#include "mcplink/log/logger.hpp"

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/read_until.hpp>
#include <asio/steady_timer.hpp>
#include <asio/write.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <mutex>

extern char** environ;

namespace mcplink::async {

namespace {

constexpr std::chrono::milliseconds kReapPollInterval{20};

TransportError make_error(TransportError::Category cat, std::string msg) {
    return TransportError{cat, std::move(msg)};
}

std::string errno_message(const char* what, int err) {
    return std::string(what) + ": " + std::strerror(err);
}

// Both ends close-on-exec: children only get the ends we dup2 onto 0/1/2,
// never the pipes of sibling servers.
bool make_pipe(int fds[2]) {
#if defined(__linux__)
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// A dead server must surface as EPIPE on write, not kill us.
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Stderr capture
// ═══════════════════════════════════════════════════════════════════════════
// Owned jointly by the transport and the stderr reader coroutine, so the
// coroutine never touches a destroyed transport.

struct AsyncProcessTransport::StderrSink {
    StderrSink(asio::any_io_executor executor, int fd, std::size_t limit)
        : stream(std::move(executor), fd)
        , limit(limit)
    {}

    void append(const char* data, std::size_t n) {
        std::lock_guard<std::mutex> lock(mutex);
        buffer.append(data, n);
        if (buffer.size() > limit) {
            buffer.erase(0, buffer.size() - limit);
        }
    }

    std::string snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return buffer;
    }

    asio::posix::stream_descriptor stream;
    std::size_t limit;
    mutable std::mutex mutex;
    std::string buffer;
};

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

AsyncProcessTransport::AsyncProcessTransport(
    asio::any_io_executor executor,
    AsyncProcessConfig config
)
    : config_(std::move(config))
    , executor_(std::move(executor))
{
    read_buffer_.reserve(4096);
}

AsyncProcessTransport::~AsyncProcessTransport() {
    terminate();
}

// ═══════════════════════════════════════════════════════════════════════════
// IAsyncTransport
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor AsyncProcessTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> AsyncProcessTransport::async_start() {
    if (running_) {
        co_return tl::unexpected(make_error(TransportError::Category::Spawn, "transport already running"));
    }
    if (config_.command.empty()) {
        co_return tl::unexpected(make_error(TransportError::Category::Spawn, "empty command"));
    }

    ignore_sigpipe_once();

    auto spawned = spawn_process();
    if (!spawned) {
        co_return spawned;
    }

    write_gate_ = std::make_unique<WriteGate>(executor_, 1);
    read_buffer_.clear();
    running_ = true;

    if (stderr_sink_) {
        asio::co_spawn(executor_, stderr_reader_loop(stderr_sink_), asio::detached);
    }

    MCPLINK_LOG_DEBUG("spawned '" + config_.command + "' as pid " + std::to_string(child_pid_));
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<void>> AsyncProcessTransport::async_send(
    std::string line,
    SendGuard still_wanted
) {
    if (!running_ || !stdin_stream_ || !stdin_stream_->is_open()) {
        co_return tl::unexpected(make_error(TransportError::Category::Closed, "transport not running"));
    }
    line.push_back('\n');

    // Take the gate: the single buffered slot is free only when no write is in flight.
    auto [gate_ec] = co_await write_gate_->async_send(
        asio::error_code{}, asio::as_tuple(asio::use_awaitable));
    if (gate_ec) {
        co_return tl::unexpected(make_error(TransportError::Category::Closed, "transport stopped"));
    }
    if (still_wanted && !still_wanted()) {
        write_gate_->try_receive([](asio::error_code) {});
        co_return TransportResult<void>{};
    }

    auto [ec, written] = co_await asio::async_write(
        *stdin_stream_, asio::buffer(line), asio::as_tuple(asio::use_awaitable));
    write_gate_->try_receive([](asio::error_code) {});

    if (ec) {
        const bool peer_gone = ec == asio::error::broken_pipe ||
                               ec == asio::error::bad_descriptor ||
                               ec == asio::error::operation_aborted;
        co_return tl::unexpected(make_error(
            peer_gone ? TransportError::Category::Closed : TransportError::Category::Io,
            "write failed: " + ec.message()));
    }
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<std::string>> AsyncProcessTransport::async_receive() {
    if (!stdout_stream_ || !stdout_stream_->is_open()) {
        co_return tl::unexpected(make_error(TransportError::Category::Closed, "transport not running"));
    }

    for (;;) {
        auto [ec, n] = co_await asio::async_read_until(
            *stdout_stream_,
            asio::dynamic_buffer(read_buffer_, config_.max_message_size),
            '\n',
            asio::as_tuple(asio::use_awaitable));

        if (ec == asio::error::eof) {
            // Unterminated last line is still delivered; the next call reports EOF.
            if (read_buffer_.find_first_not_of(" \t\r") != std::string::npos) {
                std::string tail = std::move(read_buffer_);
                read_buffer_.clear();
                co_return tail;
            }
            co_return tl::unexpected(make_error(TransportError::Category::Closed, "end of stream"));
        }
        if (ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor) {
            co_return tl::unexpected(make_error(TransportError::Category::Closed, "transport stopped"));
        }
        if (ec == asio::error::not_found) {
            co_return tl::unexpected(make_error(
                TransportError::Category::Io,
                "line exceeds " + std::to_string(config_.max_message_size) + " bytes"));
        }
        if (ec) {
            co_return tl::unexpected(make_error(TransportError::Category::Io, "read failed: " + ec.message()));
        }

        std::string line = read_buffer_.substr(0, n - 1);
        read_buffer_.erase(0, n);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        co_return line;
    }
}

asio::awaitable<void> AsyncProcessTransport::async_shutdown(std::chrono::milliseconds grace) {
    running_ = false;
    close_stdin();

    if (!reaped_) {
        asio::steady_timer timer(executor_);
        const auto deadline = std::chrono::steady_clock::now() + grace;
        while (!try_reap() && std::chrono::steady_clock::now() < deadline) {
            timer.expires_after(kReapPollInterval);
            co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
        }
        if (!reaped_) {
            MCPLINK_LOG_WARN("'" + config_.command + "' did not exit within " +
                             std::to_string(grace.count()) + "ms, killing it");
            kill_and_reap();
        }
    }

    close_streams();
}

void AsyncProcessTransport::terminate() noexcept {
    running_ = false;
    kill_and_reap();
    close_streams();
}

bool AsyncProcessTransport::is_running() const {
    return running_;
}

std::string AsyncProcessTransport::diagnostics() const {
    return get_stderr();
}

// ═══════════════════════════════════════════════════════════════════════════
// Process-specific
// ═══════════════════════════════════════════════════════════════════════════

void AsyncProcessTransport::close_stdin() noexcept {
    if (stdin_stream_ && stdin_stream_->is_open()) {
        asio::error_code ec;
        stdin_stream_->close(ec);
    }
}

pid_t AsyncProcessTransport::child_pid() const noexcept {
    return child_pid_;
}

bool AsyncProcessTransport::is_child_alive() noexcept {
    return !try_reap();
}

std::optional<int> AsyncProcessTransport::exit_code() const noexcept {
    return exit_code_;
}

std::string AsyncProcessTransport::get_stderr() const {
    if (!stderr_sink_) {
        return {};
    }
    return stderr_sink_->snapshot();
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: stderr reader
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> AsyncProcessTransport::stderr_reader_loop(std::shared_ptr<StderrSink> sink) {
    std::array<char, 4096> chunk;
    for (;;) {
        auto [ec, n] = co_await sink->stream.async_read_some(
            asio::buffer(chunk), asio::as_tuple(asio::use_awaitable));
        if (n > 0) {
            sink->append(chunk.data(), n);
        }
        if (ec) {
            break;
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: process management
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<void> AsyncProcessTransport::spawn_process() {
    // Everything the child needs is allocated before fork(): after fork only
    // the calling thread exists, and malloc may be locked by a vanished one.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    argv_storage.insert(argv_storage.end(), config_.args.begin(), config_.args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv(*entry);
        const std::string key(kv.substr(0, kv.find('=')));
        if (!config_.env.contains(key)) {
            env_storage.emplace_back(kv);
        }
    }
    for (const auto& [key, value] : config_.env) {
        env_storage.push_back(key + "=" + value);
    }

    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& kv : env_storage) {
        envp.push_back(kv.data());
    }
    envp.push_back(nullptr);

    const bool capture_stderr = config_.stderr_handling == StderrHandling::Capture;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };

    const bool pipes_ok = make_pipe(stdin_pipe) && make_pipe(stdout_pipe) && make_pipe(status_pipe) &&
                          (!capture_stderr || make_pipe(stderr_pipe));
    if (!pipes_ok) {
        const int err = errno;
        close_all();
        return tl::unexpected(make_error(TransportError::Category::Spawn, errno_message("pipe", err)));
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int err = errno;
        close_all();
        return tl::unexpected(make_error(TransportError::Category::Spawn, errno_message("fork", err)));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setsid();

        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        switch (config_.stderr_handling) {
            case StderrHandling::Discard: {
                const int devnull = ::open("/dev/null", O_WRONLY);
                if (devnull != -1) {
                    ::dup2(devnull, STDERR_FILENO);
                    ::close(devnull);
                }
                break;
            }
            case StderrHandling::Passthrough:
                break;
            case StderrHandling::Capture:
                ::dup2(stderr_pipe[1], STDERR_FILENO);
                break;
        }

        environ = envp.data();
        ::execvp(argv[0], argv.data());

        const int err = errno;
        [[maybe_unused]] auto ignored = ::write(status_pipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    // Parent
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on a successful exec, or carries the exec errno.
    int exec_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    child_pid_ = pid;
    reaped_ = false;
    exit_code_.reset();

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        record_status(status);
        close_all();
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            errno_message(config_.command.c_str(), exec_errno)));
    }

    stdin_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stdin_pipe[1]);
    stdout_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stdout_pipe[0]);
    stdin_pipe[1] = -1;
    stdout_pipe[0] = -1;

    if (capture_stderr) {
        stderr_sink_ = std::make_shared<StderrSink>(executor_, stderr_pipe[0], config_.max_stderr_bytes);
        stderr_pipe[0] = -1;
    } else {
        stderr_sink_.reset();
    }

    return {};
}

bool AsyncProcessTransport::try_reap() noexcept {
    if (reaped_) {
        return true;
    }
    int status = 0;
    const pid_t result = ::waitpid(child_pid_, &status, WNOHANG);
    if (result == child_pid_) {
        record_status(status);
        return true;
    }
    if (result == -1 && errno == ECHILD) {
        reaped_ = true;
        return true;
    }
    return false;
}

void AsyncProcessTransport::kill_and_reap() noexcept {
    if (reaped_ || child_pid_ <= 0) {
        return;
    }
    if (try_reap()) {
        return;
    }
    // The child leads its own process group, so this reaches its children too.
    ::kill(-child_pid_, SIGKILL);
    ::kill(child_pid_, SIGKILL);

    int status = 0;
    pid_t result = -1;
    do {
        result = ::waitpid(child_pid_, &status, 0);
    } while (result == -1 && errno == EINTR);

    if (result == child_pid_) {
        record_status(status);
    } else {
        reaped_ = true;
    }
}

void AsyncProcessTransport::record_status(int status) noexcept {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = -WTERMSIG(status);
    }
}

void AsyncProcessTransport::close_streams() noexcept {
    asio::error_code ec;
    if (stdin_stream_ && stdin_stream_->is_open()) {
        stdin_stream_->close(ec);
    }
    if (stdout_stream_ && stdout_stream_->is_open()) {
        stdout_stream_->close(ec);
    }
    if (stderr_sink_ && stderr_sink_->stream.is_open()) {
        stderr_sink_->stream.close(ec);
    }
    if (write_gate_) {
        write_gate_->cancel();
        write_gate_->close();
    }
}

}  // namespace mcplink::async
