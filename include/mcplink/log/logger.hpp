#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════
// Library code logs through the MCPLINK_LOG_* macros, which go to a single
// process-wide ILogger. Nothing is printed until an application installs one
// (see spdlog_logger.hpp for the production backend).

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Wire-level detail
    Debug = 1,  // Dropped responses, ignored notifications
    Info  = 2,  // Connects, disconnects, list changes
    Warn  = 3,  // A server misbehaved, the client carries on
    Error = 4,  // An operation failed
    Fatal = 5,
    Off   = 6   // Threshold only; never a record's level
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// True if a record at `level` passes `threshold`
[[nodiscard]] constexpr bool level_enabled(LogLevel level, LogLevel threshold) noexcept {
    return level != LogLevel::Off &&
           static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold);
}

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - one event, stamped when it is created
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger - swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    // Backends may be called from any thread that runs the io_context
    virtual void log(const LogRecord& record) = 0;

    // Checked before the message is built, so a disabled level costs nothing
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    /// Log at a level only known at runtime (server-forwarded messages).
    void write(LogLevel level, std::string_view msg,
               std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, msg, loc);
    }

    // std::format variants; formatting is skipped below the threshold
    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Debug)) {
            log(LogRecord(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - default, discards everything
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - colored lines on stderr
// ─────────────────────────────────────────────────────────────────────────────
// stdout is left alone: the CLI prints results there.

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return level_enabled(level, min_level_);
    }

    void set_level(LogLevel level) noexcept { min_level_ = level; }
    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

    void set_colors_enabled(bool enabled) noexcept { colors_enabled_ = enabled; }

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global logger
// ─────────────────────────────────────────────────────────────────────────────

/// Global logger instance (NullLogger until set_logger is called)
[[nodiscard]] ILogger& get_logger() noexcept;

/// Replace the global logger; nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Macros evaluate `msg` only when the level is enabled, so callers can
// concatenate strings freely.

#define MCPLINK_LOG_TRACE(msg) \
    do { if (::mcplink::get_logger().should_log(::mcplink::LogLevel::Trace)) \
         ::mcplink::get_logger().trace(msg); } while(false)

#define MCPLINK_LOG_DEBUG(msg) \
    do { if (::mcplink::get_logger().should_log(::mcplink::LogLevel::Debug)) \
         ::mcplink::get_logger().debug(msg); } while(false)

#define MCPLINK_LOG_INFO(msg) \
    do { if (::mcplink::get_logger().should_log(::mcplink::LogLevel::Info)) \
         ::mcplink::get_logger().info(msg); } while(false)

#define MCPLINK_LOG_WARN(msg) \
    do { if (::mcplink::get_logger().should_log(::mcplink::LogLevel::Warn)) \
         ::mcplink::get_logger().warn(msg); } while(false)

#define MCPLINK_LOG_ERROR(msg) \
    do { if (::mcplink::get_logger().should_log(::mcplink::LogLevel::Error)) \
         ::mcplink::get_logger().error(msg); } while(false)

#define MCPLINK_LOG_FATAL(msg) \
    do { if (::mcplink::get_logger().should_log(::mcplink::LogLevel::Fatal)) \
         ::mcplink::get_logger().fatal(msg); } while(false)

}  // namespace mcplink
