/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for mailcast.
Supports multiple log levels, categories, optional callbacks, and protocol tracing.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

namespace mailcast::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Protocol-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Direction for protocol tracing
enum class direction : std::uint8_t
{
    send,     ///< Data sent to server
    receive   ///< Data received from server
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string category;
    std::string message;
    std::source_location location;

    // Optional protocol trace info
    struct trace_info_t
    {
        direction dir;
        std::string protocol;  // "SMTP"
        std::string data;      // Raw protocol data
    };
    std::optional<trace_info_t> trace_info;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

/// Convert level to string
[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as accepted on the command line ("debug", "warn", ...)
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name) noexcept
{
    if (name == "trace") return level::trace;
    if (name == "debug") return level::debug;
    if (name == "info") return level::info;
    if (name == "warn") return level::warn;
    if (name == "error") return level::error;
    if (name == "fatal") return level::fatal;
    if (name == "off") return level::off;
    return std::nullopt;
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    /// Get current minimum log level
    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    /// Check if level is enabled
    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    /// Enable/disable protocol tracing
    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    /// Log a message
    void log(level lvl, std::string_view category, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .category = std::string(category),
            .message = std::string(message),
            .location = loc,
            .trace_info = std::nullopt
        };

        dispatch(e);
    }

    /// Log protocol trace
    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
                       std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        entry e{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .category = std::string(protocol),
            .message = {},
            .location = loc,
            .trace_info = entry::trace_info_t{
                .dir = dir,
                .protocol = std::string(protocol),
                .data = std::string(data)
            }
        };

        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
        {
            callback_(e);
        }
        else
        {
            default_output(e);
        }
    }

    void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);

        std::ostringstream line;
        line << '[' << std::put_time(&tm_buf, "%H:%M:%S") << '.'
             << std::setw(3) << std::setfill('0') << ms.count() << "] ";

        if (e.trace_info)
        {
            // Protocol trace format
            const char* dir_str = (e.trace_info->dir == direction::send) ? ">>>" : "<<<";
            line << e.trace_info->protocol << ' ' << dir_str << ' ' << sanitize_trace(e.trace_info->data);
        }
        else
        {
            line << '[' << level_to_string(e.lvl) << "] ";
            if (!e.category.empty())
                line << '[' << e.category << "] ";
            line << e.message;
        }
        line << '\n';
        std::cerr << line.str();
    }

    /// Sanitize trace data (truncate long data, hide control characters)
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        std::string result(data);

        constexpr std::size_t max_len = 500;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        for (char& c : result)
        {
            if (static_cast<unsigned char>(c) < 32 && c != '\r' && c != '\n')
                c = '.';
        }

        while (!result.empty() && (result.back() == '\r' || result.back() == '\n'))
            result.pop_back();

        return result;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

// Category logging with stream-style formatting:
//   MAILCAST_LOG_INFO("WORKER", "sent " << n << " messages");
#define MAILCAST_LOG(lvl, category, expr)                                                   \
    do                                                                                      \
    {                                                                                       \
        auto& mailcast_logger_ = ::mailcast::log::logger::instance();                       \
        if (mailcast_logger_.is_enabled(lvl))                                               \
        {                                                                                   \
            std::ostringstream mailcast_log_stream_;                                        \
            mailcast_log_stream_ << expr;                                                   \
            mailcast_logger_.log(lvl, category, mailcast_log_stream_.str(),                 \
                std::source_location::current());                                           \
        }                                                                                   \
    } while (0)

#define MAILCAST_LOG_TRACE(category, expr) MAILCAST_LOG(::mailcast::log::level::trace, category, expr)
#define MAILCAST_LOG_DEBUG(category, expr) MAILCAST_LOG(::mailcast::log::level::debug, category, expr)
#define MAILCAST_LOG_INFO(category, expr)  MAILCAST_LOG(::mailcast::log::level::info, category, expr)
#define MAILCAST_LOG_WARN(category, expr)  MAILCAST_LOG(::mailcast::log::level::warn, category, expr)
#define MAILCAST_LOG_ERROR(category, expr) MAILCAST_LOG(::mailcast::log::level::error, category, expr)
#define MAILCAST_LOG_FATAL(category, expr) MAILCAST_LOG(::mailcast::log::level::fatal, category, expr)

/// Protocol trace helper
#define MAILCAST_TRACE_SEND(protocol, data) \
    ::mailcast::log::logger::instance().trace_protocol(protocol, ::mailcast::log::direction::send, data)

#define MAILCAST_TRACE_RECV(protocol, data) \
    ::mailcast::log::logger::instance().trace_protocol(protocol, ::mailcast::log::direction::receive, data)

} // namespace mailcast::log
