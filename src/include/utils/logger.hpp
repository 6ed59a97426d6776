// logger.hpp
//
// Process-wide logger with fmt formatting.
// Implementation details (Impl) are hidden in logger.cpp (pimpl).
//
// Design notes:
//  - Templates must not access Impl directly because Impl is incomplete here.
//  - Template formatting uses fmt::memory_buffer with a configurable reserve macro.
//  - Use should_log() and max_log_line_length() to query Impl-visible state.
//  - write_formatted(...) is a non-template sink implemented in logger.cpp.
//  - Lock algorithms only log outside their spin loops.

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "locklab_platform.hpp"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
// Can be overridden by -DLOGGER_FMT_BUFFER_RESERVE=N on the compiler command line.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

// Lowest level whose LOGGER_* macro is compiled in (0=Trace .. 4=Error).
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0
#endif

namespace locklab::utils
{

struct Impl;
class LOCKLAB_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
    };

    enum class Destination
    {
        L_CONSOLE,
        L_FILE,
    };

    /**
     * @brief Singleton accessor.
     * @details On first use the logger reads the `LOCKLAB_LOG` environment variable, a
     *          `key=value` list such as "level=debug; file=/tmp/locklab.log". `level` takes
     *          trace|debug|info|warning|error (default info) and `file` redirects output
     *          from stderr to the named file.
     */
    static Logger &instance();

    // Lifecycle - defined in logger.cpp because Impl is incomplete here
    Logger();
    ~Logger();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    // ---- Sinks ----
    // init_file: open the given path for append. Returns true on success.
    // use_flock: enables advisory flock() while writing.
    bool init_file(const std::string &path, bool use_flock = false, int mode = 0644);

    void set_destination(Destination dest);
    Destination destination() const;
    void shutdown(); // close the file sink and revert to the console

    // ---- Configuration & Diagnostics ----
    void set_level(Level lvl);
    Level level() const;

    void set_write_error_callback(std::function<void(const std::string &)> cb);

    int last_errno() const;
    int write_failure_count() const;

    // Maximum allowed log body length (bytes). Declared noexcept so header templates can call it.
    void set_max_log_line_length(size_t bytes);
    size_t max_log_line_length() const noexcept;

    // Small accessor used by header-only templates.
    bool should_log(Level lvl) const noexcept;

    // ---- Formatting API (header-only templates) ----
    template <typename... Args>
    void log_fmt(Logger::Level lvl, std::string_view fmt_str, const Args &...args) noexcept;

    template <typename... Args> void trace_fmt(std::string_view fmt_str, const Args &...args) noexcept
    {
        log_fmt(Logger::Level::L_TRACE, fmt_str, args...);
    }
    template <typename... Args> void debug_fmt(std::string_view fmt_str, const Args &...args) noexcept
    {
        log_fmt(Logger::Level::L_DEBUG, fmt_str, args...);
    }
    template <typename... Args> void info_fmt(std::string_view fmt_str, const Args &...args) noexcept
    {
        log_fmt(Logger::Level::L_INFO, fmt_str, args...);
    }
    template <typename... Args> void warn_fmt(std::string_view fmt_str, const Args &...args) noexcept
    {
        log_fmt(Logger::Level::L_WARNING, fmt_str, args...);
    }
    template <typename... Args> void error_fmt(std::string_view fmt_str, const Args &...args) noexcept
    {
        log_fmt(Logger::Level::L_ERROR, fmt_str, args...);
    }

    /// Parses "trace", "debug", "info", "warning"/"warn" or "error"; falls back to `fallback`.
    static Level parse_level(std::string_view name, Level fallback) noexcept;
    static const char *level_to_string(Level lvl) noexcept;

  private:
    // Non-template sink: accepts an already-formatted UTF-8 body (no newline).
    void write_formatted(Logger::Level lvl, std::string &&body) noexcept;

    // Records a write failure, updates counters and invokes the user callback outside the lock.
    void record_write_error(int errcode, const char *msg) noexcept;

    std::unique_ptr<Impl> pImpl;
};

// ----------------- Template implementation (must be in header) -----------------
template <typename... Args>
void Logger::log_fmt(Logger::Level lvl, std::string_view fmt_str, const Args &...args) noexcept
{
    // Fast path: check level without locking.
    if (!this->should_log(lvl))
        return;

    try
    {
        fmt::memory_buffer mb;
        mb.reserve(static_cast<size_t>(LOGGER_FMT_BUFFER_RESERVE));
        fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), args...);

        const size_t max_line = max_log_line_length();
        static constexpr std::string_view trunc_marker = "...[TRUNCATED]";
        size_t cap = (max_line > trunc_marker.size()) ? (max_line - trunc_marker.size()) : 1;

        std::string body;
        if (mb.size() <= cap)
        {
            body.assign(mb.data(), mb.size());
        }
        else
        {
            // byte-level truncation
            body.assign(mb.data(), cap);
            body.append(trunc_marker);
        }

        this->write_formatted(lvl, std::move(body));
    }
    catch (const std::exception &ex)
    {
        // never throw from logging template
        std::string err = std::string("[FORMAT ERROR] ") + ex.what();
        this->write_formatted(lvl, std::move(err));
    }
}

} // namespace locklab::utils

// macros for convenience (fmt-style)
#if LOGGER_COMPILE_LEVEL <= 0
#define LOGGER_TRACE(fmt_str, ...)                                                                 \
    ::locklab::utils::Logger::instance().trace_fmt(fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_TRACE(fmt_str, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 1
#define LOGGER_DEBUG(fmt_str, ...)                                                                 \
    ::locklab::utils::Logger::instance().debug_fmt(fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_DEBUG(fmt_str, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 2
#define LOGGER_INFO(fmt_str, ...)                                                                  \
    ::locklab::utils::Logger::instance().info_fmt(fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_INFO(fmt_str, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 3
#define LOGGER_WARN(fmt_str, ...)                                                                  \
    ::locklab::utils::Logger::instance().warn_fmt(fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_WARN(fmt_str, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 4
#define LOGGER_ERROR(fmt_str, ...)                                                                 \
    ::locklab::utils::Logger::instance().error_fmt(fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_ERROR(fmt_str, ...) ((void)0)
#endif
