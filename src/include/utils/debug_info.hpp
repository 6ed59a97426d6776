/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors,
 *        and debug messaging.
 *
 * Functions live in the `locklab::debug` namespace. They use `fmt` for compile-time
 * format string checks and `std::source_location` for automatic source location reporting.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"

namespace locklab::debug
{

/**
 * @brief Prints the current call stack (stack trace) to `stderr`.
 *
 * On POSIX systems it uses `backtrace` and `dladdr` with C++ symbol demangling.
 * Errors during capture or symbol resolution are reported to `stderr`.
 */
LOCKLAB_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Intended for unrecoverable programming errors (for instance constructing a lock with a
 * participant count its algorithm cannot support). Formats and prints the message with
 * the source location of the caller, prints a stack trace and calls `std::abort()`.
 *
 * @param loc The source location where `panic` was called.
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    const auto where = fmt::format("{}:{}:{}", format_tools::filename_only(loc.file_name()),
                                   loc.line(), loc.function_name());
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", where, body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   where, fmt::string_view(fmt_str), e.what());
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[PANIC] {} -- EXCEPTION DURING PANIC: fmt_str['{}'] ({})\n", where,
                   fmt::string_view(fmt_str), e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[DBG]  EXCEPTION DURING DEBUG_MSG: fmt_str['{}'] ({})\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
}

} // namespace locklab::debug

// ---------------- thin macros for convenience --------------

/**
 * @brief Calls `locklab::debug::panic` with the caller's source location.
 * @param fmt The `fmt`-style format string literal.
 */
#ifndef LOCKLAB_PANIC
#define LOCKLAB_PANIC(fmt, ...)                                                                    \
    ::locklab::debug::panic(std::source_location::current(),                                       \
                            FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Calls `locklab::debug::debug_msg` with a compile-time checked format string.
 */
#ifndef LOCKLAB_DEBUG
#define LOCKLAB_DEBUG(fmt, ...) ::locklab::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif
