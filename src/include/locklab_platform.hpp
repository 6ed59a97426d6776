#pragma once
/**
 * @file locklab_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (LOCKLAB_PLATFORM_LINUX, LOCKLAB_IS_POSIX, etc.) or the spin
 * hint should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>

#if defined(PLATFORM_APPLE)

#define LOCKLAB_PLATFORM_APPLE 1
#undef LOCKLAB_PLATFORM_LINUX
#undef LOCKLAB_PLATFORM_FREEBSD

#elif defined(PLATFORM_FREEBSD)

#define LOCKLAB_PLATFORM_FREEBSD 1
#undef LOCKLAB_PLATFORM_APPLE
#undef LOCKLAB_PLATFORM_LINUX

#elif defined(PLATFORM_LINUX)

#define LOCKLAB_PLATFORM_LINUX 1
#undef LOCKLAB_PLATFORM_APPLE
#undef LOCKLAB_PLATFORM_FREEBSD

#else
// Fallback detection
#if defined(__APPLE__) && defined(__MACH__)
#define LOCKLAB_PLATFORM_APPLE 1
#undef LOCKLAB_PLATFORM_LINUX
#undef LOCKLAB_PLATFORM_FREEBSD

#elif defined(__FreeBSD__)
#define LOCKLAB_PLATFORM_FREEBSD 1
#undef LOCKLAB_PLATFORM_APPLE
#undef LOCKLAB_PLATFORM_LINUX

#elif defined(__linux__)
#define LOCKLAB_PLATFORM_LINUX 1
#undef LOCKLAB_PLATFORM_APPLE
#undef LOCKLAB_PLATFORM_FREEBSD

#else
#define LOCKLAB_PLATFORM_UNKNOWN 1
#undef LOCKLAB_PLATFORM_FREEBSD
#undef LOCKLAB_PLATFORM_APPLE
#undef LOCKLAB_PLATFORM_LINUX
#endif
#endif

// Convenience boolean for source code usage:
#if defined(LOCKLAB_PLATFORM_APPLE) || defined(LOCKLAB_PLATFORM_FREEBSD) ||                        \
    defined(LOCKLAB_PLATFORM_LINUX)
#define LOCKLAB_IS_POSIX 1
#else
#undef LOCKLAB_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// The codebase uses std::source_location, requires-clauses and defaulted comparisons.
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif

#include "locklab_export.h"

#if defined(__x86_64__) || defined(__i386__)
#include <immintrin.h>
#endif

namespace locklab::platform
{

/// Assumed size of a cache line; used to keep independently spun-on flags apart.
inline constexpr std::size_t kCacheLineSize = 64;

/**
 * @brief Hints the CPU that the caller is in a busy-wait loop.
 * @details Does not yield the processor to the scheduler; it only relaxes the pipeline
 *          (PAUSE on x86, YIELD on AArch64) so a sibling hyper-thread can make progress.
 */
inline void cpu_relax() noexcept
{
#if defined(__x86_64__) || defined(__i386__)
    _mm_pause();
#elif defined(__aarch64__) || defined(__arm__)
    asm volatile("yield" ::: "memory");
#else
    asm volatile("" ::: "memory");
#endif
}

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
LOCKLAB_EXPORT uint64_t get_native_thread_id() noexcept;

/** @brief Major version number of the locklab library. */
LOCKLAB_EXPORT int get_version_major() noexcept;
/** @brief Minor version number of the locklab library. */
LOCKLAB_EXPORT int get_version_minor() noexcept;
/** @brief Rolling (patch) version number of the locklab library. */
LOCKLAB_EXPORT int get_version_rolling() noexcept;
/**
 * @brief Gets the full version string (major.minor.rolling).
 * @return A string such as "0.3.0".
 */
LOCKLAB_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @details Uses std::chrono::steady_clock. The absolute value is meaningless; use for
 *          computing time deltas only.
 */
LOCKLAB_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed since start_ns. If start_ns is in the future, returns 0.
 */
LOCKLAB_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace locklab::platform
