/**
 * @file platform.cpp
 * @brief Implements the Layer 0 platform helpers declared in locklab_platform.hpp.
 */
#include "locklab_platform.hpp"

#include <chrono>
#include <functional>
#include <thread>

#if defined(LOCKLAB_PLATFORM_LINUX)
#include <sys/syscall.h>
#include <unistd.h>
#elif defined(LOCKLAB_PLATFORM_APPLE)
#include <pthread.h>
#endif

#ifndef LOCKLAB_VERSION_MAJOR
#define LOCKLAB_VERSION_MAJOR 0
#endif
#ifndef LOCKLAB_VERSION_MINOR
#define LOCKLAB_VERSION_MINOR 0
#endif
#ifndef LOCKLAB_VERSION_ROLLING
#define LOCKLAB_VERSION_ROLLING 0
#endif
#ifndef LOCKLAB_VERSION_STRING
#define LOCKLAB_VERSION_STRING "0.0.0"
#endif

namespace locklab::platform
{

uint64_t get_native_thread_id() noexcept
{
#if defined(LOCKLAB_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(LOCKLAB_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    // Fallback for other POSIX or unknown systems.
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

int get_version_major() noexcept
{
    return LOCKLAB_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return LOCKLAB_VERSION_MINOR;
}

int get_version_rolling() noexcept
{
    return LOCKLAB_VERSION_ROLLING;
}

const char *get_version_string() noexcept
{
    return LOCKLAB_VERSION_STRING;
}

uint64_t monotonic_time_ns() noexcept
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    const uint64_t now = monotonic_time_ns();
    return now > start_ns ? now - start_ns : 0;
}

} // namespace locklab::platform
