/**
 * @file debug_info.cpp
 * @brief Implements `locklab::debug::print_stack_trace()`.
 *
 * On POSIX systems the frames come from `backtrace`; each frame is resolved with `dladdr`
 * and demangled with `__cxa_demangle`. Other platforms print a short notice instead.
 */
#include "utils/debug_info.hpp"

#if defined(LOCKLAB_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace
#endif

#include <memory>

namespace locklab::debug
{

#if defined(LOCKLAB_IS_POSIX)
namespace
{
std::string demangle(const char *mangled)
{
    if (mangled == nullptr)
        return "[symbol unknown]";

    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free);
    if (status == 0 && demangled)
        return demangled.get();
    return mangled;
}
} // namespace
#endif

void print_stack_trace() noexcept
{
    try
    {
        fmt::print(stderr, "Stack Trace (most recent call first):\n");
#if defined(LOCKLAB_IS_POSIX)
        constexpr int kMaxFrames = 128;
        void *callstack[kMaxFrames];
        int frames = backtrace(callstack, kMaxFrames);
        if (frames <= 0)
        {
            fmt::print(stderr, "  [No stack frames available]\n");
            return;
        }

        // Frame 0 is print_stack_trace itself.
        for (int i = 1; i < frames; ++i)
        {
            const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            Dl_info info{};
            if (dladdr(callstack[i], &info) != 0)
            {
                const auto base = reinterpret_cast<uintptr_t>(info.dli_fbase);
                const char *module = info.dli_fname != nullptr ? info.dli_fname : "(unknown)";
                fmt::print(stderr, "  #{:02}  {:#018x}  {} ({} + {:#x})\n", i - 1, addr,
                           demangle(info.dli_sname),
                           format_tools::filename_only(module), addr - base);
            }
            else
            {
                fmt::print(stderr, "  #{:02}  {:#018x}  [symbol unknown]\n", i - 1, addr);
            }
        }
#else
        fmt::print(stderr, "  [Stack trace not supported on this platform]\n");
#endif
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "  [Stack trace failed: %s]\n", e.what());
    }
}

} // namespace locklab::debug
