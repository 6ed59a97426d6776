// logger.cpp
#include "utils/logger.hpp"
#include "utils/format_tools.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace locklab::utils
{

namespace
{
constexpr size_t kDefaultMaxLineLength = 16 * 1024;
constexpr const char *kLogEnvVar = "LOCKLAB_LOG";
} // namespace

// Implementation details hidden behind Impl
struct Impl
{
    Logger::Destination dest = Logger::Destination::L_CONSOLE;
    int file_fd = -1;
    std::string file_path;
    bool use_flock = false;
    std::mutex mtx;
    std::atomic<int> level{static_cast<int>(Logger::Level::L_INFO)};
    std::atomic<size_t> max_line{kDefaultMaxLineLength};
    std::atomic<int> write_failures{0};
    int last_errno = 0;
    std::function<void(const std::string &)> error_cb;

    void close_file_locked() noexcept
    {
        if (file_fd != -1)
        {
            ::close(file_fd);
            file_fd = -1;
            file_path.clear();
        }
    }
};

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger()
{
    shutdown();
}

Logger &Logger::instance()
{
    static Logger inst;
    static std::once_flag env_once;
    std::call_once(env_once,
                   []
                   {
                       const char *env = std::getenv(kLogEnvVar);
                       if (env == nullptr)
                           return;
                       if (auto lvl = format_tools::extract_value_from_string("level", env))
                           inst.set_level(parse_level(*lvl, Level::L_INFO));
                       if (auto path = format_tools::extract_value_from_string("file", env))
                       {
                           if (!path->empty() && !inst.init_file(*path))
                               fmt::print(stderr, "locklab: cannot open log file '{}': {}\n",
                                          *path, std::strerror(inst.last_errno()));
                       }
                   });
    return inst;
}

bool Logger::init_file(const std::string &path, bool use_flock, int mode)
{
    std::lock_guard<std::mutex> g(pImpl->mtx);
    pImpl->close_file_locked();
    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC,
                    static_cast<mode_t>(mode));
    if (fd == -1)
    {
        pImpl->last_errno = errno;
        return false;
    }
    pImpl->file_fd = fd;
    pImpl->file_path = path;
    pImpl->use_flock = use_flock;
    pImpl->dest = Destination::L_FILE;
    return true;
}

void Logger::set_destination(Destination dest)
{
    std::lock_guard<std::mutex> g(pImpl->mtx);
    if (dest == Destination::L_FILE && pImpl->file_fd == -1)
        return; // no file opened yet; stay where we are
    pImpl->dest = dest;
}

Logger::Destination Logger::destination() const
{
    std::lock_guard<std::mutex> g(pImpl->mtx);
    return pImpl->dest;
}

void Logger::shutdown()
{
    std::lock_guard<std::mutex> g(pImpl->mtx);
    pImpl->close_file_locked();
    pImpl->dest = Destination::L_CONSOLE;
}

void Logger::set_level(Level lvl)
{
    pImpl->level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return static_cast<Level>(pImpl->level.load(std::memory_order_relaxed));
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    std::lock_guard<std::mutex> g(pImpl->mtx);
    pImpl->error_cb = std::move(cb);
}

int Logger::last_errno() const
{
    std::lock_guard<std::mutex> g(pImpl->mtx);
    return pImpl->last_errno;
}

int Logger::write_failure_count() const
{
    return pImpl->write_failures.load(std::memory_order_relaxed);
}

void Logger::set_max_log_line_length(size_t bytes)
{
    pImpl->max_line.store(bytes, std::memory_order_relaxed);
}

size_t Logger::max_log_line_length() const noexcept
{
    return pImpl->max_line.load(std::memory_order_relaxed);
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= pImpl->level.load(std::memory_order_relaxed);
}

Logger::Level Logger::parse_level(std::string_view name, Level fallback) noexcept
{
    if (name == "trace")
        return Level::L_TRACE;
    if (name == "debug")
        return Level::L_DEBUG;
    if (name == "info")
        return Level::L_INFO;
    if (name == "warning" || name == "warn")
        return Level::L_WARNING;
    if (name == "error")
        return Level::L_ERROR;
    return fallback;
}

const char *Logger::level_to_string(Level lvl) noexcept
{
    switch (lvl)
    {
    case Level::L_TRACE:
        return "TRACE";
    case Level::L_DEBUG:
        return "DEBUG";
    case Level::L_INFO:
        return "INFO";
    case Level::L_WARNING:
        return "WARN";
    case Level::L_ERROR:
        return "ERROR";
    }
    return "UNK";
}

void Logger::record_write_error(int errcode, const char *msg) noexcept
{
    pImpl->write_failures.fetch_add(1, std::memory_order_relaxed);
    std::function<void(const std::string &)> cb;
    {
        std::lock_guard<std::mutex> g(pImpl->mtx);
        pImpl->last_errno = errcode;
        cb = pImpl->error_cb;
    }
    if (cb)
    {
        try
        {
            cb(fmt::format("{}: {}", msg, std::strerror(errcode)));
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "locklab: log write-error callback threw: {}\n", e.what());
        }
    }
}

void Logger::write_formatted(Level lvl, std::string &&body) noexcept
{
    int failed_errno = 0;
    try
    {
        auto line = format_tools::make_buffer("{} [{}] [tid={}] {}\n",
                                              format_tools::formatted_time(
                                                  std::chrono::system_clock::now()),
                                              level_to_string(lvl),
                                              platform::get_native_thread_id(), body);

        std::lock_guard<std::mutex> g(pImpl->mtx);
        if (pImpl->dest == Destination::L_FILE && pImpl->file_fd != -1)
        {
            if (pImpl->use_flock)
                ::flock(pImpl->file_fd, LOCK_EX);
            size_t off = 0;
            while (off < line.size())
            {
                ssize_t w = ::write(pImpl->file_fd, line.data() + off, line.size() - off);
                if (w < 0)
                {
                    if (errno == EINTR)
                        continue;
                    failed_errno = errno;
                    break;
                }
                off += static_cast<size_t>(w);
            }
            if (pImpl->use_flock)
                ::flock(pImpl->file_fd, LOCK_UN);
        }
        else
        {
            std::fwrite(line.data(), 1, line.size(), stderr);
            std::fflush(stderr);
        }
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "locklab: logger failure: %s\n", e.what());
        return;
    }

    if (failed_errno != 0)
        record_write_error(failed_errno, "log file write failed");
}

} // namespace locklab::utils
