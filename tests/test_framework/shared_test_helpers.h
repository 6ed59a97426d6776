// tests/test_framework/shared_test_helpers.h
#pragma once

// Must be first: defines LOCKLAB_IS_POSIX before any platform-conditional includes.
#include "locklab_platform.hpp"

/**
 * @file shared_test_helpers.h
 * @brief Provides common helper functions and utilities for test cases.
 *
 * This includes stderr capture, file helpers, test scaling utilities, reproducible
 * seeds and a barrier-started thread racer.
 */

#include <fcntl.h>
#include <unistd.h>

#include "gtest/gtest.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace locklab::tests::helper
{

/**
 * @brief Redirects a file descriptor (usually stderr) into a pipe for the lifetime of
 *        the object, so tests can inspect what was written to it.
 */
class StringCapture
{
  public:
    explicit StringCapture(int fd_to_capture) : fd_to_capture_(fd_to_capture), original_fd_(-1)
    {
        if (pipe(pipe_fds_) != 0)
            return;
        original_fd_ = dup(fd_to_capture_);
        dup2(pipe_fds_[1], fd_to_capture_);
        close(pipe_fds_[1]);
    }

    ~StringCapture()
    {
        if (original_fd_ != -1)
        {
            dup2(original_fd_, fd_to_capture_);
            close(original_fd_);
            close(pipe_fds_[0]);
        }
    }

    StringCapture(const StringCapture &) = delete;
    StringCapture &operator=(const StringCapture &) = delete;

    std::string GetOutput()
    {
        if (original_fd_ == -1)
            return {};

        fflush(stderr);
        dup2(original_fd_, fd_to_capture_);
        close(original_fd_);
        original_fd_ = -1; // Mark as restored

        std::string output;
        std::vector<char> buffer(1024);
        ssize_t bytes_read;
        while ((bytes_read = read(pipe_fds_[0], buffer.data(), buffer.size())) > 0)
        {
            output.append(buffer.data(), static_cast<size_t>(bytes_read));
        }
        close(pipe_fds_[0]);
        return output;
    }

  private:
    int fd_to_capture_;
    int original_fd_;
    int pipe_fds_[2] = {-1, -1};
};

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const std::string &path, std::string &out);

/**
 * @brief Counts the lines of `text`, optionally only those containing `must_include`
 *        and not containing `must_exclude`.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Retrieves the test scale factor from the environment.
 *
 * Set the `LOCKLAB_TEST_SCALE` environment variable to "small" to run lighter stress
 * loops (e.g. in CI or under sanitizers).
 *
 * @return The value of `LOCKLAB_TEST_SCALE`, or an empty string.
 */
std::string test_scale();

/**
 * @brief Returns `small_value` if `test_scale()` is "small", otherwise `original`.
 */
int scaled_value(int original, int small_value);

/**
 * @brief Thread count for contention tests: hardware concurrency clamped to [2, 4].
 */
int get_stress_num_threads();

/**
 * @brief Iteration count for contention tests, scaled by `test_scale()`.
 */
int get_stress_iterations(int original, int small_value);

/**
 * @brief A reproducible seed: `LOCKLAB_TEST_SEED` when set and numeric, else random.
 */
uint64_t get_seed();

// ============================================================================
// ThreadRacer: concurrent test execution
// ============================================================================

/**
 * @brief Runs N threads simultaneously to test concurrent behavior.
 *
 * All threads start at the same time (synchronized via a barrier).
 * Any exception thrown by a thread is captured and re-thrown from race().
 *
 * Usage:
 * @code
 *   ThreadRacer racer(4);
 *   bool ok = racer.race([&](int thread_id) {
 *       auto ref = lock.borrow();
 *       // ... assertions ...
 *   });
 *   ASSERT_TRUE(ok);
 * @endcode
 */
class ThreadRacer
{
  public:
    explicit ThreadRacer(int n_threads) : n_threads_(n_threads) {}

    /**
     * @brief Runs fn(thread_index) on n_threads simultaneously.
     * @return true if all threads completed without throwing, false otherwise.
     */
    template <typename F> bool race(F fn)
    {
        exceptions_.clear();
        exceptions_.resize(static_cast<size_t>(n_threads_));

        std::atomic<int> ready_count{0};
        std::atomic<bool> start_flag{false};

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_threads_));

        for (int i = 0; i < n_threads_; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    ready_count.fetch_add(1, std::memory_order_release);
                    // Spin until all threads are ready
                    while (!start_flag.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    try
                    {
                        fn(i);
                    }
                    catch (...)
                    {
                        exceptions_[static_cast<size_t>(i)] = std::current_exception();
                    }
                });
        }

        // Wait until all threads are at the barrier
        while (ready_count.load(std::memory_order_acquire) < n_threads_)
            std::this_thread::yield();

        // Release all threads simultaneously
        start_flag.store(true, std::memory_order_release);

        for (auto &t : threads)
            t.join();

        return std::all_of(exceptions_.begin(), exceptions_.end(),
                           [](const std::exception_ptr &p) { return p == nullptr; });
    }

    const std::vector<std::exception_ptr> &exceptions() const { return exceptions_; }

  private:
    int n_threads_;
    std::vector<std::exception_ptr> exceptions_;
};

/**
 * @brief Polls `pred` until it is true or `timeout` elapses.
 * @return The final value of `pred()`.
 */
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return pred();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace locklab::tests::helper
