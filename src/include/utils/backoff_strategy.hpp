#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Bounded exponential backoff with randomized jitter for spin loops.
 *
 * A thread that repeatedly fails to take a contended lock calls `Backoff::backoff()`
 * between attempts. Each call sleeps for a uniformly random duration in
 * `[0, current_limit)` and then doubles the limit, saturating at the configured
 * maximum. Backoff only reduces contention; lock correctness never depends on it.
 *
 * @example
 * Backoff backoff(BackoffConfig{});
 * while (!lock.try_acquire()) {
 *     backoff.backoff();
 * }
 */
#include <chrono>
#include <cstdint>
#include <random>

#include "locklab_platform.hpp"

namespace locklab::utils
{

/**
 * @brief Delay bounds for `Backoff`.
 * @details The defaults (1 ms initial, 1 s ceiling) are the ones the backoff TTAS lock uses.
 */
struct BackoffConfig
{
    std::chrono::nanoseconds min_delay{std::chrono::milliseconds(1)};
    std::chrono::nanoseconds max_delay{std::chrono::milliseconds(1000)};
};

/**
 * @brief Exponential backoff state owned by one waiting thread.
 *
 * Not thread-safe: each spinning thread keeps its own instance.
 */
class LOCKLAB_EXPORT Backoff
{
  public:
    /**
     * @brief Constructs a backoff with the given bounds.
     * @details A zero `min_delay` is raised to 1 ns and a `max_delay` below `min_delay` is
     *          raised to `min_delay`.
     */
    explicit Backoff(BackoffConfig config = {});
    Backoff(std::chrono::nanoseconds min_delay, std::chrono::nanoseconds max_delay)
        : Backoff(BackoffConfig{min_delay, max_delay})
    {
    }

    /// Sleeps for a random duration below the current limit, then doubles the limit.
    void backoff();

    /// Restores the limit to `min_delay`.
    void reset() noexcept { limit_ = min_; }

    [[nodiscard]] std::chrono::nanoseconds current_limit() const noexcept { return limit_; }
    [[nodiscard]] std::chrono::nanoseconds min_delay() const noexcept { return min_; }
    [[nodiscard]] std::chrono::nanoseconds max_delay() const noexcept { return max_; }

  private:
    // Picks the next delay and advances the limit.
    std::chrono::nanoseconds next_delay();

    std::chrono::nanoseconds min_;
    std::chrono::nanoseconds max_;
    std::chrono::nanoseconds limit_;
    std::minstd_rand rng_;
};

} // namespace locklab::utils
