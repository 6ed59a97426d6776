#pragma once
/**
 * @file ttas_lock.hpp
 * @brief Test-and-test-and-set spin locks, with and without exponential backoff.
 */
#include <atomic>
#include <optional>

#include "locks/guards.hpp"
#include "locks/lock.hpp"
#include "utils/backoff_strategy.hpp"

namespace locklab::locks
{

/**
 * @class TtasLock
 * @brief Spins on plain loads until the flag looks clear and only then tries the exchange,
 *        keeping the cache line shared while the lock is held.
 */
class LOCKLAB_EXPORT TtasLock : public UnboundedLockBase<TtasLock>
{
  public:
    using Guard = FlagGuard;

    TtasLock();

    [[nodiscard]] Guard acquire();

    /**
     * @brief Waits until the lock looks free, then makes a single exchange attempt.
     * @return The guard if the attempt won, std::nullopt if another thread got there first.
     */
    [[nodiscard]] std::optional<Guard> try_acquire();

  private:
    std::atomic<bool> locked_{false};
};

/**
 * @class BackoffLock
 * @brief TTAS lock that backs off (see utils::Backoff) after every lost exchange.
 *
 * Each acquiring thread starts from `min_delay`; the delay bound doubles per failure up to
 * `max_delay`.
 */
class LOCKLAB_EXPORT BackoffLock : public UnboundedLockBase<BackoffLock>
{
  public:
    using Guard = FlagGuard;

    BackoffLock() : BackoffLock(utils::BackoffConfig{}) {}
    explicit BackoffLock(utils::BackoffConfig config);

    [[nodiscard]] Guard acquire();

    [[nodiscard]] const utils::BackoffConfig &config() const noexcept { return config_; }

  private:
    utils::BackoffConfig config_;
    std::atomic<bool> locked_{false};
};

} // namespace locklab::locks
