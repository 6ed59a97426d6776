#pragma once
/**
 * @file tas_lock.hpp
 * @brief Test-and-set spin lock.
 */
#include <atomic>

#include "locks/guards.hpp"
#include "locks/lock.hpp"

namespace locklab::locks
{

/**
 * @class TasLock
 * @brief Unbounded spin lock on one atomic flag; every attempt is an exchange.
 */
class LOCKLAB_EXPORT TasLock : public UnboundedLockBase<TasLock>
{
  public:
    using Guard = FlagGuard;

    TasLock();

    [[nodiscard]] Guard acquire();

    /// Racy snapshot, for diagnostics.
    [[nodiscard]] bool is_locked() const noexcept
    {
        return locked_.load(std::memory_order_relaxed);
    }

  private:
    std::atomic<bool> locked_{false};
};

} // namespace locklab::locks
