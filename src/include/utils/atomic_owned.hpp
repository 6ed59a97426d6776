#pragma once
/**
 * @file atomic_owned.hpp
 * @brief An atomic cell that always holds exactly one owned value.
 *
 * `AtomicOwned<T>` stores the raw representation of a `T` (see ownership_traits.hpp) in a
 * `std::atomic`. Values enter only by being moved in and leave only by being handed back
 * to the caller, so every value installed in the cell is disposed exactly once: by whoever
 * receives it from `swap()`/`compare_swap()`, or by the cell's destructor.
 */
#include <atomic>
#include <utility>

#include "utils/ownership_traits.hpp"

namespace locklab::sync
{

/**
 * @brief Outcome of `AtomicOwned::compare_swap`.
 * @details On success `value` is the displaced value; on failure it is the value the
 *          caller tried to install, handed back unchanged.
 */
template <typename T> struct CompareSwapResult
{
    bool succeeded;
    T value;
};

/// Failure ordering to pair with a compare-exchange success ordering.
constexpr std::memory_order failure_order_for(std::memory_order success) noexcept
{
    switch (success)
    {
    case std::memory_order_acq_rel:
        return std::memory_order_acquire;
    case std::memory_order_release:
        return std::memory_order_relaxed;
    default:
        return success;
    }
}

/**
 * @class AtomicOwned
 * @brief Atomically swappable owner of one `T`.
 *
 * The cell is neither copyable nor movable; share it by reference.
 */
template <TransferableOwnership T> class AtomicOwned
{
  public:
    using traits = OwnershipTraits<T>;
    using pointer = typename traits::pointer;

    /** @brief Installs `initial`, taking ownership. */
    explicit AtomicOwned(T initial) noexcept : ptr_(traits::into_raw(std::move(initial))) {}

    /** @brief Disposes whatever value the cell holds. */
    ~AtomicOwned()
    {
        T last = traits::from_raw(ptr_.load(std::memory_order_acquire));
    }

    AtomicOwned(const AtomicOwned &) = delete;
    AtomicOwned &operator=(const AtomicOwned &) = delete;
    AtomicOwned(AtomicOwned &&) = delete;
    AtomicOwned &operator=(AtomicOwned &&) = delete;

    /**
     * @brief Installs `value` and returns the value it displaced.
     * @param order Ordering of the underlying exchange.
     */
    [[nodiscard]] T swap(T value, std::memory_order order) noexcept
    {
        return traits::from_raw(ptr_.exchange(traits::into_raw(std::move(value)), order));
    }

    /**
     * @brief Installs `value` only if the cell currently holds `expected` (by identity).
     * @param expected Raw identity of the value the caller believes is installed.
     * @param value Value to install on success.
     * @param order Success ordering; the failure ordering is derived from it.
     */
    [[nodiscard]] CompareSwapResult<T> compare_swap(pointer expected, T value,
                                                    std::memory_order order) noexcept
    {
        pointer desired = traits::into_raw(std::move(value));
        if (ptr_.compare_exchange_strong(expected, desired, order, failure_order_for(order)))
        {
            return {true, traits::from_raw(expected)};
        }
        return {false, traits::from_raw(desired)};
    }

    /**
     * @brief Raw identity of the installed value.
     * @details The pointee may be disposed by another thread at any moment; use the result
     *          for comparison only.
     */
    [[nodiscard]] pointer load_raw(std::memory_order order) const noexcept
    {
        return ptr_.load(order);
    }

  private:
    std::atomic<pointer> ptr_;
};

} // namespace locklab::sync
