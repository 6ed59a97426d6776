#pragma once
/**
 * @file guards.hpp
 * @brief Guards shared by several lock algorithms.
 *
 * Each guard releases exactly once, on destruction. A moved-from guard is inert.
 */
#include <atomic>
#include <cstddef>
#include <utility>

#include "utils/wait_notify.hpp"

namespace locklab::locks
{

/**
 * @class ResetGuard
 * @brief Releases by storing a fixed value into one atomic.
 *
 * Covers every lock whose release is a single store: clearing a flag (Peterson, Bakery,
 * TAS, TTAS) or dropping back to level 0 (Filter).
 */
template <typename T> class ResetGuard
{
  public:
    ResetGuard(std::atomic<T> &cell, T reset_value, std::memory_order order) noexcept
        : cell_(&cell), reset_value_(reset_value), order_(order)
    {
    }

    ~ResetGuard()
    {
        if (cell_ != nullptr)
        {
            cell_->store(reset_value_, order_);
        }
    }

    ResetGuard(const ResetGuard &) = delete;
    ResetGuard &operator=(const ResetGuard &) = delete;

    ResetGuard(ResetGuard &&other) noexcept
        : cell_(std::exchange(other.cell_, nullptr)), reset_value_(other.reset_value_),
          order_(other.order_)
    {
    }

    ResetGuard &operator=(ResetGuard &&other) noexcept
    {
        if (this != &other)
        {
            if (cell_ != nullptr)
            {
                cell_->store(reset_value_, order_);
            }
            cell_ = std::exchange(other.cell_, nullptr);
            reset_value_ = other.reset_value_;
            order_ = other.order_;
        }
        return *this;
    }

  private:
    std::atomic<T> *cell_;
    T reset_value_;
    std::memory_order order_;
};

using FlagGuard = ResetGuard<bool>;
using LevelGuard = ResetGuard<std::size_t>;

/**
 * @class HandoffGuard
 * @brief Holds the notifier of this participant's queue node; destroying it hands the
 *        lock to whoever queued behind (CLH, Timeout).
 */
template <typename T> class HandoffGuard
{
  public:
    explicit HandoffGuard(sync::Notifier<T> successor) noexcept
        : successor_(std::move(successor))
    {
    }

    HandoffGuard(HandoffGuard &&) noexcept = default;
    HandoffGuard &operator=(HandoffGuard &&) noexcept = default;
    HandoffGuard(const HandoffGuard &) = delete;
    HandoffGuard &operator=(const HandoffGuard &) = delete;

    // successor_'s destructor signals the node.
    ~HandoffGuard() = default;

  private:
    sync::Notifier<T> successor_;
};

} // namespace locklab::locks
