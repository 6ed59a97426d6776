#pragma once
/**
 * @file wait_notify.hpp
 * @brief One-shot wait/notify handshake between exactly one waiting and one notifying party.
 *
 * `make_handshake()` allocates a cell holding an atomic "notified" flag and a payload and
 * returns the two ends:
 *  - `Waiter<T>` owns the allocation. `wait()` spins until the flag is set and then grants
 *    exclusive access to the payload. Its destructor waits as well before freeing, so the
 *    allocation outlives every `Notifier` still pointing at it.
 *  - `Notifier<T>` borrows the allocation. It may write the payload, then signals exactly
 *    once: through `notify()` or implicitly when it is destroyed.
 *
 * The flag is set with release ordering and read with acquire ordering, so everything the
 * notifying side wrote before signalling is visible to the waiting side after `wait()`.
 *
 * Both ends are move-only. A default-constructed or moved-from end is empty and plays the
 * role of "no value" (for example "no successor yet" in a queue lock).
 */
#include <atomic>
#include <cstddef>
#include <utility>

#include "locklab_platform.hpp"
#include "utils/ownership_traits.hpp"

namespace locklab::sync
{

namespace detail
{
template <typename T> struct HandshakeCell
{
    template <typename... Args>
    explicit HandshakeCell(bool notified_init, Args &&...args)
        : notified(notified_init), payload(std::forward<Args>(args)...)
    {
    }

    std::atomic<bool> notified;
    T payload;
};
} // namespace detail

template <typename T> class Notifier;

/**
 * @class Waiter
 * @brief Owning, waiting end of a handshake.
 */
template <typename T> class Waiter
{
  public:
    using cell_type = detail::HandshakeCell<T>;
    using raw_pointer = cell_type *;

    /// Empty waiter ("no value").
    Waiter() noexcept = default;

    ~Waiter() { dispose(); }

    Waiter(const Waiter &) = delete;
    Waiter &operator=(const Waiter &) = delete;

    Waiter(Waiter &&other) noexcept : cell_(std::exchange(other.cell_, nullptr)) {}

    /// Waits for the current handshake (if any) to be signalled before taking `other`'s.
    Waiter &operator=(Waiter &&other) noexcept
    {
        if (this != &other)
        {
            dispose();
            cell_ = std::exchange(other.cell_, nullptr);
        }
        return *this;
    }

    /**
     * @brief Spins until the paired notifier has signalled.
     * @return Exclusive access to the payload.
     * @pre The waiter is not empty.
     */
    T &wait() noexcept
    {
        while (!cell_->notified.load(std::memory_order_acquire))
        {
            platform::cpu_relax();
        }
        return cell_->payload;
    }

    /**
     * @brief Non-blocking variant of `wait()`.
     * @return The payload if the handshake has been signalled, otherwise nullptr.
     */
    [[nodiscard]] T *try_wait() noexcept
    {
        if (cell_->notified.load(std::memory_order_acquire))
        {
            return &cell_->payload;
        }
        return nullptr;
    }

    [[nodiscard]] bool is_notified() const noexcept
    {
        return cell_ != nullptr && cell_->notified.load(std::memory_order_acquire);
    }

    /**
     * @brief Waits, then re-arms the same allocation for another round.
     * @return A fresh notifier bound to this waiter. The payload is left as the previous
     *         notifier wrote it.
     */
    [[nodiscard]] Notifier<T> reset() noexcept
    {
        (void)wait();
        cell_->notified.store(false, std::memory_order_relaxed);
        return Notifier<T>(cell_);
    }

    /// Identity of the shared allocation; used as the expected value of a compare-and-swap.
    [[nodiscard]] raw_pointer raw() const noexcept { return cell_; }

    explicit operator bool() const noexcept { return cell_ != nullptr; }

  private:
    friend struct OwnershipTraits<Waiter<T>>;
    template <typename U, typename... Args>
    friend std::pair<Waiter<U>, Notifier<U>> make_handshake(Args &&...args);
    template <typename U, typename... Args> friend Waiter<U> make_notified_waiter(Args &&...args);

    explicit Waiter(raw_pointer cell) noexcept : cell_(cell) {}

    void dispose() noexcept
    {
        if (cell_ != nullptr)
        {
            (void)wait();
            delete cell_;
            cell_ = nullptr;
        }
    }

    raw_pointer cell_ = nullptr;
};

/**
 * @class Notifier
 * @brief Signalling end of a handshake. Does not own the allocation.
 */
template <typename T> class Notifier
{
  public:
    using cell_type = detail::HandshakeCell<T>;
    using raw_pointer = cell_type *;

    /// Empty notifier ("no value").
    Notifier() noexcept = default;

    ~Notifier() { notify(); }

    Notifier(const Notifier &) = delete;
    Notifier &operator=(const Notifier &) = delete;

    Notifier(Notifier &&other) noexcept : cell_(std::exchange(other.cell_, nullptr)) {}

    /// Signals the current handshake (if any) before taking `other`'s.
    Notifier &operator=(Notifier &&other) noexcept
    {
        if (this != &other)
        {
            notify();
            cell_ = std::exchange(other.cell_, nullptr);
        }
        return *this;
    }

    /**
     * @brief Signals the waiter and detaches. Calling it again, or destroying the notifier
     *        afterwards, has no further effect.
     */
    void notify() noexcept
    {
        if (cell_ != nullptr)
        {
            // The waiter may free the cell as soon as the store lands.
            std::exchange(cell_, nullptr)->notified.store(true, std::memory_order_release);
        }
    }

    /// Payload access for the notifying side, valid until it signals.
    T &operator*() const noexcept { return cell_->payload; }
    T *operator->() const noexcept { return &cell_->payload; }

    [[nodiscard]] raw_pointer raw() const noexcept { return cell_; }

    explicit operator bool() const noexcept { return cell_ != nullptr; }

  private:
    friend class Waiter<T>;
    friend struct OwnershipTraits<Notifier<T>>;
    template <typename U, typename... Args>
    friend std::pair<Waiter<U>, Notifier<U>> make_handshake(Args &&...args);

    explicit Notifier(raw_pointer cell) noexcept : cell_(cell) {}

    raw_pointer cell_ = nullptr;
};

/**
 * @brief Creates a connected, not yet signalled, handshake.
 * @tparam T Payload type, constructed in place from `args`.
 */
template <typename T, typename... Args>
std::pair<Waiter<T>, Notifier<T>> make_handshake(Args &&...args)
{
    auto *cell = new detail::HandshakeCell<T>(false, std::forward<Args>(args)...);
    return std::pair<Waiter<T>, Notifier<T>>(Waiter<T>(cell), Notifier<T>(cell));
}

/**
 * @brief Creates a waiter whose handshake is already signalled.
 * @details Seeds the tail of a queue lock so the first acquirer does not wait.
 */
template <typename T, typename... Args> Waiter<T> make_notified_waiter(Args &&...args)
{
    return Waiter<T>(new detail::HandshakeCell<T>(true, std::forward<Args>(args)...));
}

template <typename T> struct OwnershipTraits<Waiter<T>>
{
    using pointer = typename Waiter<T>::raw_pointer;

    static pointer into_raw(Waiter<T> &&value) noexcept
    {
        return std::exchange(value.cell_, nullptr);
    }
    static Waiter<T> from_raw(pointer raw) noexcept { return Waiter<T>(raw); }
    static pointer as_raw(const Waiter<T> &value) noexcept { return value.cell_; }
};

template <typename T> struct OwnershipTraits<Notifier<T>>
{
    using pointer = typename Notifier<T>::raw_pointer;

    static pointer into_raw(Notifier<T> &&value) noexcept
    {
        return std::exchange(value.cell_, nullptr);
    }
    static Notifier<T> from_raw(pointer raw) noexcept { return Notifier<T>(raw); }
    static pointer as_raw(const Notifier<T> &value) noexcept { return value.cell_; }
};

} // namespace locklab::sync
