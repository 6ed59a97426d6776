#pragma once
/**
 * @file ownership_traits.hpp
 * @brief Ownership-transfer traits: moving an exclusively owned value into and out of
 *        a raw pointer, so it can travel through a `std::atomic<pointer>`.
 *
 * A type `T` takes part in atomic ownership transfer when `OwnershipTraits<T>` is
 * specialized with:
 *  - `pointer`: the raw representation (a plain pointer type; null means "no value"),
 *  - `into_raw(T&&)`: gives up ownership and returns the raw representation,
 *  - `from_raw(pointer)`: re-assumes ownership of a representation produced by `into_raw`,
 *  - `as_raw(const T&)`: the representation without giving up ownership (identity only).
 *
 * `from_raw` must be called exactly once for each `into_raw`. The specializations for the
 * wait/notify handshake live in `wait_notify.hpp`.
 */
#include <concepts>
#include <memory>
#include <type_traits>

namespace locklab::sync
{

template <typename T> struct OwnershipTraits; // no generic definition

/// Plain heap ownership. An empty `unique_ptr` is the "no value" state.
template <typename T> struct OwnershipTraits<std::unique_ptr<T>>
{
    using pointer = T *;

    static pointer into_raw(std::unique_ptr<T> &&value) noexcept { return value.release(); }
    static std::unique_ptr<T> from_raw(pointer raw) noexcept { return std::unique_ptr<T>(raw); }
    static pointer as_raw(const std::unique_ptr<T> &value) noexcept { return value.get(); }
};

/**
 * @brief Satisfied by types whose ownership can round-trip through a raw pointer.
 */
template <typename T>
concept TransferableOwnership =
    std::is_nothrow_move_constructible_v<T> &&
    std::is_pointer_v<typename OwnershipTraits<T>::pointer> &&
    requires(T &&value, const T &cref, typename OwnershipTraits<T>::pointer raw) {
        {
            OwnershipTraits<T>::into_raw(std::move(value))
        } -> std::same_as<typename OwnershipTraits<T>::pointer>;
        { OwnershipTraits<T>::from_raw(raw) } -> std::same_as<T>;
        { OwnershipTraits<T>::as_raw(cref) } -> std::same_as<typename OwnershipTraits<T>::pointer>;
    };

} // namespace locklab::sync
