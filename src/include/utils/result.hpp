/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for error handling without exceptions
 *
 * Provides type-safe error handling for operations that can fail in expected ways.
 * In locklab the only recoverable failure is borrowing a reference from a bounded lock
 * whose participant capacity is already in use.
 *
 * Design Philosophy:
 * - Distinguishes between success (T) and expected failures (E)
 * - Forces explicit error handling at call sites
 * - No implicit conversions to bool (prevents accidental misuse)
 * - [[nodiscard]] prevents ignoring errors
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace locklab::utils
{

/**
 * @brief Error type for borrowing a reference from a bounded lock
 */
enum class BorrowError
{
    ThreadCapacityExceeded ///< Every participant slot is in use (retry after a reference drops)
};

/**
 * @brief Convert BorrowError to string for logging/debugging
 */
inline const char *to_string(BorrowError err) noexcept
{
    switch (err)
    {
    case BorrowError::ThreadCapacityExceeded:
        return "ThreadCapacityExceeded";
    default:
        return "Unknown";
    }
}

/**
 * @class Result
 * @brief Generic Result<T, E> type for operations that can fail in expected ways
 *
 * @tparam T Success value type
 * @tparam E Error enum type (should be an enum or enum class)
 *
 * Usage:
 * @code
 * auto ref = lock.borrow();
 * if (ref.is_ok()) {
 *     auto guard = ref.content().acquire();
 *     // critical section
 * } else {
 *     BorrowError err = ref.error();
 *     // handle error
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe. Use separate Result
 * instances per thread or external synchronization.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    /**
     * @brief Create a successful Result containing a value
     * @param value The success value (moved into Result)
     * @return Result in success state
     */
    [[nodiscard]] static Result ok(T value)
    {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /**
     * @brief Create a failed Result containing an error
     * @param err The error enum value
     * @param code Optional detailed error code (default 0)
     * @return Result in error state
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        return Result(std::in_place_index<1>, ErrorData{err, code});
    }

    // Movable but not copyable (lock references are move-only)
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    // ====================================================================
    // State Queries
    // ====================================================================

    /**
     * @brief Check if Result contains a success value
     */
    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }

    /**
     * @brief Check if Result contains an error
     */
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    // ====================================================================
    // Value Access
    // ====================================================================

    /**
     * @brief Get the success content (mutable reference)
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(m_data);
    }

    /**
     * @brief Get the success content (const reference)
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(m_data);
    }

    /**
     * @brief Move the success content out of Result
     * @throws std::logic_error if Result is in error state
     *
     * After this call, Result is left in a valid but unspecified state.
     */
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(std::move(m_data));
    }

    /**
     * @brief Get the success value or a default if error
     */
    [[nodiscard]] T value_or(T default_value) const &
        requires std::is_copy_constructible_v<T>
    {
        return is_ok() ? std::get<0>(m_data) : std::move(default_value);
    }

    // ====================================================================
    // Error Access
    // ====================================================================

    /**
     * @brief Get the error enum value
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] E error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<1>(m_data).error_enum;
    }

    /**
     * @brief Get the detailed error code
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<1>(m_data).error_code;
    }

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
    };

    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V &&v) : m_data(tag, std::forward<V>(v))
    {
    }

    // Storage: either T (success) or ErrorData (failure)
    std::variant<T, ErrorData> m_data;
};

/**
 * @brief Result of borrowing a lock reference.
 * @tparam RefT The reference type the lock hands out.
 */
template <typename RefT>
using BorrowResult = Result<RefT, BorrowError>;

} // namespace locklab::utils
