/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for operations that fail in expected ways.
 *
 * Design:
 * - Distinguishes between success (T) and expected failures (E, an enum)
 * - Carries a human-readable detail message alongside the error kind
 * - No implicit conversions to bool
 * - [[nodiscard]] factories so results are not silently dropped
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace federator::utils
{

/**
 * @class Result
 * @brief Holds either a success value of type T or an error of enum type E.
 *
 * @tparam T Success value type
 * @tparam E Error enum type
 *
 * Usage:
 * @code
 * Result<int64_t, TransferError> parse_offset(std::string_view s) {
 *     if (s.empty()) {
 *         return Result<int64_t, TransferError>::error(TransferError::InvalidRequest,
 *                                                      "empty offset");
 *     }
 *     return Result<int64_t, TransferError>::ok(42);
 * }
 *
 * auto r = parse_offset(text);
 * if (r.is_error()) {
 *     LOGGER_WARN("bad offset: {}", r.error_message());
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    /**
     * @brief Create a successful Result containing a value
     */
    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @brief Create a failed Result
     * @param err The error enum value
     * @param message Detail message for logs and callers
     * @param code Optional detailed error code (errno, zmq errno, ...)
     */
    [[nodiscard]] static Result error(E err, std::string message = {}, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{err, code, std::move(message)};
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, 0, {}}) {}

    // Movable but not copyable
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

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
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    /**
     * @brief Move the success content out of Result
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

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
        return std::get<ErrorData>(m_data).error_enum;
    }

    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

    [[nodiscard]] const std::string &error_message() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_message() called on success state");
        }
        return std::get<ErrorData>(m_data).message;
    }

    /**
     * @brief Re-wrap this error as a Result of another value type.
     * @throws std::logic_error if Result is in success state
     */
    template <typename U> [[nodiscard]] Result<U, E> forward_error() const
    {
        return Result<U, E>::error(error(), error_message(), error_code());
    }

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
        std::string message;
    };

    std::variant<T, ErrorData> m_data;
};

/**
 * @brief Result for operations with no success payload.
 */
template <typename E> using VoidResult = Result<std::monostate, E>;

template <typename E> [[nodiscard]] inline VoidResult<E> ok_void()
{
    return VoidResult<E>::ok(std::monostate{});
}

} // namespace federator::utils
