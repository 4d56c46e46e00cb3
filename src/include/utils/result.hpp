/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for operations that fail in expected ways.
 *
 * Expected failures (no instance available, duplicate request id) are part of
 * a call's normal outcome and travel back as a Result. Programming errors and
 * unrecoverable conditions still use exceptions.
 *
 * - Success (T) and expected failure (E) are distinct states.
 * - No implicit conversion to bool.
 * - [[nodiscard]] keeps call sites from dropping an error on the floor.
 */
#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace workerpool::utils
{

/**
 * @class Result
 * @tparam T Success value type
 * @tparam E Error enum type
 *
 * @code
 * auto r = balancer.route("req-1", payload);
 * if (r.is_ok()) {
 *     dispatch(r.content());
 * } else {
 *     reply_busy(to_string(r.error()));
 * }
 * @endcode
 *
 * Result objects are not thread-safe.
 */
template <typename T, typename E> class Result
{
  public:
    using value_type = T;
    using error_type = E;

    // ====================================================================
    // Construction
    // ====================================================================

    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @brief Create a failed Result.
     * @param err  The error enum value
     * @param code Optional detail code (attempt count, errno, ...)
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{err, code};
        return result;
    }

    Result() : m_data(ErrorData{E{}, 0}) {}

    // Move-only so large payloads are never copied by accident.
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    // ====================================================================
    // State Queries
    // ====================================================================

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    // ====================================================================
    // Value Access
    // ====================================================================

    /**
     * @brief Get the success content.
     * @throws std::logic_error if the Result holds an error
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

    // ====================================================================
    // Error Access
    // ====================================================================

    /// @throws std::logic_error if the Result holds a value
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

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
    };

    std::variant<T, ErrorData> m_data;
};

} // namespace workerpool::utils
