#ifndef MPINT_RESULT_HPP
#define MPINT_RESULT_HPP

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "mpint/util/assert.hpp"

#include "mpint/fwd.hpp"

namespace mpint {

/// @brief Tag type which selects the error alternative of a `Result`
/// when constructing it.
struct Error_Tag { };

inline constexpr Error_Tag error_tag {};

/// @brief Either holds a value of type `T`, or an error of type `E`.
///
/// Both alternatives are implicitly constructible,
/// so that a function returning `Result<T, E>` can simply `return value;`
/// or `return error;`.
template <typename T, typename E>
struct [[nodiscard]] Result {
    static_assert(!std::is_same_v<T, E>, "The value and error type must be distinct.");
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>);

    using value_type = T;
    using error_type = E;

private:
    std::variant<T, E> m_data;

public:
    [[nodiscard]]
    constexpr Result(const T& value)
        : m_data { std::in_place_index<0>, value }
    {
    }

    [[nodiscard]]
    constexpr Result(T&& value)
        : m_data { std::in_place_index<0>, std::move(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_data { std::in_place_index<1>, error }
    {
    }

    [[nodiscard]]
    constexpr Result(Error_Tag, const E& error)
        : m_data { std::in_place_index<1>, error }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.index() == 0;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr T& value() &
    {
        MPINT_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr const T& value() const&
    {
        MPINT_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr T&& value() &&
    {
        MPINT_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_data));
    }

    [[nodiscard]]
    constexpr T& operator*() &
    {
        return value();
    }

    [[nodiscard]]
    constexpr const T& operator*() const&
    {
        return value();
    }

    [[nodiscard]]
    constexpr T&& operator*() &&
    {
        return std::move(*this).value();
    }

    [[nodiscard]]
    constexpr T* operator->()
    {
        return &value();
    }

    [[nodiscard]]
    constexpr const T* operator->() const
    {
        return &value();
    }

    template <typename U>
    [[nodiscard]]
    constexpr T value_or(U&& fallback) const&
    {
        return has_value() ? value() : T(std::forward<U>(fallback));
    }

    [[nodiscard]]
    constexpr E error() const
    {
        MPINT_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Result& x, const Result& y)
    {
        return x.m_data == y.m_data;
    }
};

/// @brief Specialization for operations that produce no value on success.
/// A default-constructed `Result<void, E>` represents success.
template <typename E>
struct [[nodiscard]] Result<void, E> {
    using value_type = void;
    using error_type = E;

private:
    std::optional<E> m_error;

public:
    [[nodiscard]]
    constexpr Result() noexcept
        = default;

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_error { error }
    {
    }

    [[nodiscard]]
    constexpr Result(Error_Tag, const E& error)
        : m_error { error }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return !m_error.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr E error() const
    {
        MPINT_ASSERT(!has_value());
        return *m_error;
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Result& x, const Result& y)
    {
        return x.m_error == y.m_error;
    }
};

template <typename T>
inline constexpr bool is_result_v = false;

template <typename T, typename E>
inline constexpr bool is_result_v<Result<T, E>> = true;

} // namespace mpint

#endif
