#ifndef MPINT_MATH_HPP
#define MPINT_MATH_HPP

#include <concepts>

#include "mpint/fwd.hpp"
#include "mpint/settings.hpp"

namespace mpint {

/// @brief The rounding mode of an integer division.
enum struct Div_Rounding : Default_Underlying {
    /// @brief Truncating division, like the builtin `/` operator.
    to_zero,
    /// @brief Rounding towards positive infinity ("ceil" division).
    to_pos_inf,
    /// @brief Rounding towards negative infinity ("floor" division).
    to_neg_inf,
};

template <typename Q, typename R = Q>
struct Div_Result {
    Q quotient;
    R remainder;

    friend bool operator==(const Div_Result&, const Div_Result&) = default;
};

// https://github.com/eisenwave/integer-division

template <std::signed_integral Integer>
[[nodiscard]]
constexpr Integer div_to_pos_inf(Integer x, Integer y) noexcept
{
    const bool quotient_positive = (x ^ y) >= 0;
    const bool adjust = (x % y != 0) & quotient_positive;
    return (x / y) + Integer(adjust);
}

template <std::signed_integral Integer>
[[nodiscard]]
constexpr Integer rem_to_pos_inf(Integer x, Integer y) noexcept
{
    const bool quotient_positive = (x ^ y) >= 0;
    const bool adjust = (x % y != 0) & quotient_positive;
    return (x % y) - (Integer(adjust) * y);
}

template <std::signed_integral Integer>
[[nodiscard]]
constexpr Integer div_to_neg_inf(Integer x, Integer y) noexcept
{
    const bool quotient_negative = (x ^ y) < 0;
    const bool adjust = (x % y != 0) & quotient_negative;
    return (x / y) - Integer(adjust);
}

template <std::signed_integral Integer>
[[nodiscard]]
constexpr Integer rem_to_neg_inf(Integer x, Integer y) noexcept
{
    const bool quotient_negative = (x ^ y) < 0;
    const bool adjust = (x % y != 0) & quotient_negative;
    return (x % y) + (Integer(adjust) * y);
}

template <std::signed_integral Integer>
[[nodiscard]]
constexpr Div_Result<Integer> div_rem_to_zero(Integer x, Integer y) noexcept
{
    return { x / y, x % y };
}

template <std::signed_integral Integer>
[[nodiscard]]
constexpr Div_Result<Integer> div_rem_to_pos_inf(Integer x, Integer y) noexcept
{
    return { div_to_pos_inf(x, y), rem_to_pos_inf(x, y) };
}

template <std::signed_integral Integer>
[[nodiscard]]
constexpr Div_Result<Integer> div_rem_to_neg_inf(Integer x, Integer y) noexcept
{
    return { div_to_neg_inf(x, y), rem_to_neg_inf(x, y) };
}

/// @brief Returns `x` modulo `|y|` in range `[0, |y|)`.
/// That is, the remainder of the Euclidean division.
template <std::signed_integral Integer>
[[nodiscard]]
constexpr Integer mod_euclidean(Integer x, Integer y) noexcept
{
    const Integer r = x % y;
    if (r >= 0) {
        return r;
    }
    return y < 0 ? r - y : r + y;
}

// OVERFLOW-CHECKED ARITHMETIC =================================================

/// @brief Computes `out = x + y` and returns `true`
/// if the result could not be exactly represented.
[[nodiscard]]
constexpr bool add_overflow(Uint128& out, Uint128 x, Uint128 y) noexcept
{
    return __builtin_add_overflow(x, y, &out);
}

/// @brief Computes `out = x + y` and returns `true`
/// if the result could not be exactly represented.
[[nodiscard]]
constexpr bool add_overflow(Int128& out, Int128 x, Int128 y) noexcept
{
    return __builtin_add_overflow(x, y, &out);
}

/// @brief Computes `out = x - y` and returns `true`
/// if the result could not be exactly represented.
[[nodiscard]]
constexpr bool sub_overflow(Int128& out, Int128 x, Int128 y) noexcept
{
    return __builtin_sub_overflow(x, y, &out);
}

/// @brief Computes `out = x * y` and returns `true`
/// if the result could not be exactly represented.
[[nodiscard]]
constexpr bool mul_overflow(Uint128& out, Uint128 x, Uint128 y) noexcept
{
    return __builtin_mul_overflow(x, y, &out);
}

/// @brief Computes `out = x * y` and returns `true`
/// if the result could not be exactly represented.
[[nodiscard]]
constexpr bool mul_overflow(Int128& out, Int128 x, Int128 y) noexcept
{
    return __builtin_mul_overflow(x, y, &out);
}

} // namespace mpint

#endif
