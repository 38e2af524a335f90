#ifndef MPINT_BIG_INT_ERROR_HPP
#define MPINT_BIG_INT_ERROR_HPP

#include <string_view>

#include "mpint/util/assert.hpp"

#include "mpint/fwd.hpp"

namespace mpint {

/// @brief The reason why an operation on `Big_Int` failed.
enum struct Big_Int_Error : Default_Underlying {
    /// @brief A string could not be interpreted as a number.
    parse,
    /// @brief The result does not fit into the requested type,
    /// or its computation would exceed implementation limits.
    overflow,
    /// @brief The divisor (or modulus) of a division was zero.
    division_by_zero,
    /// @brief An argument was outside the mathematical domain of the operation,
    /// such as the square root of a negative number.
    domain,
    /// @brief The source of random bytes failed.
    random_source,
};

/// @brief Returns the name of the enumerator, like `u8"division_by_zero"`.
[[nodiscard]]
constexpr std::u8string_view big_int_error_name(Big_Int_Error e)
{
    switch (e) {
        using enum Big_Int_Error;
        MPINT_ENUM_STRING_CASE8(parse);
        MPINT_ENUM_STRING_CASE8(overflow);
        MPINT_ENUM_STRING_CASE8(division_by_zero);
        MPINT_ENUM_STRING_CASE8(domain);
        MPINT_ENUM_STRING_CASE8(random_source);
    }
    MPINT_ASSERT_UNREACHABLE(u8"Invalid error.");
}

[[nodiscard]]
constexpr std::u8string_view big_int_error_explanation(Big_Int_Error e)
{
    using enum Big_Int_Error;
    switch (e) {
    case parse: return u8"The given string is not a number in the requested base.";
    case overflow: return u8"The result is too large to be represented.";
    case division_by_zero: return u8"Division by zero.";
    case domain: return u8"An argument is outside the domain of the operation.";
    case random_source: return u8"Random bytes could not be obtained.";
    }
    MPINT_ASSERT_UNREACHABLE(u8"Invalid error.");
}

} // namespace mpint

#endif
