#ifndef MPINT_CHARS_HPP
#define MPINT_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"

namespace mpint {

using ulight::to_ascii_lower;
using ulight::to_ascii_upper;

/// @brief Returns the value of `c` when interpreted as a digit in base 36,
/// or `-1` if `c` is not an ASCII alphanumeric character.
/// Upper- and lowercase letters are treated alike.
[[nodiscard]]
constexpr int ascii_digit_value(char8_t c) noexcept
{
    if (c >= u8'0' && c <= u8'9') {
        return c - u8'0';
    }
    const char8_t lower = to_ascii_lower(c);
    if (lower >= u8'a' && lower <= u8'z') {
        return lower - u8'a' + 10;
    }
    return -1;
}

/// @brief Returns `true` if `c` is a valid digit in the given `base`.
/// For example, `is_ascii_digit_base(u8'f', 16)` is `true`,
/// but `is_ascii_digit_base(u8'8', 8)` is `false`.
/// @param base The base, in range `[2, 36]`.
[[nodiscard]]
constexpr bool is_ascii_digit_base(char8_t c, int base) noexcept
{
    const int value = ascii_digit_value(c);
    return value >= 0 && value < base;
}

} // namespace mpint

#endif
