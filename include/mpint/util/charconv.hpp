#ifndef MPINT_CHARCONV_HPP
#define MPINT_CHARCONV_HPP

#include <array>
#include <charconv>
#include <cstddef>
#include <limits>
#include <string_view>
#include <system_error>

#include "mpint/util/assert.hpp"
#include "mpint/util/chars.hpp"

#include "mpint/settings.hpp"

namespace mpint {

// PARSING =====================================================================

/// @brief Implements the interface of `std::from_chars` for 128-bit integers.
/// In the "happy case" of having at most 19 decimal digits,
/// this simply calls `std::from_chars` for 64-bit integers.
/// In the worst case, three such 64-bit calls are needed,
/// handling 19 digits at a time, with 39 decimal digits being the maximum for 128-bit.
[[nodiscard]]
std::from_chars_result
from_chars128(const char* first, const char* last, Uint128& out, int base = 10);

[[nodiscard]]
std::from_chars_result
from_chars128(const char* first, const char* last, Int128& out, int base = 10);

// PRINTING ====================================================================

/// @brief Implements the interface of `std::to_chars` for 128-bit integers in any base.
[[nodiscard]]
std::to_chars_result to_chars128(char* first, char* last, Uint128 x, int base = 10);

[[nodiscard]]
std::to_chars_result to_chars128(char* first, char* last, Int128 x, int base = 10);

/// @brief A fixed-capacity buffer holding the digits of a 128-bit integer.
/// Every 128-bit integer fits, in any base, including a minus sign.
struct Int128_Characters {
    static constexpr std::size_t capacity = 128 + 1;

    std::array<char, capacity> chars;
    std::size_t length;

    [[nodiscard]]
    std::string_view as_string() const noexcept
    {
        return { chars.data(), length };
    }
};

/// @brief Converts `x` to a sequence of digits in the given `base`.
/// @param to_upper If `true`, digits for base 11 or greater are printed in uppercase.
[[nodiscard]]
inline Int128_Characters to_characters(Int128 x, int base = 10, bool to_upper = false)
{
    MPINT_ASSERT(base >= 2 && base <= 36);

    Int128_Characters result {};
    char* const buffer_start = result.chars.data();
    const std::to_chars_result r
        = to_chars128(buffer_start, buffer_start + result.chars.size(), x, base);
    MPINT_ASSERT(r.ec == std::errc {});
    result.length = std::size_t(r.ptr - buffer_start);
    if (to_upper && base > 10) {
        for (std::size_t i = 0; i < result.length; ++i) {
            result.chars[i] = char(to_ascii_upper(char8_t(result.chars[i])));
        }
    }
    return result;
}

} // namespace mpint

#endif
