#include <algorithm>
#include <array>
#include <bit>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

#include "mpint/util/assert.hpp"
#include "mpint/util/charconv.hpp"
#include "mpint/util/chars.hpp"
#include "mpint/util/math.hpp"

#include "mpint/settings.hpp"

namespace mpint {
namespace {

consteval int u64_max_input_digits_naive(int base)
{
    MPINT_ASSERT(base >= 2);

    const auto max = Int128(1) << 64;
    Int128 x = 1;
    int result = 0;
    while (x <= max) {
        x *= unsigned(base);
        ++result;
        if (x == 0) {
            break;
        }
    }
    return result - 1;
}

/// @brief Returns the amount of digits that `std::uint64_t` can represent
/// in the given base.
/// Mathematically, this is `floor(log(pow(2, 64)) / log(base))`.
constexpr int u64_max_input_digits(int base)
{
    MPINT_DEBUG_ASSERT(base >= 2);
    MPINT_DEBUG_ASSERT(base <= 36);

    static constexpr auto table = [] consteval {
        std::array<signed char, 37> result {};
        for (std::size_t i = 2; i < result.size(); ++i) {
            result[i] = static_cast<signed char>(u64_max_input_digits_naive(int(i)));
        }
        return result;
    }();
    return table[std::size_t(base)];
}

[[nodiscard]]
consteval std::uint64_t u64_pow_naive(std::uint64_t x, int y)
{
    std::uint64_t result = 1;
    for (int i = 0; i < y; ++i) {
        result *= x;
    }
    return result;
}

/// @brief Returns the greatest power of `base` representable in `std::uint64_t`,
/// or zero if the next greater power is exactly `pow(2, 64)`.
///
/// A result of zero essentially communicates that no bit of `std::uint64_t` is wasted,
/// such as in the base-2 or base-16 case.
[[nodiscard]]
constexpr std::uint64_t u64_max_power(int base)
{
    MPINT_DEBUG_ASSERT(base >= 2);
    MPINT_DEBUG_ASSERT(base <= 36);

    static constexpr auto table = [] consteval {
        std::array<std::uint64_t, 37> result {};
        for (std::size_t i = 2; i < result.size(); ++i) {
            const int max_exponent = u64_max_input_digits(int(i));
            result[i] = u64_pow_naive(i, max_exponent);
        }
        return result;
    }();
    return table[std::size_t(base)];
}

static_assert(u64_max_input_digits_naive(2) == 64);
static_assert(u64_max_input_digits(2) == 64);
static_assert(u64_max_input_digits_naive(8) == 21);
static_assert(u64_max_input_digits(8) == 21);
static_assert(u64_max_input_digits_naive(10) == 19);
static_assert(u64_max_input_digits(10) == 19);
static_assert(u64_max_input_digits_naive(16) == 16);
static_assert(u64_max_input_digits(16) == 16);
static_assert(u64_max_input_digits(36) == 12);

static_assert(u64_max_power(2) == 0);
static_assert(u64_max_power(8) == 0x8000000000000000ull);
static_assert(u64_max_power(10) == 10000000000000000000ull);
static_assert(u64_max_power(16) == 0);

/// @brief Returns the end of the longest prefix of `[first, last)`
/// which consists of digits in the given `base`.
[[nodiscard]]
const char* find_digits_end(const char* first, const char* const last, const int base)
{
    while (first != last && is_ascii_digit_base(char8_t(*first), base)) {
        ++first;
    }
    return first;
}

} // namespace

std::from_chars_result
from_chars128(const char* const first, const char* const last, Uint128& out, const int base)
{
    MPINT_ASSERT(base >= 2);
    MPINT_ASSERT(base <= 36);
    MPINT_DEBUG_ASSERT(first);
    MPINT_DEBUG_ASSERT(last);

    // Only the leading digit sequence is consumed, like std::from_chars.
    // Lexing it up front means that every piece handed to std::from_chars below
    // consists entirely of valid digits.
    const char* const digits_end = find_digits_end(first, last, base);
    if (digits_end == first) {
        return { first, std::errc::invalid_argument };
    }

    Uint128 result = 0;
    const char* current_last = digits_end;

    const std::uint64_t max_pow = u64_max_power(base);
    const std::ptrdiff_t max_lower_length = u64_max_input_digits(base);
    const bool is_pow_2 = (base & (base - 1)) == 0;
    MPINT_DEBUG_ASSERT(max_pow != 0 || is_pow_2);

    if (is_pow_2) {
        const int bits_per_iteration
            = max_pow == 0 ? 64 : std::countr_zero(max_pow);
        int shift = 0;

        while (true) {
            const auto lower_length = std::min(current_last - first, max_lower_length);
            const char* const current_first = current_last - lower_length;

            std::uint64_t digits {};
            const std::from_chars_result partial_result
                = std::from_chars(current_first, current_last, digits, base);
            MPINT_ASSERT(partial_result.ec == std::errc {});

            if (digits != 0) {
                const int added_digits = 64 - std::countl_zero(digits);
                if (shift + added_digits > 128) {
                    return { digits_end, std::errc::result_out_of_range };
                }
                result |= Uint128(digits) << shift;
            }
            shift += bits_per_iteration;

            if (current_last - first <= max_lower_length) {
                out = result;
                return { digits_end, std::errc {} };
            }
            current_last -= lower_length;
            MPINT_DEBUG_ASSERT(current_last >= first);
        }
    }

    Uint128 factor = 1;
    bool factor_overflow = false;

    while (true) {
        const auto lower_length = std::min(current_last - first, max_lower_length);
        const char* const current_first = current_last - lower_length;

        std::uint64_t digits {};
        const std::from_chars_result partial_result
            = std::from_chars(current_first, current_last, digits, base);
        MPINT_ASSERT(partial_result.ec == std::errc {});

        if (digits != 0) {
            Uint128 summand;
            if (factor_overflow || mul_overflow(summand, factor, Uint128(digits))) {
                return { digits_end, std::errc::result_out_of_range };
            }
            if (add_overflow(result, result, summand)) {
                return { digits_end, std::errc::result_out_of_range };
            }
        }

        if (current_last - first <= max_lower_length) {
            out = result;
            return { digits_end, std::errc {} };
        }
        factor_overflow = factor_overflow || mul_overflow(factor, factor, Uint128(max_pow));
        current_last -= lower_length;
        MPINT_DEBUG_ASSERT(current_last >= first);
    }
}

std::from_chars_result
from_chars128(const char* const first, const char* const last, Int128& out, const int base)
{
    MPINT_DEBUG_ASSERT(first);
    MPINT_DEBUG_ASSERT(last);

    if (first == last) {
        return { first, std::errc::invalid_argument };
    }

    if (*first != '-') {
        Uint128 x {};
        const std::from_chars_result result = from_chars128(first, last, x, base);
        if (result.ec != std::errc {}) {
            return result;
        }
        if (x >> 127) {
            return { result.ptr, std::errc::result_out_of_range };
        }
        out = Int128(x);
        return result;
    }

    constexpr auto max_u128 = Uint128 { 1 } << 127;
    Uint128 x {};
    const std::from_chars_result result = from_chars128(first + 1, last, x, base);
    if (result.ec == std::errc::invalid_argument) {
        return { first, std::errc::invalid_argument };
    }
    if (result.ec != std::errc {}) {
        return result;
    }
    if (x > max_u128) {
        return { result.ptr, std::errc::result_out_of_range };
    }
    out = Int128(-x);
    return result;
}

std::to_chars_result to_chars128(char* const first, char* const last, const Uint128 x, int base)
{
    MPINT_DEBUG_ASSERT(first);
    MPINT_DEBUG_ASSERT(last);
    MPINT_DEBUG_ASSERT(base >= 2 && base <= 36);

    if (x <= std::uint64_t(-1)) {
        return std::to_chars(first, last, std::uint64_t(x), base);
    }
    if (first == last) {
        return { last, std::errc::value_too_large };
    }

    const std::uint64_t max_pow = u64_max_power(base);
    const bool is_pow_2 = (base & (base - 1)) == 0;
    const int piece_max_digits = u64_max_input_digits(base);

    if (is_pow_2) {
        // Digits are extracted from the least significant end, so they are produced
        // in reverse into a scratch buffer first.
        const int bits_per_digit = std::countr_zero(unsigned(base));
        const auto digit_mask = Uint128(base - 1);
        constexpr std::string_view digit_chars = "0123456789abcdefghijklmnopqrstuvwxyz";

        char reversed[128];
        std::size_t length = 0;
        for (Uint128 rest = x; rest != 0; rest >>= bits_per_digit) {
            reversed[length++] = digit_chars[std::size_t(rest & digit_mask)];
        }
        if (std::size_t(last - first) < length) {
            return { last, std::errc::value_too_large };
        }
        std::reverse_copy(reversed, reversed + length, first);
        return { first + length, std::errc {} };
    }

    const std::to_chars_result upper_result = to_chars128(first, last, x / max_pow, base);
    if (upper_result.ec != std::errc {}) {
        return upper_result;
    }

    const std::to_chars_result lower_result
        = std::to_chars(upper_result.ptr, last, std::uint64_t(x % max_pow), base);
    if (lower_result.ec != std::errc {}) {
        return lower_result;
    }
    const auto lower_length = lower_result.ptr - upper_result.ptr;
    if (last - upper_result.ptr < piece_max_digits) {
        return { last, std::errc::value_too_large };
    }

    // The remainder (lower part) is mathematically exactly piece_max_digits long,
    // and we have to zero-pad to the left if it is shorter
    // (because std::to_chars wouldn't give us the leading zeros we need).
    char* const result_end = upper_result.ptr + piece_max_digits;
    std::copy_backward(upper_result.ptr, upper_result.ptr + lower_length, result_end);
    std::fill_n(upper_result.ptr, piece_max_digits - lower_length, '0');

    return { result_end, std::errc {} };
}

std::to_chars_result to_chars128(char* const first, char* const last, const Int128 x, int base)
{
    MPINT_DEBUG_ASSERT(base >= 2 && base <= 36);

    if (x >= 0) {
        return to_chars128(first, last, Uint128(x), base);
    }
    if (x == std::int64_t(x)) {
        return std::to_chars(first, last, std::int64_t(x), base);
    }
    if (last - first < 2) {
        return { last, std::errc::value_too_large };
    }
    *first = '-';
    return to_chars128(first + 1, last, -Uint128(x), base);
}

} // namespace mpint
