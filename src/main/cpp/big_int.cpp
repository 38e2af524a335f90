#include <algorithm>
#include <charconv>
#include <cstddef>
#include <limits>
#include <span>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "mpint/util/assert.hpp"
#include "mpint/util/charconv.hpp"
#include "mpint/util/chars.hpp"
#include "mpint/util/math.hpp"
#include "mpint/util/result.hpp"

#include "mpint/big_int.hpp"
#include "mpint/big_int_error.hpp"
#include "mpint/settings.hpp"

namespace mpint {
namespace {

/// @brief The greatest `n` for which `n!` is representable as `Int128`.
constexpr Int64 max_small_factorial = 33;

[[nodiscard]]
constexpr Uint128 magnitude(const Int128 x) noexcept
{
    return x < 0 ? -Uint128(x) : Uint128(x);
}

[[nodiscard]]
std::size_t length_of_digits(const std::string_view str, const int base)
{
    const auto it = std::ranges::find_if_not(str, [&](const char c) {
        return is_ascii_digit_base(char8_t(c), base);
    });
    return std::size_t(it - str.begin());
}

[[nodiscard]]
bool starts_with_prefix(const std::string_view str, const char lower_letter)
{
    return str.size() >= 2 && str[0] == '0' && to_ascii_lower(char8_t(str[1])) == lower_letter;
}

/// @brief Detects the base of a digit sequence from its prefix,
/// and removes that prefix from `digits`.
[[nodiscard]]
int detect_base(std::string_view& digits)
{
    if (starts_with_prefix(digits, u8'x')) {
        digits.remove_prefix(2);
        return 16;
    }
    if (starts_with_prefix(digits, u8'b')) {
        digits.remove_prefix(2);
        return 2;
    }
    if (digits.size() > 1 && digits[0] == '0') {
        digits.remove_prefix(1);
        return 8;
    }
    return 10;
}

/// @brief Returns `x` as a big-endian sequence of bytes, without leading zeros.
[[nodiscard]]
std::vector<std::byte> u128_to_bytes(Uint128 x)
{
    std::vector<std::byte> result;
    while (x != 0) {
        result.push_back(std::byte(x & 0xff));
        x >>= 8;
    }
    std::ranges::reverse(result);
    return result;
}

[[nodiscard]]
Div_Result<Big_Int, Big_Int> div_rem_small(const Int128 x, const Int128 y, Div_Rounding rounding)
{
    MPINT_DEBUG_ASSERT(y != 0);
    MPINT_DEBUG_ASSERT(x != std::numeric_limits<Int128>::min() || y != -1);

    switch (rounding) {
    case Div_Rounding::to_zero: {
        const auto [q, r] = div_rem_to_zero(x, y);
        return { Big_Int { q }, Big_Int { r } };
    }
    case Div_Rounding::to_pos_inf: {
        const auto [q, r] = div_rem_to_pos_inf(x, y);
        return { Big_Int { q }, Big_Int { r } };
    }
    case Div_Rounding::to_neg_inf: {
        const auto [q, r] = div_rem_to_neg_inf(x, y);
        return { Big_Int { q }, Big_Int { r } };
    }
    }
    MPINT_ASSERT_UNREACHABLE(u8"Invalid rounding.");
}

} // namespace

// CONSTRUCTION ====================================================================================

Result<Big_Int, Big_Int_Error> Big_Int::from(std::string_view value, int base)
{
    if (base != 0 && (base < 2 || base > 36)) {
        return Big_Int_Error::domain;
    }

    const bool negative = value.starts_with('-');
    if (negative) {
        value.remove_prefix(1);
    }

    if (base == 0) {
        base = detect_base(value);
    }
    else if (base == 16 && starts_with_prefix(value, u8'x')) {
        value.remove_prefix(2);
    }
    else if (base == 2 && starts_with_prefix(value, u8'b')) {
        value.remove_prefix(2);
    }

    if (value.empty() || length_of_digits(value, base) != value.size()) {
        return Big_Int_Error::parse;
    }

    Big_Int result;
    const std::from_chars_result r = from_characters(value, result, base);
    MPINT_ASSERT(r.ec == std::errc {});
    MPINT_ASSERT(r.ptr == value.data() + value.size());

    return negative ? result.negate() : result;
}

Big_Int Big_Int::from_buffer(const std::span<const std::byte> buffer, const bool reverse)
{
    std::vector<std::byte> reversed;
    std::span<const std::byte> big_endian = buffer;
    if (reverse) {
        reversed.assign(buffer.rbegin(), buffer.rend());
        big_endian = reversed;
    }

    const auto first_nonzero = std::ranges::find_if(big_endian, [](const std::byte b) {
        return b != std::byte {};
    });
    big_endian = big_endian.subspan(std::size_t(first_nonzero - big_endian.begin()));

    if (big_endian.size() > sizeof(Uint128)) {
        return detail::big_int_from_bytes(big_endian);
    }
    Uint128 result = 0;
    for (const std::byte b : big_endian) {
        result <<= 8;
        result |= Uint128(b);
    }
    return Big_Int(result);
}

Result<Big_Int, Big_Int_Error> Big_Int::factorial(const Int64 n)
{
    if (n < 0) {
        return Big_Int_Error::domain;
    }
    if (n <= max_small_factorial) {
        Int128 result = 1;
        for (Int64 i = 2; i <= n; ++i) {
            result *= i;
        }
        return Big_Int { result };
    }
    return detail::big_int_factorial(Uint64(n));
}

// CONVERSION ======================================================================================

std::vector<std::byte> Big_Int::to_buffer(const bool reverse) const
{
    std::vector<std::byte> result
        = is_small() ? u128_to_bytes(magnitude(m_small)) : detail::big_int_to_bytes(*this);
    if (reverse) {
        std::ranges::reverse(result);
    }
    return result;
}

void Big_Int::print_to(
    const Function_Ref<void(std::string_view)> out,
    const int base,
    const bool to_upper
) const
{
    MPINT_ASSERT(base >= 2 && base <= 36);
    if (is_small()) {
        const Int128_Characters result = to_characters(m_small, base, to_upper);
        out(result.as_string());
        return;
    }
    constexpr int minus_sign_width = 1;
    const auto pessimistic_digit_count
        = std::size_t(detail::big_int_ones_width(*this) + minus_sign_width);

    if (pessimistic_digit_count <= big_int_print_buffer_size) {
        char buffer[big_int_print_buffer_size];
        const std::size_t length = detail::big_int_to_string(
            buffer, big_int_print_buffer_size, *this, base, to_upper
        );
        MPINT_ASSERT(length);
        out(std::string_view { buffer, length });
        return;
    }

    std::vector<char> text(pessimistic_digit_count);
    const std::size_t length
        = detail::big_int_to_string(text.data(), text.size(), *this, base, to_upper);
    MPINT_ASSERT(length);
    out(std::string_view { text.data(), length });
}

std::from_chars_result from_characters(const std::string_view digits, Big_Int& out, const int base)
{
    MPINT_ASSERT(base >= 2 && base <= 36);

    Int128 i128;
    const std::from_chars_result result
        = from_chars128(digits.data(), digits.data() + digits.size(), i128, base);
    if (result.ec == std::errc {}) {
        out = Big_Int { i128 };
        return result;
    }
    if (result.ec == std::errc::invalid_argument) {
        return result;
    }
    MPINT_ASSERT(result.ec == std::errc::result_out_of_range);

    const std::size_t sign_length = digits.starts_with('-') ? 1 : 0;
    const std::size_t valid_length
        = sign_length + length_of_digits(digits.substr(sign_length), base);
    MPINT_ASSERT(valid_length > sign_length);

    out = detail::big_int_from_digits(digits.substr(0, valid_length), base);
    return { digits.data() + valid_length, std::errc {} };
}

// ARITHMETIC ======================================================================================

Result<Div_Result<Big_Int, Big_Int>, Big_Int_Error>
Big_Int::div_rem(const Big_Int& rhs, const Div_Rounding rounding) const
{
    if (rhs.is_zero()) {
        return Big_Int_Error::division_by_zero;
    }
    if (is_small() && rhs.is_small()) {
        // Int128 min / -1 is the only small division whose quotient is not small.
        const bool quotient_overflow
            = m_small == std::numeric_limits<Int128>::min() && rhs.m_small == -1;
        if (!quotient_overflow) [[likely]] {
            return div_rem_small(m_small, rhs.m_small, rounding);
        }
    }
    // While we normally avoid spilling small values into engine integers,
    // division in particular is so expensive that the relative cost is lower.
    return detail::big_int_div_rem(*this, rhs, rounding);
}

Result<Big_Int, Big_Int_Error> Big_Int::div_q(const Big_Int& rhs, const Div_Rounding rounding) const
{
    Result<Div_Result<Big_Int, Big_Int>, Big_Int_Error> result = div_rem(rhs, rounding);
    if (!result) {
        return result.error();
    }
    return std::move(result->quotient);
}

Result<Big_Int, Big_Int_Error> Big_Int::div_r(const Big_Int& rhs, const Div_Rounding rounding) const
{
    if (rhs.is_zero()) {
        return Big_Int_Error::division_by_zero;
    }
    if (is_small() && rhs.is_small() && rhs.m_small == -1) {
        return zero();
    }
    Result<Div_Result<Big_Int, Big_Int>, Big_Int_Error> result = div_rem(rhs, rounding);
    if (!result) {
        return result.error();
    }
    return std::move(result->remainder);
}

Result<Big_Int, Big_Int_Error> Big_Int::mod(const Big_Int& rhs) const
{
    if (rhs.is_zero()) {
        return Big_Int_Error::division_by_zero;
    }
    if (is_small() && rhs.is_small()) {
        if (rhs.m_small == 1 || rhs.m_small == -1) {
            return zero();
        }
        return Big_Int { mod_euclidean(m_small, rhs.m_small) };
    }
    return detail::big_int_mod(*this, rhs);
}

Result<Big_Int, Big_Int_Error> Big_Int::pow(const Big_Int& exponent) const
{
    const int exponent_sign = exponent.get_signum();
    if (exponent_sign < 0) {
        return Big_Int_Error::domain;
    }
    if (exponent_sign == 0) {
        return one();
    }
    if (is_small()) {
        if (m_small == 0 || m_small == 1) {
            return *this;
        }
        if (m_small == -1) {
            const bool exponent_odd = exponent.as_i128().value & 1;
            return exponent_odd ? *this : one();
        }
    }
    const auto [exponent_i64, lossy] = exponent.as_i64();
    if (lossy || exponent_i64 > std::numeric_limits<Uint32>::max()) {
        return Big_Int_Error::overflow;
    }
    return detail::big_int_pow(*this, Uint32(exponent_i64));
}

Result<Big_Int, Big_Int_Error>
Big_Int::pow_mod(const Big_Int& exponent, const Big_Int& modulus) const
{
    if (modulus.get_signum() <= 0) {
        return Big_Int_Error::domain;
    }
    if (modulus == 1) {
        return zero();
    }
    return detail::big_int_pow_mod(*this, exponent, modulus);
}

Result<Big_Int, Big_Int_Error> Big_Int::sqrt() const
{
    const int sign = get_signum();
    if (sign < 0) {
        return Big_Int_Error::domain;
    }
    if (is_small() && m_small <= 1) {
        return *this;
    }
    return detail::big_int_sqrt(*this);
}

Big_Int Big_Int::gcd(const Big_Int& rhs) const
{
    if (is_small() && rhs.is_small()) {
        Uint128 a = magnitude(m_small);
        Uint128 b = magnitude(rhs.m_small);
        while (b != 0) {
            a = std::exchange(b, a % b);
        }
        return Big_Int(a);
    }
    return detail::big_int_gcd(*this, rhs);
}

} // namespace mpint
