#include <algorithm>
#include <bit>
#include <charconv>
#include <cstddef>
#include <cstring>
#include <ios>
#include <iterator>
#include <memory>
#include <new>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include "mpint/util/assert.hpp"
#include "mpint/util/chars.hpp"
#include "mpint/util/math.hpp"
#include "mpint/util/result.hpp"

#include "mpint/big_int.hpp"
#include "mpint/big_int_error.hpp"
#include "mpint/settings.hpp"

namespace mpint {

using boost::multiprecision::cpp_int;

namespace detail {

static_assert(sizeof(detail::Big_Int_Backend) == sizeof(cpp_int));
static_assert(alignof(detail::Big_Int_Backend) == alignof(cpp_int));

auto& Big_Int_Backend::get()
{
    return *std::launder(reinterpret_cast<cpp_int*>(m_storage));
}

const auto& Big_Int_Backend::get() const
{
    return *std::launder(reinterpret_cast<const cpp_int*>(m_storage));
}

Big_Int_Backend::Big_Int_Backend()
{
    new (m_storage) cpp_int {};
}

Big_Int_Backend::~Big_Int_Backend()
{
    get().~cpp_int();
}

} // namespace detail

namespace {

/// @brief Returns the engine integer of `x` if `x` is big.
/// Otherwise, assigns the value of `x` to `storage` and returns `storage`.
[[nodiscard]]
const cpp_int& access_or_upload(const Big_Int& x, cpp_int& storage)
{
    if (const detail::Big_Int_Backend* const backend = x.get_backend()) {
        return backend->get();
    }
    storage = x.as_i128().value;
    return storage;
}

/// @brief Returns the amount of bits needed to represent `x` in two's complement,
/// including the sign bit.
[[nodiscard]]
int twos_width(const cpp_int& x)
{
    const int sign = x.sign();
    if (sign == 0) [[unlikely]] {
        return 1;
    }
    if (sign > 0) {
        return int(msb(x)) + 2;
    }
    // For negative x, the width is that of ~x, which equals -x - 1.
    const cpp_int complement = -x - 1;
    return complement.is_zero() ? 1 : int(msb(complement)) + 2;
}

/// @brief Converts `x` into a `Big_Int`.
/// An engine integer is allocated only if `x` is not representable as `Int128`,
/// so that all results are in canonical form.
[[nodiscard]]
Big_Int yield_result(cpp_int x)
{
    if (twos_width(x) <= 128) {
        return Big_Int { Int128(x) };
    }
    auto backend = std::make_shared<detail::Big_Int_Backend>();
    backend->get() = std::move(x);
    return Big_Int::from_backend(std::move(backend));
}

[[nodiscard]]
Div_Result<cpp_int> div_rem_to_zero(const cpp_int& x, const cpp_int& y)
{
    MPINT_ASSERT(!y.is_zero());
    Div_Result<cpp_int> result;
    divide_qr(x, y, result.quotient, result.remainder);
    return result;
}

[[nodiscard]]
Div_Result<cpp_int> div_rem_to_pos_inf(const cpp_int& x, const cpp_int& y)
{
    auto result = div_rem_to_zero(x, y);
    const bool quotient_positive = (x.sign() ^ y.sign()) >= 0;
    if (quotient_positive && !result.remainder.is_zero()) {
        ++result.quotient;
        result.remainder -= y;
    }
    return result;
}

[[nodiscard]]
Div_Result<cpp_int> div_rem_to_neg_inf(const cpp_int& x, const cpp_int& y)
{
    auto result = div_rem_to_zero(x, y);
    const bool quotient_negative = (x.sign() ^ y.sign()) < 0;
    if (quotient_negative && !result.remainder.is_zero()) {
        --result.quotient;
        result.remainder += y;
    }
    return result;
}

/// @brief Returns `x` modulo `|y|`, in range `[0, |y|)`.
[[nodiscard]]
cpp_int mod_euclidean(const cpp_int& x, const cpp_int& y)
{
    MPINT_ASSERT(!y.is_zero());
    cpp_int result = x % y;
    if (result.sign() < 0) {
        result += abs(y);
    }
    return result;
}

/// @brief Returns the inverse of `x` modulo `m`, if any.
/// `m` shall be greater than one.
[[nodiscard]]
std::optional<cpp_int> mod_inverse(const cpp_int& x, const cpp_int& m)
{
    cpp_int old_r = mod_euclidean(x, m);
    cpp_int r = m;
    cpp_int old_s = 1;
    cpp_int s = 0;
    while (!r.is_zero()) {
        const cpp_int q = old_r / r;
        old_r = std::exchange(r, cpp_int(old_r - q * r));
        old_s = std::exchange(s, cpp_int(old_s - q * s));
    }
    if (old_r != 1) {
        return {};
    }
    return mod_euclidean(old_s, m);
}

/// @brief Returns the product of all integers in `[first, last]`.
/// Splitting the range in halves keeps the operands of each multiplication
/// similar in size, which is much faster than multiplying sequentially.
[[nodiscard]]
cpp_int product_of_range(const Uint64 first, const Uint64 last)
{
    constexpr Uint64 sequential_threshold = 16;
    if (last - first < sequential_threshold) {
        cpp_int result = 1;
        for (Uint64 i = first; i <= last; ++i) {
            result *= i;
        }
        return result;
    }
    const Uint64 middle = first + (last - first) / 2;
    return product_of_range(first, middle) * product_of_range(middle + 1, last);
}

} // namespace

namespace detail {

Big_Int big_int_from_u128(const Uint128 x)
{
    cpp_int result = x;
    return yield_result(std::move(result));
}

Big_Int big_int_from_digits(const std::string_view digits, const int base)
{
    MPINT_ASSERT(base >= 2 && base <= 36);

    const bool negative = digits.starts_with('-');
    const std::string_view magnitude = negative ? digits.substr(1) : digits;
    MPINT_ASSERT(!magnitude.empty());

    cpp_int result;
    if (base == 10) {
        // Boost treats a leading zero as an octal prefix.
        const std::size_t first_nonzero = magnitude.find_first_not_of('0');
        result.assign(
            first_nonzero == std::string_view::npos ? std::string_view { "0" }
                                                    : magnitude.substr(first_nonzero)
        );
    }
    else {
        const int pow_2_shift
            = std::has_single_bit(unsigned(base)) ? std::countr_zero(unsigned(base)) : 0;
        for (const char c : magnitude) {
            const int digit = ascii_digit_value(char8_t(c));
            MPINT_ASSERT(digit >= 0 && digit < base);
            if (pow_2_shift) {
                result <<= pow_2_shift;
                result |= digit;
            }
            else {
                result *= base;
                result += digit;
            }
        }
    }
    if (negative) {
        result = -result;
    }
    return yield_result(std::move(result));
}

Big_Int big_int_from_bytes(const std::span<const std::byte> bytes)
{
    const auto* const first = reinterpret_cast<const unsigned char*>(bytes.data());
    cpp_int result;
    import_bits(result, first, first + bytes.size(), 8);
    return yield_result(std::move(result));
}

std::vector<std::byte> big_int_to_bytes(const Big_Int& x)
{
    cpp_int storage;
    const cpp_int& x_int = access_or_upload(x, storage);
    if (x_int.is_zero()) {
        return {};
    }

    std::vector<unsigned char> chunks;
    export_bits(cpp_int(abs(x_int)), std::back_inserter(chunks), 8);

    const auto first_nonzero = std::ranges::find_if(chunks, [](unsigned char c) { return c != 0; });
    std::vector<std::byte> result;
    result.reserve(std::size_t(chunks.end() - first_nonzero));
    std::transform(first_nonzero, chunks.end(), std::back_inserter(result), [](unsigned char c) {
        return std::byte(c);
    });
    return result;
}

Conversion_Result<Int128> big_int_trunc_i128(const Big_Int& x)
{
    cpp_int storage;
    const cpp_int& x_int = access_or_upload(x, storage);
    const auto result = Int128(Uint128(cpp_int(x_int & ~Uint128(0))));
    return { .value = result, .lossy = result != x_int };
}

int big_int_compare(const Big_Int& x, const Big_Int& y)
{
    cpp_int x_storage;
    cpp_int y_storage;
    const int result = access_or_upload(x, x_storage).compare(access_or_upload(y, y_storage));
    return (result > 0) - (result < 0);
}

int big_int_signum(const Big_Int& x)
{
    cpp_int storage;
    return access_or_upload(x, storage).sign();
}

int big_int_ones_width(const Big_Int& x)
{
    cpp_int storage;
    const cpp_int& x_int = access_or_upload(x, storage);
    const int sign = x_int.sign();
    if (sign == 0) [[unlikely]] {
        return 1;
    }
    return sign > 0 ? int(msb(x_int)) + 2 //
                    : int(msb(cpp_int(abs(x_int)))) + 2;
}

Big_Int big_int_neg(const Big_Int& x)
{
    cpp_int storage;
    return yield_result(-access_or_upload(x, storage));
}

Big_Int big_int_abs(const Big_Int& x)
{
    cpp_int storage;
    const cpp_int& x_int = access_or_upload(x, storage);
    if (x_int.sign() >= 0) {
        return yield_result(x_int);
    }
    return yield_result(-x_int);
}

Big_Int big_int_add(const Big_Int& x, const Big_Int& y)
{
    cpp_int x_storage;
    cpp_int y_storage;
    return yield_result(access_or_upload(x, x_storage) + access_or_upload(y, y_storage));
}

Big_Int big_int_sub(const Big_Int& x, const Big_Int& y)
{
    cpp_int x_storage;
    cpp_int y_storage;
    return yield_result(access_or_upload(x, x_storage) - access_or_upload(y, y_storage));
}

Big_Int big_int_mul(const Big_Int& x, const Big_Int& y)
{
    cpp_int x_storage;
    cpp_int y_storage;
    return yield_result(access_or_upload(x, x_storage) * access_or_upload(y, y_storage));
}

Div_Result<Big_Int, Big_Int>
big_int_div_rem(const Big_Int& x, const Big_Int& y, const Div_Rounding rounding)
{
    cpp_int x_storage;
    cpp_int y_storage;
    const cpp_int& x_int = access_or_upload(x, x_storage);
    const cpp_int& y_int = access_or_upload(y, y_storage);
    MPINT_ASSERT(!y_int.is_zero());

    auto div_result = [&] -> Div_Result<cpp_int> {
        switch (rounding) {
        case Div_Rounding::to_zero: {
            return div_rem_to_zero(x_int, y_int);
        }
        case Div_Rounding::to_pos_inf: {
            return div_rem_to_pos_inf(x_int, y_int);
        }
        case Div_Rounding::to_neg_inf: {
            return div_rem_to_neg_inf(x_int, y_int);
        }
        }
        MPINT_ASSERT_UNREACHABLE(u8"Invalid rounding.");
    }();

    return {
        .quotient = yield_result(std::move(div_result.quotient)),
        .remainder = yield_result(std::move(div_result.remainder)),
    };
}

Big_Int big_int_mod(const Big_Int& x, const Big_Int& y)
{
    cpp_int x_storage;
    cpp_int y_storage;
    const cpp_int& x_int = access_or_upload(x, x_storage);
    const cpp_int& y_int = access_or_upload(y, y_storage);
    return yield_result(mod_euclidean(x_int, y_int));
}

Big_Int big_int_pow(const Big_Int& x, const Uint32 y)
{
    cpp_int storage;
    return yield_result(pow(access_or_upload(x, storage), unsigned(y)));
}

Result<Big_Int, Big_Int_Error> big_int_pow_mod(const Big_Int& x, const Big_Int& y, const Big_Int& m)
{
    cpp_int x_storage;
    cpp_int y_storage;
    cpp_int m_storage;
    const cpp_int& x_int = access_or_upload(x, x_storage);
    const cpp_int& y_int = access_or_upload(y, y_storage);
    const cpp_int& m_int = access_or_upload(m, m_storage);
    MPINT_ASSERT(m_int.sign() > 0);

    if (m_int == 1) {
        return Big_Int {};
    }
    cpp_int base = mod_euclidean(x_int, m_int);
    if (y_int.sign() < 0) {
        std::optional<cpp_int> inverse = mod_inverse(base, m_int);
        if (!inverse) {
            return Big_Int_Error::domain;
        }
        base = std::move(*inverse);
    }
    return yield_result(powm(base, cpp_int(abs(y_int)), m_int));
}

Big_Int big_int_sqrt(const Big_Int& x)
{
    cpp_int storage;
    const cpp_int& x_int = access_or_upload(x, storage);
    MPINT_ASSERT(x_int.sign() >= 0);
    return yield_result(sqrt(x_int));
}

Big_Int big_int_gcd(const Big_Int& x, const Big_Int& y)
{
    cpp_int x_storage;
    cpp_int y_storage;
    const cpp_int x_abs = abs(access_or_upload(x, x_storage));
    const cpp_int y_abs = abs(access_or_upload(y, y_storage));
    return yield_result(gcd(x_abs, y_abs));
}

Big_Int big_int_factorial(const Uint64 n)
{
    if (n < 2) {
        return Big_Int { 1 };
    }
    return yield_result(product_of_range(2, n));
}

std::size_t big_int_to_string(
    char* const buffer,
    const std::size_t size,
    const Big_Int& x,
    const int base,
    const bool to_upper
)
{
    if (buffer == nullptr || size == 0 || base < 2 || base > 36) {
        return 0;
    }

    cpp_int storage;
    const cpp_int& x_int = access_or_upload(x, storage);
    std::string result;
    const int sign = x_int.sign();
    if (sign == 0) {
        result = "0";
    }
    else {
        switch (base) {
        case 2: {
            constexpr auto append_digits = [](std::string& out, const cpp_int& magnitude) {
                const auto limit = int(msb(magnitude));
                out.reserve(out.size() + std::size_t(limit) + 1);
                for (int b = limit; b >= 0; --b) {
                    out += bit_test(magnitude, unsigned(b)) ? '1' : '0';
                }
            };
            if (sign < 0) {
                result += '-';
                append_digits(result, cpp_int(abs(x_int)));
            }
            else {
                append_digits(result, x_int);
            }
            break;
        }
        case 10: {
            result = x_int.str();
            break;
        }
        case 8:
        case 16: {
            // Boost does not support printing negative octal and hex numbers,
            // so we negate ourselves.
            auto flags = base == 16 ? std::ios_base::hex : std::ios_base::oct;
            if (to_upper) {
                flags |= std::ios_base::uppercase;
            }
            if (sign < 0) {
                result += '-';
                result += cpp_int(abs(x_int)).str(0, flags);
            }
            else {
                result += x_int.str(0, flags);
            }
            break;
        }
        default: {
            cpp_int quotient;
            cpp_int remainder;
            cpp_int temp = abs(x_int);
            const cpp_int cpp_base { base };
            while (!temp.is_zero()) {
                divide_qr(temp, cpp_base, quotient, remainder);
                temp = quotient;
                char digit[2] {};
                const auto int_remainder = remainder.convert_to<int>();
                const auto [p, ec] = std::to_chars(digit, std::end(digit), int_remainder, base);
                MPINT_ASSERT(ec == std::errc {});
                result += std::string_view { digit, p };
            }
            if (sign < 0) {
                result += '-';
            }
            std::ranges::reverse(result);
            if (to_upper) {
                for (char& c : result) {
                    c = char(to_ascii_upper(char8_t(c)));
                }
            }
            break;
        }
        }
    }
    if (result.size() > size) {
        return 0;
    }
    std::memcpy(buffer, result.data(), result.size());
    // Ensure null termination if there is sufficient space.
    if (size > result.size()) {
        buffer[result.size()] = 0;
    }
    return result.size();
}

} // namespace detail

} // namespace mpint
